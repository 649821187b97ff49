#include "cli/Console.hpp"
#include "stats/Formatter.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

using namespace ferry::cli;
using namespace ferry::sync::model;

Console::Console(std::ostream& out, std::istream& in, const bool color)
    : out_(out), in_(in), color_(color) {}

std::string Console::styled(const std::string& s, const fmt::text_style style) const {
    if (!color_) return s;
    return fmt::format(style, "{}", s);
}

void Console::title(const std::string& message) {
    out_ << '\n' << styled(message, fmt::fg(fmt::terminal_color::cyan) | fmt::emphasis::bold) << "\n\n";
}

void Console::section(const std::string& message) {
    out_ << '\n' << styled("›", fmt::fg(fmt::terminal_color::cyan)) << ' ' << message << '\n';
}

void Console::text(const std::string& message) {
    out_ << ' ' << message << '\n';
}

void Console::newLine() {
    out_ << '\n';
}

void Console::block(const std::vector<std::string>& lines, const std::string& prefix) {
    for (const auto& line : lines) out_ << ' ' << prefix << ' ' << line << '\n';
}

void Console::success(const std::vector<std::string>& lines) {
    block(lines, styled("✔", fmt::fg(fmt::terminal_color::green)));
}

void Console::warning(const std::vector<std::string>& lines) {
    block(lines, styled("!", fmt::fg(fmt::terminal_color::yellow)));
}

void Console::note(const std::vector<std::string>& lines) {
    block(lines, styled("•", fmt::fg(fmt::terminal_color::cyan)));
}

void Console::error(const std::vector<std::string>& lines) {
    block(lines, styled("✘", fmt::fg(fmt::terminal_color::red)));
}

void Console::listing(const std::vector<std::string>& items) {
    for (const auto& item : items) out_ << "  * " << item << '\n';
}

void Console::planPreview(const std::vector<PlanEntry>& entries, const size_t limit) {
    if (entries.empty()) {
        success({"No files need to be synchronized."});
        return;
    }

    out_ << '\n' << styled("Total files to sync: " + stats::formatCount(totalFiles(entries)),
                           fmt::fg(fmt::terminal_color::green)) << "\n\n";
    out_ << "Directories and files:\n";

    const auto shown = std::min(limit, entries.size());
    for (size_t i = 0; i < shown; ++i) {
        const auto& e = entries[i];
        if (e.type == PlanEntry::Type::File) {
            out_ << "  • " << e.path << '\n';
        } else if (e.file_count) {
            out_ << "  • " << e.path << "/ "
                 << styled(fmt::format("({} files)", stats::formatCount(*e.file_count)), fmt::fg(fmt::terminal_color::yellow))
                 << '\n';
        } else {
            out_ << "  • " << e.path << "/ " << styled("(partial)", fmt::emphasis::faint) << '\n';
        }
    }

    if (entries.size() > shown) out_ << "  ... and " << entries.size() - shown << " more\n";
    out_ << '\n';
}

bool Console::confirm(const std::string& question, const bool defaultYes) {
    out_ << ' ' << question << (defaultYes ? " [Y/n] " : " [y/N] ") << std::flush;

    std::string answer;
    if (!std::getline(in_, answer)) {
        out_ << '\n';
        return false;
    }

    std::ranges::transform(answer, answer.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    answer.erase(0, answer.find_first_not_of(" \t"));
    answer.erase(answer.find_last_not_of(" \t") + 1);

    if (answer.empty()) return defaultYes;
    return answer == "y" || answer == "yes";
}

#include "stats/Parser.hpp"
#include "logging/LogRegistry.hpp"

#include <charconv>
#include <regex>
#include <string>

using namespace ferry::stats;
using namespace ferry::logging;

namespace {

const std::regex FILES_EXAMINED{R"(Number of files:\s*([\d,]+))", std::regex::icase};
const std::regex FILES_TRANSFERRED{R"(Number of (?:regular )?files transferred:\s*([\d,]+))", std::regex::icase};
const std::regex BYTES_EXAMINED{R"(Total file size:\s*([\d,]+))", std::regex::icase};
const std::regex BYTES_TRANSFERRED{R"(Total transferred file size:\s*([\d,]+))", std::regex::icase};
const std::regex ITEMIZED_LINE{R"(^(?:INFO:)?([^:]+):(\d+):(.+)$)"};

std::optional<uint64_t> toCount(const std::string& digits) {
    std::string clean;
    clean.reserve(digits.size());
    for (const char c : digits)
        if (c != ',') clean += c;
    if (clean.empty()) return std::nullopt;

    uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(clean.data(), clean.data() + clean.size(), value);
    if (ec != std::errc() || ptr != clean.data() + clean.size()) return std::nullopt;
    return value;
}

std::optional<uint64_t> matchCount(const std::regex& re, const std::string& text) {
    std::smatch m;
    if (!std::regex_search(text, m, re)) return std::nullopt;
    return toCount(m[1].str());
}

}

std::optional<TransferStats> ferry::stats::parseStats(const std::string_view output) {
    const std::string text(output);

    TransferStats stats;
    stats.files_examined = matchCount(FILES_EXAMINED, text);
    stats.files_transferred = matchCount(FILES_TRANSFERRED, text);
    stats.bytes_examined = matchCount(BYTES_EXAMINED, text);
    stats.bytes_transferred = matchCount(BYTES_TRANSFERRED, text);

    if (!stats.hasAnyValues()) return std::nullopt;

    if (!stats.consistent()) {
        LogRegistry::stats()->warn("[Parser] Transferred counters exceed examined counters, discarding statistics");
        return std::nullopt;
    }

    return stats;
}

bool ferry::stats::isContentTransfer(const std::string_view code) {
    return code.size() >= 2 && (code[0] == '<' || code[0] == '>') && code[1] == 'f';
}

DryRunSummary ferry::stats::parseDryRunSummary(const std::string_view output) {
    DryRunSummary summary;

    size_t start = 0;
    while (start < output.size()) {
        auto end = output.find('\n', start);
        if (end == std::string_view::npos) end = output.size();

        std::string line(output.substr(start, end - start));
        if (!line.empty() && line.back() == '\r') line.pop_back();
        start = end + 1;

        std::smatch m;
        if (!std::regex_match(line, m, ITEMIZED_LINE)) continue;

        ++summary.items_listed;
        if (!isContentTransfer(m[1].str())) continue;

        const auto size = toCount(m[2].str());
        if (!size) continue;

        ++summary.files;
        summary.bytes += *size;
    }

    LogRegistry::stats()->debug("[Parser] Dry run lists {} items, {} files with content ({} bytes)",
                                summary.items_listed, summary.files, summary.bytes);
    return summary;
}

#include "cmd/quote.hpp"

#include <algorithm>
#include <cctype>

std::string ferry::cmd::shellQuote(const std::string_view arg) {
    std::string out;
    out.reserve(arg.size() + 2);
    out += '\'';
    for (const char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += '\'';
    return out;
}

std::string ferry::cmd::shellWord(const std::string_view arg) {
    const bool bare = !arg.empty() && std::ranges::all_of(arg, [](const char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || std::string_view("_@%+=:,./-").find(c) != std::string_view::npos;
    });
    return bare ? std::string(arg) : shellQuote(arg);
}

std::string ferry::cmd::join(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) out += ' ';
        out += shellWord(w);
    }
    return out;
}

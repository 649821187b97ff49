#include "cli/Parser.hpp"

#include <algorithm>
#include <string_view>
#include <unordered_map>

using namespace ferry::cli;

namespace {

const std::unordered_map<char, std::string> SHORT_OPTIONS = {
    {'c', "config"}, {'h', "help"}, {'v', "verbose"}, {'y', "yes"}, {'n', "dry-run"}, {'o', "output"}
};

// Heuristic: if tail has obvious "value" chars, treat "-Xtail" as glued value
bool looksGluedValue(const std::string_view tail) {
    if (tail.empty()) return false;
    return std::ranges::any_of(tail, [](const char c) {
        return c == '/' || c == '.' || c == ':' || c == '=' || c == '~';
    });
}

bool takesValue(const std::string& key) {
    return std::ranges::find(valueOptions(), key) != valueOptions().end();
}

// "--dry-run" -> "dry-run", "-v" -> "verbose"; empty for non-flags
std::string flagKey(const std::string& arg) {
    if (arg.size() > 2 && arg.starts_with("--")) return arg.substr(2);
    if (arg.size() == 2 && arg[0] == '-' && arg[1] != '-') {
        const auto it = SHORT_OPTIONS.find(arg[1]);
        return it == SHORT_OPTIONS.end() ? arg.substr(1) : it->second;
    }
    return {};
}

}

const std::vector<std::string>& ferry::cli::valueOptions() {
    static const std::vector<std::string> opts = {"config", "only", "output"};
    return opts;
}

std::vector<std::string> ferry::cli::normalizeArgs(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    out.reserve(args.size() + 4);

    for (auto a : args) {
        if (a == "--") { out.emplace_back("--"); continue; }

        if (a.starts_with("--")) {
            const auto eq = a.find('=');
            if (eq != std::string::npos) {
                out.emplace_back(a.substr(0, eq));          // --key
                out.emplace_back(a.substr(eq + 1));         // value
            } else {
                out.emplace_back(std::move(a));
            }
            continue;
        }

        if (a.size() > 2 && a[0] == '-' && a[1] != '-') {
            // Could be -abc bundle OR -Xvalue
            std::string tail = a.substr(2);
            if (looksGluedValue(tail)) {
                out.emplace_back(std::string("-") + a[1]);  // -X
                if (tail[0] == '=') tail.erase(tail.begin());
                out.emplace_back(std::move(tail));          // value
            } else {
                for (size_t i = 1; i < a.size(); ++i) out.emplace_back(std::string("-") + a[i]);
            }
            continue;
        }

        out.emplace_back(std::move(a)); // plain arg
    }
    return out;
}

CommandCall ferry::cli::parseArgs(const std::vector<std::string>& args) {
    CommandCall call;
    if (args.empty()) {
        call.name = "help";
        return call;
    }

    const auto toks = normalizeArgs(args);
    size_t i = 0;

    // A leading flag such as --help becomes the command name
    const auto firstKey = flagKey(toks[0]);
    call.name = firstKey.empty() ? toks[0] : firstKey;
    ++i;

    bool stopFlags = false;
    for (; i < toks.size(); ++i) {
        const auto& t = toks[i];

        if (!stopFlags && t == "--") {
            stopFlags = true;
            continue;
        }

        const auto key = stopFlags ? std::string{} : flagKey(t);
        if (key.empty()) {
            call.positionals.push_back(t);
            continue;
        }

        if (takesValue(key) && i + 1 < toks.size()) {
            call.options.push_back(FlagKV{key, toks[i + 1]});
            ++i; // consumed value
        } else {
            call.options.push_back(FlagKV{key, std::nullopt});
        }
    }

    return call;
}

CommandCall ferry::cli::parseArgs(const int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i] ? argv[i] : "");
    return parseArgs(args);
}

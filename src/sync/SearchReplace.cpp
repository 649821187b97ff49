#include "sync/SearchReplace.hpp"
#include "logging/LogRegistry.hpp"
#include "types/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <iterator>
#include <string_view>

using namespace ferry::sync;
using namespace ferry::logging;
using namespace ferry::types;
namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 20> TEXT_EXTENSIONS = {
    "php", "phtml", "html", "htm", "css", "scss", "less", "js", "jsx", "ts",
    "tsx", "json", "xml", "yml", "yaml", "md", "txt", "twig", "mustache", "vue"
};

constexpr size_t BINARY_PROBE_BYTES = 2048;

std::string readAll(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) throw StagingError("Failed to read " + file.string());
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// Returns the number of replacements made
size_t replaceAll(std::string& text, const std::string& search, const std::string& replace) {
    size_t count = 0;
    for (auto pos = text.find(search); pos != std::string::npos; pos = text.find(search, pos + replace.size())) {
        text.replace(pos, search.size(), replace);
        ++count;
    }
    return count;
}

}

bool ferry::sync::hasTextExtension(const fs::path& file) {
    auto ext = file.extension().string();
    if (ext.empty()) return false;
    ext.erase(0, 1);
    std::ranges::transform(ext, ext.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::ranges::find(TEXT_EXTENSIONS, ext) != TEXT_EXTENSIONS.end();
}

bool ferry::sync::looksBinary(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) return true;

    std::array<char, BINARY_PROBE_BYTES> buf{};
    in.read(buf.data(), buf.size());
    const auto n = static_cast<size_t>(in.gcount());
    return std::find(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n), '\0') != buf.begin() + static_cast<std::ptrdiff_t>(n);
}

ReplaceResult ferry::sync::replaceInTree(const fs::path& root, const std::string& search, const std::string& replace) {
    if (!fs::is_directory(root)) throw StagingError("Path not found: " + root.string());

    ReplaceResult result;
    if (search.empty() || search == replace) return result;

    for (const auto& entry : fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied)) {
        if (entry.is_symlink() || !entry.is_regular_file()) continue;
        if (!hasTextExtension(entry.path()) || looksBinary(entry.path())) continue;

        ++result.files_checked;

        auto contents = readAll(entry.path());
        const auto hits = replaceAll(contents, search, replace);
        if (hits == 0) continue;

        std::ofstream out(entry.path(), std::ios::binary | std::ios::trunc);
        if (!out || !out.write(contents.data(), static_cast<std::streamsize>(contents.size())))
            throw StagingError("Failed to write updated contents to " + entry.path().string());

        ++result.files_modified;
        LogRegistry::sync()->debug("[SearchReplace] {} replacements in {}", hits, entry.path().string());
    }

    LogRegistry::sync()->info("[SearchReplace] {} files checked, {} modified under {}",
                              result.files_checked, result.files_modified, root.string());
    return result;
}

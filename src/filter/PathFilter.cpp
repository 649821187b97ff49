#include "filter/PathFilter.hpp"

#include <algorithm>

using namespace ferry::filter;

PathFilter::PathFilter(const std::vector<std::string>& excludes,
                       const std::vector<std::string>& includes,
                       const bool restrictToIncludes)
    : restrict_(restrictToIncludes && !includes.empty()) {
    excludes_.reserve(excludes.size());
    for (const auto& e : excludes)
        if (!e.empty()) excludes_.emplace_back(e);

    includes_.reserve(includes.size());
    for (const auto& i : includes)
        if (!i.empty()) includes_.emplace_back(i);
}

bool PathFilter::isExcluded(const std::string_view relPath) const {
    const auto hit = [&](const std::string_view p) {
        return std::ranges::any_of(excludes_, [&](const Pattern& pattern) { return pattern.matches(p); });
    };

    if (hit(relPath)) return true;

    // a rule naming a parent directory prunes everything beneath it
    for (size_t pos = relPath.find('/'); pos != std::string_view::npos; pos = relPath.find('/', pos + 1))
        if (pos > 0 && hit(relPath.substr(0, pos))) return true;

    return false;
}

bool PathFilter::isIncluded(const std::string_view relPath, const bool isDirectory) const {
    if (!restrict_) return true;

    if (std::ranges::any_of(includes_, [&](const Pattern& p) { return p.selects(relPath); })) return true;

    return isDirectory && std::ranges::any_of(includes_, [&](const Pattern& p) { return p.mayMatchBelow(relPath); });
}

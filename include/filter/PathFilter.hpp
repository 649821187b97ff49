#pragma once

#include "filter/Pattern.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace ferry::filter {

// Exclude and include rule sets. Rules are independent predicates, so their order never matters.
class PathFilter {
public:
    PathFilter() = default;
    explicit PathFilter(const std::vector<std::string>& excludes,
                        const std::vector<std::string>& includes = {},
                        bool restrictToIncludes = false);

    // rel or one of its parent directories matches an exclude rule
    [[nodiscard]] bool isExcluded(std::string_view relPath) const;

    // Always true unless restricting. When restricting, rel must be selected by an include rule,
    // sit inside a selected subtree, or (directories only) be able to contain a selected path.
    [[nodiscard]] bool isIncluded(std::string_view relPath, bool isDirectory) const;

    [[nodiscard]] bool accepts(const std::string_view relPath, const bool isDirectory) const {
        return !isExcluded(relPath) && isIncluded(relPath, isDirectory);
    }

    [[nodiscard]] bool restricts() const { return restrict_; }
    [[nodiscard]] const std::vector<Pattern>& excludes() const { return excludes_; }
    [[nodiscard]] const std::vector<Pattern>& includes() const { return includes_; }

private:
    std::vector<Pattern> excludes_;
    std::vector<Pattern> includes_;
    bool restrict_{false};
};

}

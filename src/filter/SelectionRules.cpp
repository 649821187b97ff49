#include "filter/SelectionRules.hpp"

#include <string_view>
#include <unordered_set>

using namespace ferry::filter;

namespace {

std::string_view trimSlashes(std::string_view s) {
    while (s.starts_with("./")) s.remove_prefix(2);
    while (!s.empty() && s.front() == '/') s.remove_prefix(1);
    while (!s.empty() && s.back() == '/') s.remove_suffix(1);
    return s;
}

}

SelectionRules ferry::filter::buildSelectionRules(const std::vector<Selection>& selected, const bool selectAll) {
    if (selectAll || selected.empty()) return {};

    SelectionRules rules;
    std::unordered_set<std::string> seen;
    const auto add = [&](std::string rule) {
        if (seen.insert(rule).second) rules.includes.push_back(std::move(rule));
    };

    for (const auto& sel : selected) {
        const auto path = trimSlashes(sel.path);
        if (path.empty()) continue;

        // every ancestor directory has to be traversable
        for (auto pos = path.find('/'); pos != std::string_view::npos; pos = path.find('/', pos + 1))
            add("/" + std::string(path.substr(0, pos)) + "/");

        if (sel.directory) {
            add("/" + std::string(path) + "/");
            add("/" + std::string(path) + "/***");
        } else {
            add("/" + std::string(path));
        }
    }

    rules.restrict = !rules.includes.empty();
    return rules;
}

#pragma once

#include <string>
#include <vector>

namespace ferry::filter {

struct Selection {
    std::string path;
    bool directory{false};
};

// Include rules plus whether they restrict the transfer at all.
struct SelectionRules {
    bool restrict{false};
    std::vector<std::string> includes;
};

// "a/b/c.txt" -> /a/ /a/b/ /a/b/c.txt
// "a/b" (dir) -> /a/ /a/b/ /a/b/***
// Nothing selected, or selectAll, yields no restriction.
SelectionRules buildSelectionRules(const std::vector<Selection>& selected, bool selectAll = false);

}

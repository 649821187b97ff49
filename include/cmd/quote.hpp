#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ferry::cmd {

// POSIX single-quoting: 'it'\''s'. Always quotes, including the empty string.
std::string shellQuote(std::string_view arg);

// Leaves words made only of [A-Za-z0-9_@%+=:,./-] bare, quotes everything else
std::string shellWord(std::string_view arg);

// shellWord() each element, space separated
std::string join(const std::vector<std::string>& words);

}

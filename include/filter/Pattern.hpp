#pragma once

#include <string>
#include <string_view>

namespace ferry::filter {

enum class PatternKind { Exact, Prefix, Glob };

std::string to_string(PatternKind kind);

// One exclude/include rule, classified once at construction.
//
//   wp-content/uploads/a.jpg   Exact   the full relative path
//   wp-content/cache/          Prefix  the directory and everything beneath it
//   *.log, a/**/b, dir/***     Glob    '*' and '?' stop at '/', '**' crosses it,
//                                      a trailing "/***" selects a directory and its subtree
//
// A leading '/' anchors the rule to the tree root. A rule without any inner '/' is unanchored
// and also applies to every path component, the way rsync treats it.
class Pattern {
public:
    explicit Pattern(std::string_view raw);

    [[nodiscard]] bool matches(std::string_view relPath) const;

    // Include semantics: a directory rule ("dir/") names the directory itself, not its contents.
    [[nodiscard]] bool selects(std::string_view relPath) const;

    // True if a path strictly beneath dirRelPath could match this rule.
    [[nodiscard]] bool mayMatchBelow(std::string_view dirRelPath) const;

    [[nodiscard]] PatternKind kind() const { return kind_; }
    [[nodiscard]] const std::string& raw() const { return raw_; }
    [[nodiscard]] const std::string& body() const { return body_; }
    [[nodiscard]] bool anchored() const { return anchored_; }

private:
    std::string raw_;
    std::string body_;
    PatternKind kind_{PatternKind::Exact};
    bool anchored_{false};
    bool dirOnly_{false};
    bool subtree_{false};

    [[nodiscard]] bool matchExact(std::string_view relPath) const;
    [[nodiscard]] bool matchPrefix(std::string_view relPath) const;
    [[nodiscard]] bool matchGlob(std::string_view relPath) const;
};

// Glob match over a whole relative path.
bool globMatch(std::string_view path, std::string_view mask);

bool matches(std::string_view relativePath, std::string_view pattern);

}

#include "filter/Pattern.hpp"

#include <stdexcept>

using namespace ferry::filter;

namespace {

constexpr std::string_view SUBTREE_SUFFIX = "/***";

bool hasWildcard(const std::string_view s) {
    return s.find_first_of("*?") != std::string_view::npos;
}

std::string_view normalize(std::string_view rel) {
    while (rel.starts_with("./")) rel.remove_prefix(2);
    while (!rel.empty() && rel.front() == '/') rel.remove_prefix(1);
    while (!rel.empty() && rel.back() == '/') rel.remove_suffix(1);
    return rel;
}

std::string_view basename(const std::string_view rel) {
    const auto pos = rel.rfind('/');
    return pos == std::string_view::npos ? rel : rel.substr(pos + 1);
}

// Calls fn on "a", "a/b", "a/b/c" for rel "a/b/c"; stops at the first true.
template <typename Fn>
bool anySelfOrAncestor(const std::string_view rel, Fn&& fn) {
    for (size_t pos = rel.find('/'); pos != std::string_view::npos; pos = rel.find('/', pos + 1))
        if (fn(rel.substr(0, pos))) return true;
    return fn(rel);
}

// Calls fn on "a", "b", "c" for rel "a/b/c"; stops at the first true.
template <typename Fn>
bool anyComponent(std::string_view rel, Fn&& fn) {
    while (true) {
        const auto pos = rel.find('/');
        if (fn(rel.substr(0, pos))) return true;
        if (pos == std::string_view::npos) return false;
        rel.remove_prefix(pos + 1);
    }
}

}

std::string ferry::filter::to_string(const PatternKind kind) {
    switch (kind) {
    case PatternKind::Exact: return "exact";
    case PatternKind::Prefix: return "prefix";
    case PatternKind::Glob: return "glob";
    default: throw std::invalid_argument("Unknown pattern kind");
    }
}

Pattern::Pattern(const std::string_view raw) : raw_(raw) {
    std::string_view s = raw;
    while (s.starts_with("./")) s.remove_prefix(2);
    if (s.starts_with('/')) {
        anchored_ = true;
        while (s.starts_with('/')) s.remove_prefix(1);
    }

    if (s.ends_with(SUBTREE_SUFFIX) || s == "***") {
        subtree_ = true;
        s.remove_suffix(s == "***" ? 3 : SUBTREE_SUFFIX.size());
    } else if (s.ends_with('/')) {
        dirOnly_ = true;
        while (s.ends_with('/')) s.remove_suffix(1);
    }

    body_ = std::string(s);
    if (body_.find('/') != std::string::npos) anchored_ = true;

    if (subtree_ || hasWildcard(body_)) kind_ = PatternKind::Glob;
    else if (dirOnly_) kind_ = PatternKind::Prefix;
    else kind_ = PatternKind::Exact;
}

bool Pattern::matches(std::string_view relPath) const {
    relPath = normalize(relPath);
    if (relPath.empty()) return false;
    if (body_.empty()) return subtree_;

    switch (kind_) {
    case PatternKind::Exact: return matchExact(relPath);
    case PatternKind::Prefix: return matchPrefix(relPath);
    case PatternKind::Glob: return matchGlob(relPath);
    }
    return false;
}

bool Pattern::selects(std::string_view relPath) const {
    relPath = normalize(relPath);
    if (relPath.empty()) return false;
    if (body_.empty()) return subtree_;

    if (dirOnly_) {
        if (kind_ == PatternKind::Prefix)
            return relPath == body_ || (!anchored_ && basename(relPath) == body_);
        return globMatch(relPath, body_) || (!anchored_ && globMatch(basename(relPath), body_));
    }
    return matches(relPath);
}

bool Pattern::mayMatchBelow(std::string_view dirRelPath) const {
    dirRelPath = normalize(dirRelPath);
    if (dirRelPath.empty() || !anchored_ || body_.empty()) return true;
    if (subtree_ && matches(dirRelPath)) return true;

    const std::string dirWithSep = std::string(dirRelPath) + '/';
    const auto wildcard = body_.find_first_of("*?");
    if (wildcard == std::string::npos) return body_.starts_with(dirWithSep);

    const std::string_view head = std::string_view(body_).substr(0, wildcard);
    return head.starts_with(dirWithSep) || std::string_view(dirWithSep).starts_with(head);
}

bool Pattern::matchExact(const std::string_view relPath) const {
    if (relPath == body_) return true;
    return !anchored_ && basename(relPath) == body_;
}

bool Pattern::matchPrefix(const std::string_view relPath) const {
    if (anchored_) return relPath == body_ || (relPath.starts_with(body_) && relPath[body_.size()] == '/');
    return anyComponent(relPath, [&](const std::string_view c) { return c == body_; });
}

bool Pattern::matchGlob(const std::string_view relPath) const {
    const auto self = [&](const std::string_view p) { return globMatch(p, body_); };

    if (subtree_ || dirOnly_) {
        if (anySelfOrAncestor(relPath, self)) return true;
        return !anchored_ && anyComponent(relPath, self);
    }

    if (self(relPath)) return true;
    return !anchored_ && self(basename(relPath));
}

bool ferry::filter::globMatch(std::string_view path, std::string_view mask) {
    while (!mask.empty()) {
        const char m = mask.front();

        if (m == '*') {
            const bool crossesSeparator = mask.starts_with("**");

            // "**/" also matches zero directories
            if (mask.starts_with("**/") && globMatch(path, mask.substr(3))) return true;

            const auto next = mask.find_first_not_of('*');
            mask.remove_prefix(next == std::string_view::npos ? mask.size() : next);
            if (mask.empty()) return crossesSeparator || path.find('/') == std::string_view::npos;

            for (size_t i = 0; i <= path.size(); ++i) {
                if (globMatch(path.substr(i), mask)) return true;
                if (i < path.size() && path[i] == '/' && !crossesSeparator) return false;
            }
            return false;
        }

        if (path.empty()) return false;
        if (m == '?') {
            if (path.front() == '/') return false;
        } else if (m != path.front()) {
            return false;
        }

        path.remove_prefix(1);
        mask.remove_prefix(1);
    }
    return path.empty();
}

bool ferry::filter::matches(const std::string_view relativePath, const std::string_view pattern) {
    return Pattern(pattern).matches(relativePath);
}

/**
 * @file route.cpp
 * @brief Route pattern matching and path rewriting.
 */
#include "conduit/routing/route.hpp"

#include <algorithm>
#include <cctype>

namespace conduit::routing {

bool glob_match(std::string_view pattern, std::string_view text) noexcept {
    // Iterative matcher with single backtrack point (classic wildcard algorithm).
    std::size_t p = 0, t = 0;
    std::size_t star = std::string_view::npos, mark = 0;
    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] != '*' && pattern[p] == text[t]) {
            ++p; ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

bool Route::acceptsMethod(std::string_view method) const noexcept {
    for (const auto& m : methods) {
        if (m == "*") return true;
        if (m.size() != method.size()) continue;
        const bool same = std::equal(m.begin(), m.end(), method.begin(), [](char a, char b) {
            return std::toupper(static_cast<unsigned char>(a)) ==
                   std::toupper(static_cast<unsigned char>(b));
        });
        if (same) return true;
    }
    return false;
}

bool Route::matchesPath(std::string_view path) const noexcept {
    if (glob_match(pattern, path)) return true;
    // "/api/v1/orders/*" also serves the bare collection path "/api/v1/orders".
    if (pattern.size() >= 2 && pattern.ends_with("/*")) {
        return path == std::string_view(pattern).substr(0, pattern.size() - 2);
    }
    return false;
}

std::size_t Route::specificity() const noexcept {
    const auto literals = static_cast<std::size_t>(
        std::count_if(pattern.begin(), pattern.end(), [](char c) { return c != '*'; }));
    // Exact patterns rank above wildcard patterns with the same literal length.
    const bool exact = pattern.find('*') == std::string::npos;
    return literals * 2 + (exact ? 1 : 0);
}

std::string_view Route::literalPrefix() const noexcept {
    std::string_view p(pattern);
    const auto star = p.find('*');
    if (star != std::string_view::npos) p = p.substr(0, star);
    while (!p.empty() && p.back() == '/') p.remove_suffix(1);
    return p;
}

std::string Route::rewritePath(std::string_view path) const {
    if (!strip_path_prefix) return std::string(path);
    const auto prefix = literalPrefix();
    if (!prefix.empty() && path.starts_with(prefix)) path.remove_prefix(prefix.size());
    if (path.empty() || path.front() != '/') return "/" + std::string(path);
    return std::string(path);
}

} // namespace conduit::routing

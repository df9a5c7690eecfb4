#pragma once
/**
 * @file route.hpp
 * @brief Route rules: inbound path/method pattern mapped to a target service.
 * @details Patterns are literal paths with optional '*' wildcards, e.g.
 *          "/api/v1/orders/*". Specificity is the number of literal characters,
 *          exact patterns outrank wildcard ones of the same literal length.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::routing {

/**
 * @struct RateLimit
 * @brief Fixed-window request budget applied per client on a route.
 */
struct RateLimit {
    std::chrono::milliseconds window{60000}; ///< Window length
    std::uint32_t max_requests{100};          ///< Requests admitted per window

    bool operator==(const RateLimit&) const = default;
};

/**
 * @struct Route
 * @brief Immutable forwarding rule loaded from configuration.
 */
struct Route {
    std::string pattern;                    ///< e.g. "/api/v1/orders/*"
    std::string target_service;             ///< Service name in the registry
    std::vector<std::string> methods{"*"};  ///< Upper-case methods; "*" matches any
    bool requires_auth{false};              ///< Informational; auth is enforced upstream of the core
    bool strip_path_prefix{false};          ///< Remove the literal prefix before forwarding
    std::optional<RateLimit> rate_limit;    ///< Per-route limiter
    std::optional<std::chrono::milliseconds> timeout; ///< Overrides the proxy-wide budget
    std::optional<std::uint32_t> max_retries;         ///< Overrides the service retry policy

    bool operator==(const Route&) const = default;

    /// True if `method` is accepted (case-insensitive).
    [[nodiscard]] bool acceptsMethod(std::string_view method) const noexcept;

    /// True if `path` matches `pattern`.
    [[nodiscard]] bool matchesPath(std::string_view path) const noexcept;

    /// Literal characters in the pattern; higher is more specific.
    [[nodiscard]] std::size_t specificity() const noexcept;

    /// Leading literal part of the pattern without a trailing '/', e.g. "/api/v1/orders".
    [[nodiscard]] std::string_view literalPrefix() const noexcept;

    /// Path forwarded upstream: prefix stripped if configured, never empty.
    [[nodiscard]] std::string rewritePath(std::string_view path) const;
};

using RouteList = std::vector<Route>;

/// Glob match where '*' spans any (possibly empty) character run.
bool glob_match(std::string_view pattern, std::string_view text) noexcept;

} // namespace conduit::routing

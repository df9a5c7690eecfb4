#pragma once
/**
 * @file rate_limiter.hpp
 * @brief Fixed-window request limiter keyed by route pattern and client key.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>

#include "conduit/routing/route.hpp"
#include "conduit/routing/string_key.hpp"

namespace conduit::proxy {

/// Result of one admission check.
struct RateDecision {
    bool          allowed{true};
    std::uint32_t remaining{0};                 ///< Requests left in the current window
    std::chrono::milliseconds retry_after{0};   ///< Time until the window resets (when denied)
};

class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    RateLimiter() = default;
    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Count one request against `route.rate_limit`; routes without a limit always pass.
    RateDecision admit(const routing::Route& route, std::string_view client_key,
                       Clock::time_point now = Clock::now());

    /// Drop windows that ended before `now`. Returns the number removed.
    std::size_t purgeExpired(Clock::time_point now = Clock::now());

private:
    struct Window {
        Clock::time_point start{};
        std::uint32_t     count{0};
    };
    struct RouteWindows {
        std::mutex mu;
        std::chrono::milliseconds length{0};
        routing::StringMap<Window> clients;
    };

    std::shared_ptr<RouteWindows> windows(const routing::Route& route);

    mutable std::shared_mutex mu_;
    routing::StringMap<std::shared_ptr<RouteWindows>> routes_;
};

} // namespace conduit::proxy

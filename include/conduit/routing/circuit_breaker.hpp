#pragma once
/**
 * @file circuit_breaker.hpp
 * @brief Per-service failure isolation (closed -> open -> half-open -> closed).
 *
 * Open -> HalfOpen is evaluated lazily inside allowRequest(); there is no timer.
 * HalfOpen admits exactly one trial request; concurrent callers are rejected
 * until the trial reports its outcome.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "conduit/config/constants.hpp"
#include "conduit/routing/string_key.hpp"

namespace spdlog { class logger; }

namespace conduit::routing {

/// Breaker tuning shared by every service.
struct BreakerConfig {
    std::uint32_t             failure_threshold{config::constants::BREAKER_FAILURE_THRESHOLD};
    std::chrono::milliseconds reset_timeout{config::constants::BREAKER_RESET_TIMEOUT_MS};
};

enum class BreakerState : std::uint8_t { Closed, Open, HalfOpen };

/// "closed", "open", "half-open".
std::string_view to_string(BreakerState s) noexcept;

/// Point-in-time view of one breaker.
struct BreakerStats {
    std::string   service;
    BreakerState  state{BreakerState::Closed};
    std::uint32_t failure_count{0};
    std::uint64_t rejected{0};        ///< Requests refused while open
    std::uint64_t times_opened{0};
    std::chrono::steady_clock::time_point last_failure_at{};
};

class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    CircuitBreaker(std::string service, BreakerConfig cfg);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /// Gate one request. May move Open -> HalfOpen and claim the trial slot.
    [[nodiscard]] bool allowRequest(Clock::time_point now = Clock::now());

    /// Request-level success: Closed resets the count; HalfOpen closes.
    void recordSuccess();

    /// Request-level failure: may open (Closed) or re-open (HalfOpen).
    void recordFailure(Clock::time_point now = Clock::now());

    /// Force Closed with a zero failure count (operator action).
    void reset();

    [[nodiscard]] BreakerState state() const;
    [[nodiscard]] std::uint32_t failureCount() const;
    [[nodiscard]] BreakerStats stats() const;
    [[nodiscard]] const std::string& service() const noexcept { return service_; }

private:
    void transitionTo(BreakerState next); // mu_ held

    const std::string   service_;
    const BreakerConfig cfg_;
    std::shared_ptr<spdlog::logger> log_;

    mutable std::mutex mu_;
    BreakerState       state_{BreakerState::Closed};
    std::uint32_t      failures_{0};
    bool               trial_in_flight_{false};
    Clock::time_point  last_failure_at_{};
    std::uint64_t      rejected_{0};
    std::uint64_t      times_opened_{0};
};

/**
 * @brief One CircuitBreaker per service, created lazily.
 * @details Lookups take a shared lock; creation re-checks under the unique lock.
 */
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(BreakerConfig cfg = {}) : cfg_(cfg) {}

    /// Breaker for `service` (never null).
    [[nodiscard]] std::shared_ptr<CircuitBreaker> get(std::string_view service);

    /// Stats of every breaker created so far, sorted by service.
    [[nodiscard]] std::vector<BreakerStats> allStats() const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] const BreakerConfig& config() const noexcept { return cfg_; }

private:
    const BreakerConfig cfg_;
    mutable std::shared_mutex mu_;
    StringMap<std::shared_ptr<CircuitBreaker>> breakers_;
};

} // namespace conduit::routing

#pragma once
/**
 * @file load_balancer.hpp
 * @brief Per-request instance selection and the health/latency feedback loop.
 *
 * The balancer reads the live instance list from the ServiceRegistry, filters it
 * through the shared HealthTracker, optionally honours a sticky binding, and
 * otherwise dispatches to the configured selection policy.
 *
 * @note Concurrency:
 *   - Per-service state (round-robin counter, sticky table) and per-instance
 *     statistics are reached through shared_mutex-guarded indexes that are only
 *     write-locked when a key is seen for the first time.
 *   - Counters themselves are atomics; the running average is guarded by the
 *     instance's own mutex.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "conduit/config/constants.hpp"
#include "conduit/routing/health_tracker.hpp"
#include "conduit/routing/selection_policy.hpp"
#include "conduit/routing/service.hpp"
#include "conduit/routing/session_affinity.hpp"
#include "conduit/routing/string_key.hpp"

namespace spdlog { class logger; }
namespace conduit::obs { class MetricsAggregator; }

namespace conduit::routing {

class ServiceRegistry;

/// Load balancer configuration.
struct BalancerConfig {
    Algorithm                 algorithm{Algorithm::RoundRobin};
    bool                      sticky_sessions{config::constants::LB_STICKY_SESSIONS};
    std::chrono::milliseconds session_ttl{config::constants::LB_SESSION_TTL_MS};
    std::uint64_t             hash_seed{config::constants::LB_HASH_SEED_DEFAULT};
};

/// Load statistics of one instance.
struct InstanceLoad {
    std::string   instance_id;
    std::int64_t  active_connections{0};
    double        avg_response_ms{0.0};
    std::uint64_t samples{0};
};

class LoadBalancer {
public:
    using Clock = std::chrono::steady_clock;

    LoadBalancer(ServiceRegistry& registry, HealthTracker& health,
                 obs::MetricsAggregator& metrics, BalancerConfig cfg = {});

    LoadBalancer(const LoadBalancer&) = delete;
    LoadBalancer& operator=(const LoadBalancer&) = delete;

    /**
     * @brief Pick a healthy instance of `service`.
     * @param client_key Client identity for ip-hash and sticky sessions (may be empty).
     * @param now        Time source for session expiry.
     * @return nullopt when the service is unknown or has no healthy instance.
     */
    [[nodiscard]] std::optional<ServiceInstance>
    selectInstance(std::string_view service, std::string_view client_key = {},
                   Clock::time_point now = Clock::now());

    /**
     * @brief Retry variant: prefer any healthy instance other than `avoid_instance`.
     * @details Falls back to `avoid_instance` only when it is the sole healthy one.
     *          A sticky binding to the avoided instance is ignored.
     */
    [[nodiscard]] std::optional<ServiceInstance>
    selectInstance(std::string_view service, std::string_view client_key,
                   std::string_view avoid_instance, Clock::time_point now);

    /// Outcome of one network attempt; updates health, latency average and metrics.
    void recordSuccess(std::string_view instance_id, double response_time_ms);

    /// As recordSuccess(); an instance that is unhealthy afterwards loses its sticky clients.
    void recordFailure(std::string_view instance_id, double response_time_ms);

    /// Open-connection counter, floor-clamped at zero.
    void recordConnectionStart(std::string_view instance_id);
    void recordConnectionEnd(std::string_view instance_id);

    [[nodiscard]] std::int64_t activeConnections(std::string_view instance_id) const;

    /// Health records of every registered instance, sorted by id.
    [[nodiscard]] std::vector<InstanceHealthRecord> getInstanceHealth() const;

    /// Load statistics of every instance seen so far, sorted by id.
    [[nodiscard]] std::vector<InstanceLoad> getInstanceLoad() const;

    /// Erase expired sticky bindings across all services.
    std::size_t purgeExpiredSessions(Clock::time_point now = Clock::now());

    /**
     * @brief Drop state of services and instances no longer in the registry.
     * @details Removes per-service state of unregistered services, sticky bindings
     *          to instances that left their service, and idle statistics of
     *          unregistered instances. Statistics with open connections are kept
     *          until those connections end.
     * @return Number of entries removed.
     */
    std::size_t pruneUnregistered();

    [[nodiscard]] const BalancerConfig& config() const noexcept { return cfg_; }

private:
    struct ServiceState {
        explicit ServiceState(std::chrono::milliseconds ttl) : sessions(ttl) {}
        std::atomic<std::uint64_t> tick{0};
        SessionAffinityTable sessions;
    };

    struct InstanceStats {
        std::atomic<std::int64_t> connections{0};
        mutable std::mutex mu;          ///< Guards avg/samples
        double        avg_ms{0.0};
        std::uint64_t samples{0};
    };

    std::optional<ServiceInstance> select(std::string_view service, std::string_view client_key,
                                          std::string_view avoid_instance, Clock::time_point now);

    std::shared_ptr<ServiceState>  serviceState(std::string_view service);
    std::shared_ptr<InstanceStats> findStats(std::string_view instance_id) const;
    std::shared_ptr<InstanceStats> stats(std::string_view instance_id);
    void sample(std::string_view instance_id, double response_time_ms);
    void unbindEverywhere(std::string_view instance_id);

private:
    ServiceRegistry&        registry_;
    HealthTracker&          health_;
    obs::MetricsAggregator& metrics_;
    const BalancerConfig    cfg_;
    std::shared_ptr<spdlog::logger> log_;

    mutable std::shared_mutex services_mu_;
    StringMap<std::shared_ptr<ServiceState>> services_;

    mutable std::shared_mutex stats_mu_;
    StringMap<std::shared_ptr<InstanceStats>> stats_;
};

} // namespace conduit::routing

#pragma once
// Conduit Gateway: ServiceRegistry
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Read-mostly workload: readers take a snapshot (shared_ptr copy) with ACQUIRE semantics.
//   • Writers perform copy-on-write of the whole map and atomically swap with RELEASE semantics.
//   • Readers never block writers; writers never block readers.
//   • Grace period / reclamation is handled by shared_ptr refcounts (no hazard pointers needed).
// Instance reachability lives in the HealthTracker (one lock per instance), not in the
// snapshot, so health updates never copy the map.


#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "conduit/config/constants.hpp"
#include "conduit/proxy/transport.hpp"
#include "conduit/routing/health_tracker.hpp"
#include "conduit/routing/route.hpp"
#include "conduit/routing/service.hpp"
#include "conduit/routing/string_key.hpp"

namespace spdlog { class logger; }

namespace conduit::routing {

// -----------------------------------------------------------------------------
// Error codes returned by registry operations. Never throw exceptions in hot path.
// -----------------------------------------------------------------------------
/// Result codes for registry mutations.
enum class RegistryErr {
    Ok,         ///< Operation succeeded.
    Exists,     ///< Add failed because the entry already exists.
    NotFound,   ///< Target service/route not found.
    Invalid,    ///< Input validation failed (names, URLs, weights, duplicates).
    Capacity    ///< Operation rejected due to configured capacity limits.
};

std::string_view to_string(RegistryErr e) noexcept;

// -----------------------------------------------------------------------------
// Hard limits for bounded memory usage.
// -----------------------------------------------------------------------------
/// Compile-time capacity and field limits.
struct Limits {
    static constexpr std::size_t MaxServices            = 256;  ///< Max number of services.
    static constexpr std::size_t MaxInstancesPerService = 128;  ///< Max instances per service.
    static constexpr std::size_t MaxRoutes              = 1024; ///< Max route rules.
    static constexpr std::size_t MaxIdLen               = 64;   ///< Max length for service / instance ids.
    static constexpr std::size_t MaxUrlLen              = 2048; ///< Max length for instance URLs.
};

/// Service definition plus its instance list, as published in a snapshot.
struct ServiceEntry {
    ServiceDefinition definition;
    InstanceList      instances;

    bool operator==(const ServiceEntry&) const = default;
};

/// Background health polling parameters.
struct HealthCheckConfig {
    std::chrono::milliseconds interval{config::constants::HEALTH_INTERVAL_MS};
    std::chrono::milliseconds timeout{config::constants::HEALTH_TIMEOUT_MS};
    std::size_t               max_concurrency{config::constants::HEALTH_MAX_CONCURRENCY};
};

/// Outcome of one out-of-band health probe.
struct HealthCheckResult {
    std::string instance_id;
    bool        healthy{false};
    unsigned    status_code{0};        ///< 0 when no HTTP response was received
    double      response_time_ms{0.0};
    std::string error;                 ///< Transport failure or non-2xx description
};

// -----------------------------------------------------------------------------
// ServiceRegistry class
// -----------------------------------------------------------------------------
///
/// Source of truth for "which instances exist" and "which route matches".
/// - Services: ServiceName → {definition, instances}, RCU snapshot.
/// - Routes: ordered rule list, RCU snapshot; most specific match wins,
///   declaration order breaks ties.
/// - Health: periodic concurrent probes feeding the shared HealthTracker.
///
/// Thread-safety:
///   - Reads are lock-free.
///   - Writes are serialized by a writer mutex, may allocate.
///   - Readers may see slightly stale data, but always consistent.
//
class ServiceRegistry final {
public:
    using Map = StringMap<ServiceEntry>;

    ServiceRegistry(HealthTracker& health,
                    std::shared_ptr<proxy::HttpTransport> transport,
                    HealthCheckConfig cfg = {});
    ~ServiceRegistry();

    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

    // --------------------------- RCU Snapshot API ----------------------------
    /// Return a consistent snapshot of the service map.
    std::shared_ptr<const Map> snapshot() const noexcept;

    /// Return a consistent snapshot of the route table.
    std::shared_ptr<const RouteList> routeSnapshot() const noexcept;

    // --------------------------- Services ------------------------------------
    /// Insert or replace a service and its instances. Idempotent.
    RegistryErr registerService(const ServiceDefinition& def, std::span<const ServiceInstance> instances);

    /// Remove a service. Returns true if it was registered.
    bool unregisterService(std::string_view name);

    /// Remove all services and routes. Treated as maintenance operation.
    void clear();

    /// Copy of a service definition.
    [[nodiscard]] std::optional<ServiceDefinition> getService(std::string_view name) const;

    /// Live instance list with status filled from the health tracker; empty if unknown.
    [[nodiscard]] InstanceList getInstances(std::string_view name) const;

    [[nodiscard]] bool hasService(std::string_view name) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::vector<std::string> listServices() const;

    /// Monotonic version counter. Increments on every successful mutation.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    // --------------------------- Routes --------------------------------------
    /// Append a route rule (declaration order is preserved).
    RegistryErr addRoute(Route route);

    /// Replace the whole route table.
    RegistryErr setRoutes(RouteList routes);

    /// Most specific route accepting `method` on `path`; nullopt => RouteNotFound.
    [[nodiscard]] std::optional<Route> resolveRoute(std::string_view path, std::string_view method) const;

    [[nodiscard]] RouteList routes() const;

    // --------------------------- Health --------------------------------------
    /// Probe one instance (GET <url><healthCheckPath>) and feed the tracker.
    HealthCheckResult checkHealth(std::string_view instance_id, std::stop_token stop = {});

    /// Probe every registered instance once, at most cfg.max_concurrency at a time.
    std::vector<HealthCheckResult> runHealthSweep(std::stop_token stop = {});

    /// Start the background loop (sweep immediately, then every interval).
    void startHealthChecks();

    /// Stop the background loop and wait for the current sweep to finish.
    void stopHealthChecks();

    [[nodiscard]] bool healthChecksRunning() const noexcept;

    [[nodiscard]] const HealthCheckConfig& healthConfig() const noexcept { return cfg_; }

    // --------------------------- Observability -------------------------------
    /// Registry-level view for the operator endpoints.
    struct Stats {
        std::size_t services{0}, routes{0}, instances{0};
        std::size_t healthy{0}, unhealthy{0}, unknown{0};
        uint64_t registrations{0}, removals{0}, failures{0};
    };
    [[nodiscard]] Stats stats() const;

private:
    // Current snapshots (shared_ptr for RCU semantics).
    std::shared_ptr<const Map>       map_{std::make_shared<Map>()};
    std::shared_ptr<const RouteList> routes_{std::make_shared<RouteList>()};
    std::atomic<uint64_t> version_{0};

    std::mutex write_mu_; ///< Serializes copy-on-write publishers

    HealthTracker& health_;
    std::shared_ptr<proxy::HttpTransport> transport_;
    HealthCheckConfig cfg_;
    std::shared_ptr<spdlog::logger> log_;

    // Background loop
    mutable std::mutex loop_mu_;
    std::condition_variable_any loop_cv_;
    std::jthread loop_;

    // Counters for observability.
    std::atomic<uint64_t> registrations_{0}, removals_{0}, failures_{0};

    // Validation helpers
    static bool validateId(std::string_view id, std::size_t maxLen) noexcept;
    static bool validateUrl(std::string_view url) noexcept;
    static bool validateRoute(const Route& r) noexcept;
    bool validateInstances(const Map& current, std::string_view service,
                           std::span<const ServiceInstance> instances) const noexcept;

    void publish(std::shared_ptr<Map> next);
    void publishRoutes(std::shared_ptr<RouteList> next);
    void syncHealthRecords(const Map& m);
    void loop(std::stop_token stop);

    RegistryErr fail(RegistryErr e) noexcept {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return e;
    }
};

} // namespace conduit::routing

#pragma once
/**
 * @file health_tracker.hpp
 * @brief Per-instance health records with consecutive failure/success hysteresis.
 * @details Shared by the registry health loop (probe outcomes) and the load balancer
 *          (request outcomes). One lock per instance record; the index map is only
 *          write-locked when instances are added or removed.
 */

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
#include "conduit/obs/health_events.hpp"
#include "conduit/routing/service.hpp"
#include "conduit/routing/string_key.hpp"

namespace conduit::routing {

/** @struct HealthThresholds
 *  @brief Hysteresis thresholds for the healthy/unhealthy transition.
 */
struct HealthThresholds {
    std::uint32_t failure_threshold{config::constants::LB_FAILURE_THRESHOLD};   ///< Failures to mark unhealthy
    std::uint32_t recovery_threshold{config::constants::LB_RECOVERY_THRESHOLD}; ///< Successes to mark healthy
};

/** @struct InstanceHealthRecord
 *  @brief Rolling health state of one instance.
 */
struct InstanceHealthRecord {
    std::string   instance_id;
    bool          healthy{true};             ///< Absent evidence => assume healthy
    bool          observed{false};           ///< At least one outcome recorded
    std::uint32_t consecutive_failures{0};
    std::uint32_t consecutive_successes{0};
    double        last_response_time_ms{0.0};
    std::chrono::system_clock::time_point last_checked_at{};
};

/** @class HealthTracker
 *  @brief Thread-safe store of InstanceHealthRecord, one per known instance.
 */
class HealthTracker {
public:
    explicit HealthTracker(HealthThresholds thresholds = {}) noexcept : thresholds_(thresholds) {}

    HealthTracker(const HealthTracker&) = delete;
    HealthTracker& operator=(const HealthTracker&) = delete;

    /// Ensure a record exists for `instance_id` (default: healthy, unobserved).
    void track(std::string_view instance_id);

    /// Drop records whose id is not in `live_ids`.
    void retain(const std::vector<std::string>& live_ids);

    /// Remove one record. Returns true if it existed.
    bool forget(std::string_view instance_id);

    /// Healthy flag; instances with no record are assumed healthy.
    [[nodiscard]] bool isHealthy(std::string_view instance_id) const;

    /// Unknown until the first outcome, then Healthy/Unhealthy.
    [[nodiscard]] InstanceStatus status(std::string_view instance_id) const;

    /// Copy of one record, if tracked.
    [[nodiscard]] std::optional<InstanceHealthRecord> record(std::string_view instance_id) const;

    /// Copies of every record (order unspecified).
    [[nodiscard]] std::vector<InstanceHealthRecord> records() const;

    /// Apply a successful outcome (health probe or forwarded request).
    /// Outcomes for ids without a record (never tracked, or forgotten) are ignored.
    void recordSuccess(std::string_view instance_id, double response_time_ms);

    /// Apply a failed outcome (health probe or forwarded request).
    void recordFailure(std::string_view instance_id, double response_time_ms);

    /// Subscribe to healthy<->unhealthy transitions.
    void addObserver(std::shared_ptr<obs::HealthObserver> observer);

    [[nodiscard]] const HealthThresholds& thresholds() const noexcept { return thresholds_; }

    [[nodiscard]] std::size_t size() const;

private:
    struct Slot {
        mutable std::mutex   mu;
        InstanceHealthRecord rec;
    };

    std::shared_ptr<Slot> find(std::string_view instance_id) const;
    std::shared_ptr<Slot> findOrCreate(std::string_view instance_id);
    void apply(std::string_view instance_id, bool success, double response_time_ms);
    void notify(const obs::HealthTransition& t);

private:
    const HealthThresholds thresholds_;

    mutable std::shared_mutex index_mu_;
    StringMap<std::shared_ptr<Slot>> slots_;

    std::mutex observers_mu_;
    std::vector<std::shared_ptr<obs::HealthObserver>> observers_;
};

} // namespace conduit::routing

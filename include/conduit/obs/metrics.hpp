#pragma once
/**
 * @file metrics.hpp
 * @brief Process-lifetime request counters for operational visibility.
 * @details Writers only touch atomics of the slot they address; the slot index is
 *          write-locked only when a new service or instance is first seen. Snapshots
 *          read the same atomics and never block writers.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>

#include "conduit/routing/string_key.hpp"

namespace conduit::obs {

    /** @enum Outcome
     *  @brief Final result of one dispatched request.
     */
    enum class Outcome : std::uint8_t {
        Success,  ///< Backend response relayed (2xx-4xx)
        Failure,  ///< Retries exhausted, timeout, unreachable, no healthy instance
        Rejected  ///< Shed before any network attempt (circuit open, rate limited)
    };

    std::string_view to_string(Outcome o) noexcept;

    /** @struct ServiceCounters
     *  @brief Request-level counters of one service.
     */
    struct ServiceCounters {
        uint64_t requests{0};
        uint64_t successes{0};
        uint64_t failures{0};
        uint64_t rejected{0};
        double   avg_latency_ms{0.0};
    };

    /** @struct InstanceCounters
     *  @brief Counters of one instance.
     *  @details requests/successes/failures count final outcomes served by the
     *           instance; attempts/attempt_failures/avg_latency_ms count every
     *           network attempt made against it (retries included).
     */
    struct InstanceCounters {
        uint64_t requests{0};
        uint64_t successes{0};
        uint64_t failures{0};
        uint64_t attempts{0};
        uint64_t attempt_failures{0};
        double   avg_latency_ms{0.0};
    };

    /** @struct RequestMetricsSnapshot
     *  @brief Point-in-time copy of every counter.
     */
    struct RequestMetricsSnapshot {
        uint64_t total_requests{0};
        uint64_t success_count{0};
        uint64_t failure_count{0};
        uint64_t rejected_count{0};
        double   average_response_time_ms{0.0};
        double   failure_rate{0.0};          ///< failure_count / total_requests, 0 when idle
        int64_t  active_connections{0};
        std::map<std::string, ServiceCounters>  per_service;
        std::map<std::string, InstanceCounters> per_instance;
        std::chrono::system_clock::time_point   taken_at{};
    };

    /// failures / total, or 0 when total == 0.
    double failure_rate(uint64_t failures, uint64_t total) noexcept;

    /** @class MetricsAggregator
     *  @brief Cumulative counters, read-only to everyone but the dispatch path.
     *  @details Per-service and per-instance slots are never evicted: history of an
     *           unregistered instance stays visible in snapshots. Growth is bounded by
     *           the number of distinct ids ever dispatched to; reset() drops them all.
     */
    class MetricsAggregator {
    public:
        MetricsAggregator() = default;
        MetricsAggregator(const MetricsAggregator&) = delete;
        MetricsAggregator& operator=(const MetricsAggregator&) = delete;

        /// Record the final outcome of one request. `instance_id` may be empty.
        void record(std::string_view service, std::string_view instance_id,
                    Outcome outcome, double latency_ms);

        /// Record one network attempt against an instance.
        void recordAttempt(std::string_view instance_id, bool success, double latency_ms);

        /// Gateway-wide open upstream connections gauge.
        void connectionOpened() noexcept { active_.fetch_add(1, std::memory_order_relaxed); }
        void connectionClosed() noexcept;

        [[nodiscard]] RequestMetricsSnapshot snapshot() const;

        /// Zero every counter (operator action; open connections are kept).
        void reset();

    private:
        struct Counter {
            std::atomic<uint64_t> requests{0}, successes{0}, failures{0}, rejected{0};
            std::atomic<uint64_t> latency_samples{0};
            std::atomic<double>   latency_sum_ms{0.0};

            void add(Outcome o, double latency_ms) noexcept;
            double average() const noexcept;
        };
        struct InstanceSlot {
            Counter served;
            std::atomic<uint64_t> attempts{0}, attempt_failures{0};
            std::atomic<double>   attempt_latency_sum_ms{0.0};
        };
        struct Slots {
            Counter totals;
            mutable std::shared_mutex mu;
            routing::StringMap<std::shared_ptr<Counter>>      services;
            routing::StringMap<std::shared_ptr<InstanceSlot>> instances;
        };

        template <class T>
        static std::shared_ptr<T> slot(Slots& s, routing::StringMap<std::shared_ptr<T>>& m, std::string_view key);

        std::shared_ptr<Slots> current() const;

        mutable std::shared_mutex swap_mu_;           ///< Guards slots_ pointer for reset()
        std::shared_ptr<Slots> slots_{std::make_shared<Slots>()};
        std::atomic<int64_t> active_{0};
    };

} // namespace conduit::obs

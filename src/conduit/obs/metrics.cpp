/**
 * @file metrics.cpp
 * @brief Lock-free counter updates; the running average is sum/count, which equals the
 *        incremental form avg_n = (avg_{n-1} * (n-1) + x_n) / n.
 */
#include "conduit/obs/metrics.hpp"

#include <mutex>

namespace conduit::obs {

    std::string_view to_string(Outcome o) noexcept {
        switch (o) {
            case Outcome::Success:  return "success";
            case Outcome::Failure:  return "failure";
            case Outcome::Rejected: return "rejected";
        }
        return "failure";
    }

    double failure_rate(uint64_t failures, uint64_t total) noexcept {
        return total == 0 ? 0.0 : static_cast<double>(failures) / static_cast<double>(total);
    }

    void MetricsAggregator::Counter::add(Outcome o, double latency_ms) noexcept {
        requests.fetch_add(1, std::memory_order_relaxed);
        switch (o) {
            case Outcome::Success:  successes.fetch_add(1, std::memory_order_relaxed); break;
            case Outcome::Failure:  failures.fetch_add(1, std::memory_order_relaxed);  break;
            case Outcome::Rejected: rejected.fetch_add(1, std::memory_order_relaxed);  return; // no latency
        }
        latency_sum_ms.fetch_add(latency_ms, std::memory_order_relaxed);
        latency_samples.fetch_add(1, std::memory_order_relaxed);
    }

    double MetricsAggregator::Counter::average() const noexcept {
        const auto n = latency_samples.load(std::memory_order_relaxed);
        return n == 0 ? 0.0 : latency_sum_ms.load(std::memory_order_relaxed) / static_cast<double>(n);
    }

    template <class T>
    std::shared_ptr<T> MetricsAggregator::slot(Slots& s, routing::StringMap<std::shared_ptr<T>>& m,
                                               std::string_view key) {
        {
            std::shared_lock lk(s.mu);
            if (auto it = m.find(key); it != m.end()) return it->second;
        }
        std::unique_lock lk(s.mu);
        auto [it, inserted] = m.try_emplace(std::string(key), nullptr);
        if (inserted) it->second = std::make_shared<T>();
        return it->second;
    }

    std::shared_ptr<MetricsAggregator::Slots> MetricsAggregator::current() const {
        std::shared_lock lk(swap_mu_);
        return slots_;
    }

    void MetricsAggregator::record(std::string_view service, std::string_view instance_id,
                                   Outcome outcome, double latency_ms) {
        auto s = current();
        s->totals.add(outcome, latency_ms);
        if (!service.empty()) slot(*s, s->services, service)->add(outcome, latency_ms);
        if (!instance_id.empty()) slot(*s, s->instances, instance_id)->served.add(outcome, latency_ms);
    }

    void MetricsAggregator::recordAttempt(std::string_view instance_id, bool success, double latency_ms) {
        if (instance_id.empty()) return;
        auto s = current();
        auto inst = slot(*s, s->instances, instance_id);
        inst->attempts.fetch_add(1, std::memory_order_relaxed);
        if (!success) inst->attempt_failures.fetch_add(1, std::memory_order_relaxed);
        inst->attempt_latency_sum_ms.fetch_add(latency_ms, std::memory_order_relaxed);
    }

    void MetricsAggregator::connectionClosed() noexcept {
        // Floor at zero: an unmatched close must not drive the gauge negative.
        auto cur = active_.load(std::memory_order_relaxed);
        while (cur > 0 && !active_.compare_exchange_weak(cur, cur - 1, std::memory_order_relaxed)) {}
    }

    RequestMetricsSnapshot MetricsAggregator::snapshot() const {
        auto s = current();
        RequestMetricsSnapshot out;
        out.taken_at = std::chrono::system_clock::now();
        out.total_requests = s->totals.requests.load(std::memory_order_relaxed);
        out.success_count  = s->totals.successes.load(std::memory_order_relaxed);
        out.failure_count  = s->totals.failures.load(std::memory_order_relaxed);
        out.rejected_count = s->totals.rejected.load(std::memory_order_relaxed);
        out.average_response_time_ms = s->totals.average();
        out.failure_rate = failure_rate(out.failure_count, out.total_requests);
        out.active_connections = active_.load(std::memory_order_relaxed);

        std::shared_lock lk(s->mu);
        for (const auto& [name, c] : s->services) {
            out.per_service.emplace(name, ServiceCounters{
                c->requests.load(std::memory_order_relaxed),
                c->successes.load(std::memory_order_relaxed),
                c->failures.load(std::memory_order_relaxed),
                c->rejected.load(std::memory_order_relaxed),
                c->average()});
        }
        for (const auto& [id, inst] : s->instances) {
            InstanceCounters ic;
            ic.requests  = inst->served.requests.load(std::memory_order_relaxed);
            ic.successes = inst->served.successes.load(std::memory_order_relaxed);
            ic.failures  = inst->served.failures.load(std::memory_order_relaxed);
            ic.attempts  = inst->attempts.load(std::memory_order_relaxed);
            ic.attempt_failures = inst->attempt_failures.load(std::memory_order_relaxed);
            ic.avg_latency_ms = ic.attempts == 0 ? 0.0
                : inst->attempt_latency_sum_ms.load(std::memory_order_relaxed) / static_cast<double>(ic.attempts);
            out.per_instance.emplace(id, ic);
        }
        return out;
    }

    void MetricsAggregator::reset() {
        auto fresh = std::make_shared<Slots>();
        std::unique_lock lk(swap_mu_);
        slots_ = std::move(fresh);
    }

} // namespace conduit::obs

/**
 * @file health_tracker.cpp
 * @brief Implementation of the consecutive failure/success transition rule.
 */
#include "conduit/routing/health_tracker.hpp"

#include <algorithm>
#include <unordered_set>

namespace conduit::routing {

std::shared_ptr<HealthTracker::Slot> HealthTracker::find(std::string_view id) const {
    std::shared_lock lk(index_mu_);
    auto it = slots_.find(id);
    return it == slots_.end() ? nullptr : it->second;
}

std::shared_ptr<HealthTracker::Slot> HealthTracker::findOrCreate(std::string_view id) {
    if (auto s = find(id)) return s;
    std::unique_lock lk(index_mu_);
    auto [it, inserted] = slots_.try_emplace(std::string(id), nullptr);
    if (inserted) {
        it->second = std::make_shared<Slot>();
        it->second->rec.instance_id = std::string(id);
    }
    return it->second;
}

void HealthTracker::track(std::string_view id) {
    (void)findOrCreate(id);
}

void HealthTracker::retain(const std::vector<std::string>& live_ids) {
    std::unordered_set<std::string_view> live(live_ids.begin(), live_ids.end());
    std::unique_lock lk(index_mu_);
    std::erase_if(slots_, [&](const auto& kv) { return !live.contains(kv.first); });
}

bool HealthTracker::forget(std::string_view id) {
    std::unique_lock lk(index_mu_);
    auto it = slots_.find(id);
    if (it == slots_.end()) return false;
    slots_.erase(it);
    return true;
}

bool HealthTracker::isHealthy(std::string_view id) const {
    auto s = find(id);
    if (!s) return true; // no record: assume healthy
    std::lock_guard lk(s->mu);
    return s->rec.healthy;
}

InstanceStatus HealthTracker::status(std::string_view id) const {
    auto s = find(id);
    if (!s) return InstanceStatus::Unknown;
    std::lock_guard lk(s->mu);
    if (!s->rec.observed) return InstanceStatus::Unknown;
    return s->rec.healthy ? InstanceStatus::Healthy : InstanceStatus::Unhealthy;
}

std::optional<InstanceHealthRecord> HealthTracker::record(std::string_view id) const {
    auto s = find(id);
    if (!s) return std::nullopt;
    std::lock_guard lk(s->mu);
    return s->rec;
}

std::vector<InstanceHealthRecord> HealthTracker::records() const {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::shared_lock lk(index_mu_);
        slots.reserve(slots_.size());
        for (const auto& kv : slots_) slots.push_back(kv.second);
    }
    std::vector<InstanceHealthRecord> out;
    out.reserve(slots.size());
    for (const auto& s : slots) {
        std::lock_guard lk(s->mu);
        out.push_back(s->rec);
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.instance_id < b.instance_id;
    });
    return out;
}

std::size_t HealthTracker::size() const {
    std::shared_lock lk(index_mu_);
    return slots_.size();
}

void HealthTracker::recordSuccess(std::string_view id, double response_time_ms) {
    apply(id, true, response_time_ms);
}

void HealthTracker::recordFailure(std::string_view id, double response_time_ms) {
    apply(id, false, response_time_ms);
}

void HealthTracker::apply(std::string_view id, bool success, double response_time_ms) {
    // Late outcomes for unregistered instances must not resurrect their record.
    auto slot = find(id);
    if (!slot) return;
    std::optional<obs::HealthTransition> transition;
    {
        std::lock_guard lk(slot->mu);
        auto& r = slot->rec;
        r.observed = true;
        r.last_response_time_ms = response_time_ms;
        r.last_checked_at = std::chrono::system_clock::now();

        if (success) {
            r.consecutive_failures = 0;
            ++r.consecutive_successes;
            if (!r.healthy && r.consecutive_successes >= thresholds_.recovery_threshold) {
                r.healthy = true;
                transition = obs::HealthTransition{r.instance_id, obs::HealthEvent::InstanceRecovered,
                                                   r.consecutive_failures, r.consecutive_successes,
                                                   r.last_checked_at};
            }
        } else {
            r.consecutive_successes = 0;
            ++r.consecutive_failures;
            if (r.healthy && r.consecutive_failures >= thresholds_.failure_threshold) {
                r.healthy = false;
                transition = obs::HealthTransition{r.instance_id, obs::HealthEvent::InstanceFailed,
                                                   r.consecutive_failures, r.consecutive_successes,
                                                   r.last_checked_at};
            }
        }
    }
    // Observers run outside the record lock so they may query the tracker.
    if (transition) notify(*transition);
}

void HealthTracker::addObserver(std::shared_ptr<obs::HealthObserver> observer) {
    if (!observer) return;
    std::lock_guard lk(observers_mu_);
    observers_.push_back(std::move(observer));
}

void HealthTracker::notify(const obs::HealthTransition& t) {
    std::vector<std::shared_ptr<obs::HealthObserver>> targets;
    {
        std::lock_guard lk(observers_mu_);
        targets = observers_;
    }
    for (const auto& o : targets) o->onTransition(t);
}

} // namespace conduit::routing

#include "conduit/routing/circuit_breaker.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "conduit/obs/logging.hpp"

namespace conduit::routing {

std::string_view to_string(BreakerState s) noexcept {
    switch (s) {
        case BreakerState::Closed:   return "closed";
        case BreakerState::Open:     return "open";
        case BreakerState::HalfOpen: return "half-open";
    }
    return "closed";
}

CircuitBreaker::CircuitBreaker(std::string service, BreakerConfig cfg)
    : service_(std::move(service)), cfg_(cfg), log_(obs::logger("breaker")) {}

bool CircuitBreaker::allowRequest(Clock::time_point now) {
    std::lock_guard lk(mu_);
    switch (state_) {
        case BreakerState::Closed:
            return true;

        case BreakerState::Open:
            if (now - last_failure_at_ >= cfg_.reset_timeout) {
                transitionTo(BreakerState::HalfOpen);
                trial_in_flight_ = true;
                return true;
            }
            ++rejected_;
            return false;

        case BreakerState::HalfOpen:
            if (!trial_in_flight_) {
                trial_in_flight_ = true;
                return true;
            }
            ++rejected_;
            return false;
    }
    return false;
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard lk(mu_);
    switch (state_) {
        case BreakerState::Closed:
            failures_ = 0;
            break;
        case BreakerState::HalfOpen:
            transitionTo(BreakerState::Closed);
            break;
        case BreakerState::Open:
            // late outcome of a request admitted before the breaker opened
            break;
    }
}

void CircuitBreaker::recordFailure(Clock::time_point now) {
    std::lock_guard lk(mu_);
    switch (state_) {
        case BreakerState::Closed:
            ++failures_;
            last_failure_at_ = now;
            if (failures_ >= cfg_.failure_threshold) transitionTo(BreakerState::Open);
            break;
        case BreakerState::HalfOpen:
            ++failures_;
            last_failure_at_ = now;
            transitionTo(BreakerState::Open);
            break;
        case BreakerState::Open:
            break;
    }
}

void CircuitBreaker::reset() {
    std::lock_guard lk(mu_);
    transitionTo(BreakerState::Closed);
}

BreakerState CircuitBreaker::state() const {
    std::lock_guard lk(mu_);
    return state_;
}

std::uint32_t CircuitBreaker::failureCount() const {
    std::lock_guard lk(mu_);
    return failures_;
}

BreakerStats CircuitBreaker::stats() const {
    std::lock_guard lk(mu_);
    return BreakerStats{service_, state_, failures_, rejected_, times_opened_, last_failure_at_};
}

void CircuitBreaker::transitionTo(BreakerState next) {
    const BreakerState prev = state_;
    state_ = next;
    trial_in_flight_ = false;
    switch (next) {
        case BreakerState::Closed:
            failures_ = 0;
            if (prev != BreakerState::Closed) log_->info("circuit '{}' closed", service_);
            break;
        case BreakerState::Open:
            ++times_opened_;
            log_->warn("circuit '{}' opened after {} consecutive failures (retry in {} ms)",
                       service_, failures_, cfg_.reset_timeout.count());
            break;
        case BreakerState::HalfOpen:
            log_->info("circuit '{}' half-open, admitting one trial request", service_);
            break;
    }
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get(std::string_view service) {
    {
        std::shared_lock lk(mu_);
        if (auto it = breakers_.find(service); it != breakers_.end()) return it->second;
    }
    std::unique_lock lk(mu_);
    auto [it, inserted] = breakers_.try_emplace(std::string(service), nullptr);
    if (inserted) it->second = std::make_shared<CircuitBreaker>(std::string(service), cfg_);
    return it->second;
}

std::vector<BreakerStats> CircuitBreakerRegistry::allStats() const {
    std::vector<BreakerStats> out;
    {
        std::shared_lock lk(mu_);
        out.reserve(breakers_.size());
        for (const auto& kv : breakers_) out.push_back(kv.second->stats());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.service < b.service; });
    return out;
}

std::size_t CircuitBreakerRegistry::size() const {
    std::shared_lock lk(mu_);
    return breakers_.size();
}

} // namespace conduit::routing

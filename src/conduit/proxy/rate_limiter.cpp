#include "conduit/proxy/rate_limiter.hpp"

#include <vector>

namespace conduit::proxy {

RateDecision RateLimiter::admit(const routing::Route& route, std::string_view client_key,
                                Clock::time_point now) {
    if (!route.rate_limit) return {};
    const auto& limit = *route.rate_limit;

    auto rw = windows(route);
    std::lock_guard lk(rw->mu);
    rw->length = limit.window;

    auto [it, inserted] = rw->clients.try_emplace(std::string(client_key));
    Window& w = it->second;
    if (inserted || now - w.start >= limit.window) {
        w.start = now;
        w.count = 0;
    }

    if (w.count >= limit.max_requests) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(w.start + limit.window - now);
        return RateDecision{false, 0, left};
    }
    ++w.count;
    return RateDecision{true, limit.max_requests - w.count, std::chrono::milliseconds{0}};
}

std::size_t RateLimiter::purgeExpired(Clock::time_point now) {
    std::vector<std::shared_ptr<RouteWindows>> all;
    {
        std::shared_lock lk(mu_);
        all.reserve(routes_.size());
        for (const auto& kv : routes_) all.push_back(kv.second);
    }
    std::size_t removed = 0;
    for (auto& rw : all) {
        std::lock_guard lk(rw->mu);
        removed += std::erase_if(rw->clients, [&](const auto& kv) { return now - kv.second.start >= rw->length; });
    }
    return removed;
}

std::shared_ptr<RateLimiter::RouteWindows> RateLimiter::windows(const routing::Route& route) {
    {
        std::shared_lock lk(mu_);
        if (auto it = routes_.find(route.pattern); it != routes_.end()) return it->second;
    }
    std::unique_lock lk(mu_);
    auto [it, inserted] = routes_.try_emplace(route.pattern, nullptr);
    if (inserted) it->second = std::make_shared<RouteWindows>();
    return it->second;
}

} // namespace conduit::proxy

#include "conduit/routing/load_balancer.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "conduit/obs/logging.hpp"
#include "conduit/obs/metrics.hpp"
#include "conduit/routing/service_registry.hpp"

namespace conduit::routing {

LoadBalancer::LoadBalancer(ServiceRegistry& registry, HealthTracker& health,
                           obs::MetricsAggregator& metrics, BalancerConfig cfg)
    : registry_(registry), health_(health), metrics_(metrics), cfg_(cfg),
      log_(obs::logger("balancer")) {}

std::optional<ServiceInstance>
LoadBalancer::selectInstance(std::string_view service, std::string_view client_key, Clock::time_point now) {
    return select(service, client_key, {}, now);
}

std::optional<ServiceInstance>
LoadBalancer::selectInstance(std::string_view service, std::string_view client_key,
                             std::string_view avoid_instance, Clock::time_point now) {
    return select(service, client_key, avoid_instance, now);
}

std::optional<ServiceInstance>
LoadBalancer::select(std::string_view service, std::string_view client_key,
                     std::string_view avoid_instance, Clock::time_point now) {
    InstanceList healthy = registry_.getInstances(service);
    if (healthy.empty()) {
        log_->debug("select: service '{}' has no registered instances", service);
        return std::nullopt;
    }
    std::erase_if(healthy, [](const ServiceInstance& i) { return i.status == InstanceStatus::Unhealthy; });

    if (!avoid_instance.empty() && healthy.size() > 1) {
        std::erase_if(healthy, [&](const ServiceInstance& i) { return i.id == avoid_instance; });
    }
    if (healthy.empty()) {
        log_->warn("select: no healthy instance for service '{}'", service);
        return std::nullopt;
    }

    auto st = serviceState(service);
    const bool sticky = cfg_.sticky_sessions && !client_key.empty();

    if (sticky) {
        if (auto bound = st->sessions.lookup(client_key, now)) {
            auto it = std::find_if(healthy.begin(), healthy.end(),
                                   [&](const ServiceInstance& i) { return i.id == *bound; });
            if (it != healthy.end()) {
                st->sessions.bind(client_key, it->id, now);
                return *it;
            }
        }
    }

    std::vector<Candidate> cands;
    cands.reserve(healthy.size());
    for (const auto& inst : healthy) {
        Candidate c{&inst, 0, 0.0};
        if (auto s = findStats(inst.id)) {
            c.connections = s->connections.load(std::memory_order_relaxed);
            std::lock_guard lk(s->mu);
            c.avg_response_ms = s->avg_ms;
        }
        cands.push_back(c);
    }

    SelectionContext ctx{};
    ctx.client_key = client_key;
    ctx.seed = cfg_.hash_seed;
    if (cfg_.algorithm == Algorithm::RoundRobin || cfg_.algorithm == Algorithm::WeightedRoundRobin) {
        ctx.tick = st->tick.fetch_add(1, std::memory_order_relaxed);
    }

    ServiceInstance chosen = *cands[choose(cfg_.algorithm, cands, ctx)].instance;
    if (sticky) st->sessions.bind(client_key, chosen.id, now);
    return chosen;
}

void LoadBalancer::recordSuccess(std::string_view instance_id, double response_time_ms) {
    health_.recordSuccess(instance_id, response_time_ms);
    sample(instance_id, response_time_ms);
    metrics_.recordAttempt(instance_id, true, response_time_ms);
}

void LoadBalancer::recordFailure(std::string_view instance_id, double response_time_ms) {
    health_.recordFailure(instance_id, response_time_ms);
    sample(instance_id, response_time_ms);
    metrics_.recordAttempt(instance_id, false, response_time_ms);
    if (cfg_.sticky_sessions && !health_.isHealthy(instance_id)) unbindEverywhere(instance_id);
}

void LoadBalancer::recordConnectionStart(std::string_view instance_id) {
    stats(instance_id)->connections.fetch_add(1, std::memory_order_relaxed);
    metrics_.connectionOpened();
}

void LoadBalancer::recordConnectionEnd(std::string_view instance_id) {
    auto s = findStats(instance_id);
    if (!s) return;
    auto cur = s->connections.load(std::memory_order_relaxed);
    while (cur > 0) {
        if (s->connections.compare_exchange_weak(cur, cur - 1, std::memory_order_relaxed)) {
            metrics_.connectionClosed();
            return;
        }
    }
}

std::int64_t LoadBalancer::activeConnections(std::string_view instance_id) const {
    auto s = findStats(instance_id);
    return s ? s->connections.load(std::memory_order_relaxed) : 0;
}

std::vector<InstanceHealthRecord> LoadBalancer::getInstanceHealth() const {
    std::vector<InstanceHealthRecord> out;
    auto snap = registry_.snapshot();
    for (const auto& [name, entry] : *snap) {
        for (const auto& inst : entry.instances) {
            auto rec = health_.record(inst.id);
            if (rec) {
                out.push_back(std::move(*rec));
            } else {
                InstanceHealthRecord def;
                def.instance_id = inst.id;
                out.push_back(std::move(def));
            }
        }
    }
    std::sort(out.begin(), out.end(),
              [](const auto& a, const auto& b) { return a.instance_id < b.instance_id; });
    return out;
}

std::vector<InstanceLoad> LoadBalancer::getInstanceLoad() const {
    std::vector<InstanceLoad> out;
    {
        std::shared_lock lk(stats_mu_);
        out.reserve(stats_.size());
        for (const auto& [id, s] : stats_) {
            InstanceLoad l;
            l.instance_id = id;
            l.active_connections = s->connections.load(std::memory_order_relaxed);
            std::lock_guard slk(s->mu);
            l.avg_response_ms = s->avg_ms;
            l.samples = s->samples;
            out.push_back(std::move(l));
        }
    }
    std::sort(out.begin(), out.end(),
              [](const auto& a, const auto& b) { return a.instance_id < b.instance_id; });
    return out;
}

std::size_t LoadBalancer::purgeExpiredSessions(Clock::time_point now) {
    std::vector<std::shared_ptr<ServiceState>> states;
    {
        std::shared_lock lk(services_mu_);
        states.reserve(services_.size());
        for (const auto& kv : services_) states.push_back(kv.second);
    }
    std::size_t purged = 0;
    for (auto& st : states) purged += st->sessions.purgeExpired(now);
    return purged;
}

std::size_t LoadBalancer::pruneUnregistered() {
    auto snap = registry_.snapshot();
    std::size_t removed = 0;

    std::vector<std::pair<std::shared_ptr<ServiceState>, const ServiceEntry*>> live;
    {
        std::unique_lock lk(services_mu_);
        for (auto it = services_.begin(); it != services_.end();) {
            auto entry = snap->find(it->first);
            if (entry == snap->end()) {
                it = services_.erase(it);
                ++removed;
            } else {
                live.emplace_back(it->second, &entry->second);
                ++it;
            }
        }
    }
    for (auto& [st, entry] : live) {
        // bindings can only point at instances of their own service
        std::vector<std::string> gone;
        st->sessions.forEachBoundInstance([&](std::string_view id) {
            const bool present = std::any_of(entry->instances.begin(), entry->instances.end(),
                                              [&](const ServiceInstance& i) { return i.id == id; });
            if (!present) gone.emplace_back(id);
        });
        for (const auto& id : gone) removed += st->sessions.unbindInstance(id);
    }

    StringMap<bool> registered;
    for (const auto& [name, entry] : *snap) {
        for (const auto& inst : entry.instances) registered.emplace(inst.id, true);
    }
    {
        std::unique_lock lk(stats_mu_);
        removed += std::erase_if(stats_, [&](const auto& kv) {
            return !registered.contains(kv.first) && kv.second->connections.load(std::memory_order_relaxed) == 0;
        });
    }
    if (removed > 0) log_->debug("pruned {} entries of unregistered services/instances", removed);
    return removed;
}

void LoadBalancer::unbindEverywhere(std::string_view instance_id) {
    std::vector<std::shared_ptr<ServiceState>> states;
    {
        std::shared_lock lk(services_mu_);
        states.reserve(services_.size());
        for (const auto& kv : services_) states.push_back(kv.second);
    }
    std::size_t dropped = 0;
    for (auto& st : states) dropped += st->sessions.unbindInstance(instance_id);
    if (dropped > 0) log_->debug("instance '{}' unhealthy, dropped {} sticky bindings", instance_id, dropped);
}

std::shared_ptr<LoadBalancer::ServiceState> LoadBalancer::serviceState(std::string_view service) {
    {
        std::shared_lock lk(services_mu_);
        if (auto it = services_.find(service); it != services_.end()) return it->second;
    }
    std::unique_lock lk(services_mu_);
    auto [it, inserted] = services_.try_emplace(std::string(service), nullptr);
    if (inserted) it->second = std::make_shared<ServiceState>(cfg_.session_ttl);
    return it->second;
}

std::shared_ptr<LoadBalancer::InstanceStats> LoadBalancer::findStats(std::string_view instance_id) const {
    std::shared_lock lk(stats_mu_);
    auto it = stats_.find(instance_id);
    return it == stats_.end() ? nullptr : it->second;
}

std::shared_ptr<LoadBalancer::InstanceStats> LoadBalancer::stats(std::string_view instance_id) {
    if (auto s = findStats(instance_id)) return s;
    std::unique_lock lk(stats_mu_);
    auto [it, inserted] = stats_.try_emplace(std::string(instance_id), nullptr);
    if (inserted) it->second = std::make_shared<InstanceStats>();
    return it->second;
}

void LoadBalancer::sample(std::string_view instance_id, double response_time_ms) {
    auto s = stats(instance_id);
    std::lock_guard lk(s->mu);
    ++s->samples;
    const auto n = static_cast<double>(s->samples);
    s->avg_ms = (s->avg_ms * (n - 1.0) + response_time_ms) / n;
}

} // namespace conduit::routing

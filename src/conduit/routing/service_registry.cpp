// ServiceRegistry: RCU Implementation Notes
// We implement RCU with shared_ptr snapshots:
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Writers: copy current map, mutate, atomic_store (RELEASE), serialized by write_mu_.
// The shared_ptr reference count naturally provides a grace period:
// old snapshots remain alive until the last reader drops its ref, after which
// they are reclaimed automatically (no explicit epoch/hazard management).

#include "conduit/routing/service_registry.hpp"
#include "conduit/obs/logging.hpp"
#include "conduit/proxy/http_types.hpp"
#include "conduit/version.hpp"

#include <algorithm>
#include <memory>   // atomic_load/atomic_store for shared_ptr
#include <unordered_set>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace conduit::routing {

std::string_view to_string(RegistryErr e) noexcept {
    switch (e) {
        case RegistryErr::Ok:       return "ok";
        case RegistryErr::Exists:   return "exists";
        case RegistryErr::NotFound: return "not_found";
        case RegistryErr::Invalid:  return "invalid";
        case RegistryErr::Capacity: return "capacity";
    }
    return "invalid";
}

ServiceRegistry::ServiceRegistry(HealthTracker& health,
                                 std::shared_ptr<proxy::HttpTransport> transport,
                                 HealthCheckConfig cfg)
    : health_(health),
      transport_(std::move(transport)),
      cfg_(cfg),
      log_(obs::logger("registry")) {
    if (cfg_.max_concurrency == 0) cfg_.max_concurrency = 1;
}

ServiceRegistry::~ServiceRegistry() {
    stopHealthChecks();
}

//------------------------------- Validation -----------------------------------

bool ServiceRegistry::validateId(std::string_view id, std::size_t maxLen) noexcept {
    if (id.empty() || id.size() > maxLen) return false;
    // Allow [A-Za-z0-9_.-]
    for (char c : id) {
        const bool ok = (c == '_' || c == '-' || c == '.' ||
                         (c >= '0' && c <= '9') ||
                         (c >= 'A' && c <= 'Z') ||
                         (c >= 'a' && c <= 'z'));
        if (!ok) return false;
    }
    return true;
}

bool ServiceRegistry::validateUrl(std::string_view url) noexcept {
    if (url.empty() || url.size() > Limits::MaxUrlLen) return false;
    return proxy::parse_http_url(url).has_value();
}

bool ServiceRegistry::validateRoute(const Route& r) noexcept {
    if (r.pattern.empty() || r.pattern.front() != '/') return false;
    if (!validateId(r.target_service, Limits::MaxIdLen)) return false;
    if (r.methods.empty()) return false;
    if (r.rate_limit && (r.rate_limit->max_requests == 0 || r.rate_limit->window.count() <= 0)) return false;
    if (r.timeout && r.timeout->count() <= 0) return false;
    return true;
}

bool ServiceRegistry::validateInstances(const Map& current, std::string_view service,
                                        std::span<const ServiceInstance> instances) const noexcept {
    if (instances.size() > Limits::MaxInstancesPerService) return false;
    // unique ids within the service, fields within limits, valid URL, weight >= 1
    std::unordered_set<std::string_view> ids;
    for (const auto& i : instances) {
        if (!validateId(i.id, Limits::MaxIdLen)) return false;
        if (!validateUrl(i.url)) return false;
        if (i.weight < 1 || i.weight > config::constants::INSTANCE_WEIGHT_MAX) return false;
        if (!ids.insert(i.id).second) return false;
    }
    // ids are registry-wide keys (health, connections, affinity)
    for (const auto& [name, entry] : current) {
        if (name == service) continue;
        for (const auto& other : entry.instances) {
            if (ids.contains(other.id)) return false;
        }
    }
    return true;
}

//------------------------------- Snapshots ------------------------------------

std::shared_ptr<const ServiceRegistry::Map>
ServiceRegistry::snapshot() const noexcept {
    // RCU read: acquire ensures any reader observing the pointer also observes
    // the fully constructed map published with RELEASE in writer path.
    return std::atomic_load_explicit(&map_, std::memory_order_acquire);
}

std::shared_ptr<const RouteList>
ServiceRegistry::routeSnapshot() const noexcept {
    return std::atomic_load_explicit(&routes_, std::memory_order_acquire);
}

void ServiceRegistry::publish(std::shared_ptr<Map> next) {
    // RCU update: publish new snapshot. RELEASE pairs with reader ACQUIRE so that
    // all prior writes to *next (the new map) are visible to readers that load it.
    std::shared_ptr<const Map> cnext = std::move(next); // convert Map -> const Map
    std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

void ServiceRegistry::publishRoutes(std::shared_ptr<RouteList> next) {
    std::shared_ptr<const RouteList> cnext = std::move(next);
    std::atomic_store_explicit(&routes_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

void ServiceRegistry::syncHealthRecords(const Map& m) {
    std::vector<std::string> live;
    for (const auto& [name, entry] : m) {
        for (const auto& i : entry.instances) {
            health_.track(i.id);
            live.push_back(i.id);
        }
    }
    health_.retain(live);
}

//------------------------------- Services -------------------------------------

RegistryErr ServiceRegistry::registerService(const ServiceDefinition& def,
                                             std::span<const ServiceInstance> instances) {
    if (!validateId(def.name, Limits::MaxIdLen)) return fail(RegistryErr::Invalid);
    if (def.health_check_path.empty() || def.health_check_path.front() != '/') return fail(RegistryErr::Invalid);
    if (def.base_timeout.count() <= 0) return fail(RegistryErr::Invalid);

    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (!validateInstances(*snap, def.name, instances)) return fail(RegistryErr::Invalid);

    const auto existing = snap->find(std::string_view(def.name));
    if (existing == snap->end() && snap->size() >= Limits::MaxServices) {
        return fail(RegistryErr::Capacity);
    }

    ServiceEntry entry{def, InstanceList(instances.begin(), instances.end())};
    for (auto& i : entry.instances) i.status = InstanceStatus::Unknown; // derived on read
    if (existing != snap->end() && existing->second == entry) {
        registrations_.fetch_add(1, std::memory_order_relaxed);
        return RegistryErr::Ok; // identical content: nothing to publish
    }

    auto next = std::make_shared<Map>(*snap); // copy-on-write
    next->insert_or_assign(def.name, std::move(entry));
    syncHealthRecords(*next);
    publish(std::move(next));
    registrations_.fetch_add(1, std::memory_order_relaxed);

    log_->info("service registered name={} instances={}", def.name, instances.size());
    return RegistryErr::Ok;
}

bool ServiceRegistry::unregisterService(std::string_view name) {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (snap->find(name) == snap->end()) return false;

    auto next = std::make_shared<Map>(*snap);
    next->erase(next->find(name));
    syncHealthRecords(*next);
    publish(std::move(next));
    removals_.fetch_add(1, std::memory_order_relaxed);

    log_->info("service unregistered name={}", name);
    return true;
}

void ServiceRegistry::clear() {
    std::lock_guard<std::mutex> lk(write_mu_);
    publish(std::make_shared<Map>());
    publishRoutes(std::make_shared<RouteList>());
    health_.retain({});
    // Not counting as failure/success here; treated as maintenance op.
}

std::optional<ServiceDefinition> ServiceRegistry::getService(std::string_view name) const {
    auto snap = snapshot();
    auto it = snap->find(name);
    if (it == snap->end()) return std::nullopt;
    return it->second.definition;
}

InstanceList ServiceRegistry::getInstances(std::string_view name) const {
    auto snap = snapshot();
    auto it = snap->find(name);
    if (it == snap->end()) return {};
    InstanceList out = it->second.instances; // copy
    for (auto& i : out) i.status = health_.status(i.id);
    return out;
}

bool ServiceRegistry::hasService(std::string_view name) const noexcept {
    auto snap = snapshot();
    return snap && (snap->find(name) != snap->end());
}

std::size_t ServiceRegistry::size() const noexcept {
    auto snap = snapshot();
    return snap ? snap->size() : 0;
}

std::vector<std::string> ServiceRegistry::listServices() const {
    std::vector<std::string> out;
    auto snap = snapshot();
    out.reserve(snap->size());
    for (const auto& kv : *snap) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

//------------------------------- Routes ---------------------------------------

RegistryErr ServiceRegistry::addRoute(Route route) {
    if (!validateRoute(route)) return fail(RegistryErr::Invalid);

    std::lock_guard<std::mutex> lk(write_mu_);
    auto current = routeSnapshot();
    if (current->size() >= Limits::MaxRoutes) return fail(RegistryErr::Capacity);

    auto next = std::make_shared<RouteList>(*current);
    log_->debug("route added {} -> {}", route.pattern, route.target_service);
    next->push_back(std::move(route));
    publishRoutes(std::move(next));
    return RegistryErr::Ok;
}

RegistryErr ServiceRegistry::setRoutes(RouteList routes) {
    if (routes.size() > Limits::MaxRoutes) return fail(RegistryErr::Capacity);
    for (const auto& r : routes) {
        if (!validateRoute(r)) return fail(RegistryErr::Invalid);
    }
    std::lock_guard<std::mutex> lk(write_mu_);
    const auto n = routes.size();
    publishRoutes(std::make_shared<RouteList>(std::move(routes)));
    log_->info("route table loaded routes={}", n);
    return RegistryErr::Ok;
}

std::optional<Route> ServiceRegistry::resolveRoute(std::string_view path, std::string_view method) const {
    auto table = routeSnapshot();
    const Route* best = nullptr;
    std::size_t best_rank = 0;
    for (const auto& r : *table) {
        if (!r.acceptsMethod(method) || !r.matchesPath(path)) continue;
        const auto rank = r.specificity();
        // Strictly greater: earlier declarations win ties.
        if (!best || rank > best_rank) {
            best = &r;
            best_rank = rank;
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

RouteList ServiceRegistry::routes() const {
    return *routeSnapshot();
}

//------------------------------- Health ---------------------------------------

HealthCheckResult ServiceRegistry::checkHealth(std::string_view instance_id, std::stop_token stop) {
    HealthCheckResult result;
    result.instance_id = std::string(instance_id);

    // Locate the instance and its service's health path in the current snapshot.
    auto snap = snapshot();
    const ServiceInstance* inst = nullptr;
    const ServiceDefinition* def = nullptr;
    for (const auto& [name, entry] : *snap) {
        for (const auto& i : entry.instances) {
            if (i.id == instance_id) { inst = &i; def = &entry.definition; break; }
        }
        if (inst) break;
    }
    if (!inst) {
        result.error = "unknown instance";
        return result;
    }

    std::string url = inst->url;
    while (!url.empty() && url.back() == '/') url.pop_back();
    url += def->health_check_path;

    proxy::OutboundRequest req;
    req.method = "GET";
    req.url = std::move(url);
    req.headers.emplace_back("User-Agent", user_agent);

    const auto start = std::chrono::steady_clock::now();
    auto res = transport_->send(req, cfg_.timeout, stop);
    result.response_time_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    if (!res) {
        if (res.error().kind == proxy::TransportErrorKind::Cancelled) {
            result.error = "cancelled";
            return result; // shutdown is not evidence about the instance
        }
        result.error = std::string(proxy::to_string(res.error().kind)) + ": " + res.error().message;
    } else {
        result.status_code = res->status;
        result.healthy = res->status >= 200 && res->status < 300;
        if (!result.healthy) result.error = "status " + std::to_string(res->status);
    }

    if (result.healthy) {
        health_.recordSuccess(result.instance_id, result.response_time_ms);
    } else {
        health_.recordFailure(result.instance_id, result.response_time_ms);
        log_->debug("health check failed instance={} error={}", result.instance_id, result.error);
    }
    return result;
}

std::vector<HealthCheckResult> ServiceRegistry::runHealthSweep(std::stop_token stop) {
    std::vector<std::string> ids;
    {
        auto snap = snapshot();
        for (const auto& [name, entry] : *snap) {
            for (const auto& i : entry.instances) ids.push_back(i.id);
        }
    }
    std::vector<HealthCheckResult> results(ids.size());
    if (ids.empty()) return results;

    boost::asio::thread_pool pool(std::min(cfg_.max_concurrency, ids.size()));
    for (std::size_t k = 0; k < ids.size(); ++k) {
        boost::asio::post(pool, [this, &ids, &results, k, stop] {
            if (stop.stop_requested()) {
                results[k].instance_id = ids[k];
                results[k].error = "cancelled";
                return;
            }
            try {
                results[k] = checkHealth(ids[k], stop);
            } catch (const std::exception& e) {
                // A probe failure never escapes the sweep; treat it as a failed check.
                results[k].instance_id = ids[k];
                results[k].error = e.what();
                health_.recordFailure(ids[k], 0.0);
                log_->error("health probe raised instance={} what={}", ids[k], e.what());
            }
        });
    }
    pool.join();
    return results;
}

void ServiceRegistry::startHealthChecks() {
    std::lock_guard<std::mutex> lk(loop_mu_);
    if (loop_.joinable()) return;
    loop_ = std::jthread([this](std::stop_token st) { loop(st); });
    log_->info("health checks started interval_ms={} concurrency={}",
               cfg_.interval.count(), cfg_.max_concurrency);
}

void ServiceRegistry::stopHealthChecks() {
    std::jthread t;
    {
        std::lock_guard<std::mutex> lk(loop_mu_);
        if (!loop_.joinable()) return;
        t = std::move(loop_);
    }
    t.request_stop();
    t.join();
    log_->info("health checks stopped");
}

bool ServiceRegistry::healthChecksRunning() const noexcept {
    std::lock_guard<std::mutex> lk(loop_mu_);
    return loop_.joinable();
}

void ServiceRegistry::loop(std::stop_token stop) {
    std::mutex wait_mu;
    while (!stop.stop_requested()) {
        const auto results = runHealthSweep(stop);
        const auto healthy = std::count_if(results.begin(), results.end(),
                                           [](const auto& r) { return r.healthy; });
        log_->debug("health sweep done probed={} healthy={}", results.size(), healthy);

        std::unique_lock<std::mutex> lk(wait_mu);
        // Returns early when stop is requested.
        loop_cv_.wait_for(lk, stop, cfg_.interval, [] { return false; });
    }
}

ServiceRegistry::Stats ServiceRegistry::stats() const {
    Stats s;
    auto snap = snapshot();
    s.services = snap->size();
    s.routes = routeSnapshot()->size();
    for (const auto& [name, entry] : *snap) {
        for (const auto& i : entry.instances) {
            ++s.instances;
            switch (health_.status(i.id)) {
                case InstanceStatus::Healthy:   ++s.healthy; break;
                case InstanceStatus::Unhealthy: ++s.unhealthy; break;
                case InstanceStatus::Unknown:   ++s.unknown; break;
            }
        }
    }
    s.registrations = registrations_.load(std::memory_order_relaxed);
    s.removals = removals_.load(std::memory_order_relaxed);
    s.failures = failures_.load(std::memory_order_relaxed);
    return s;
}

} // namespace conduit::routing

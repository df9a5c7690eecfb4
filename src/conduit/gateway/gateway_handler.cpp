#include "conduit/gateway/gateway_handler.hpp"

#include <map>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "conduit/obs/logging.hpp"
#include "conduit/obs/metrics.hpp"
#include "conduit/proxy/dispatch_error.hpp"
#include "conduit/proxy/proxy_executor.hpp"
#include "conduit/proxy/rate_limiter.hpp"
#include "conduit/routing/circuit_breaker.hpp"
#include "conduit/routing/load_balancer.hpp"
#include "conduit/routing/service_registry.hpp"
#include "conduit/version.hpp"

namespace conduit::gateway {

using json = nlohmann::json;
using proxy::DispatchError;
using proxy::DispatchErrorKind;
using proxy::HttpResponse;

namespace {

HttpResponse json_response(unsigned status, const json& data) {
    HttpResponse r;
    r.status = status;
    r.headers.emplace_back("Content-Type", "application/json");
    r.body = json{{"success", true}, {"data", data}}.dump();
    return r;
}

HttpResponse error_response(DispatchErrorKind kind, std::string message) {
    return proxy::to_response(DispatchError{kind, std::move(message), std::nullopt, std::nullopt});
}

std::int64_t epoch_ms(std::chrono::system_clock::time_point tp) {
    if (tp == std::chrono::system_clock::time_point{}) return 0;
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

GatewayHandler::GatewayHandler(routing::ServiceRegistry& registry,
                               routing::LoadBalancer& balancer,
                               routing::CircuitBreakerRegistry& breakers,
                               obs::MetricsAggregator& metrics,
                               proxy::ProxyExecutor& executor,
                               proxy::RateLimiter& limiter)
    : registry_(registry), balancer_(balancer), breakers_(breakers), metrics_(metrics),
      executor_(executor), limiter_(limiter), log_(obs::logger("gateway")),
      started_(std::chrono::steady_clock::now()) {}

bool GatewayHandler::isOpsEndpoint(std::string_view method, std::string_view path) noexcept {
    if (method != "GET") return false;
    return path == "/health" || path == "/metrics" || path == "/instances" || path == "/services";
}

HttpResponse GatewayHandler::handle(const proxy::ProxyRequest& req, std::stop_token stop) noexcept {
    try {
        if (isOpsEndpoint(req.method, req.path)) return ops(req.path);
        return dispatch(req, stop);
    } catch (const std::exception& e) {
        log_->error("{} {}: unhandled exception during dispatch: {}", req.method, req.path, e.what());
    } catch (...) {
        log_->error("{} {}: unhandled non-standard exception during dispatch", req.method, req.path);
    }
    return error_response(DispatchErrorKind::Internal, "Internal server error");
}

HttpResponse GatewayHandler::dispatch(const proxy::ProxyRequest& req, std::stop_token stop) {
    auto route = registry_.resolveRoute(req.path, req.method);
    if (!route) {
        log_->debug("{} {}: no matching route", req.method, req.path);
        return error_response(DispatchErrorKind::RouteNotFound,
                              "Route " + req.method + " " + req.path + " not found");
    }

    const auto decision = limiter_.admit(*route, req.client_key);
    if (!decision.allowed) {
        metrics_.record(route->target_service, {}, obs::Outcome::Rejected, 0.0);
        const auto secs = std::chrono::ceil<std::chrono::seconds>(decision.retry_after);
        return proxy::to_response(DispatchError{DispatchErrorKind::RateLimited,
                                                "Too many requests, please try again later",
                                                std::nullopt, secs});
    }

    auto result = executor_.forward(req, *route, stop);
    if (result) return std::move(*result);

    const DispatchError& err = result.error();
    if (!err.upstream) {
        log_->warn("{} {} -> '{}': {} ({})", req.method, req.path, route->target_service,
                   proxy::code(err.kind), err.message);
    }
    return proxy::to_response(err);
}

HttpResponse GatewayHandler::ops(std::string_view path) const {
    if (path == "/health")    return healthView();
    if (path == "/metrics")   return metricsView();
    if (path == "/instances") return instancesView();
    return servicesView();
}

HttpResponse GatewayHandler::healthView() const {
    const auto st = registry_.stats();
    bool degraded = false;
    for (const auto& name : registry_.listServices()) {
        bool any = false;
        for (const auto& inst : registry_.getInstances(name)) {
            if (inst.status != routing::InstanceStatus::Unhealthy) { any = true; break; }
        }
        degraded = degraded || !any;
    }
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_);

    json data = {
        {"status", degraded ? "degraded" : "ok"},
        {"version", std::string(version_string)},
        {"uptimeSeconds", uptime.count()},
        {"healthChecks", registry_.healthChecksRunning()},
        {"services", st.services},
        {"routes", st.routes},
        {"instances", {{"total", st.instances}, {"healthy", st.healthy},
                       {"unhealthy", st.unhealthy}, {"unknown", st.unknown}}},
    };
    return json_response(200, data);
}

HttpResponse GatewayHandler::metricsView() const {
    const auto snap = metrics_.snapshot();
    json services = json::object();
    for (const auto& [name, c] : snap.per_service) {
        services[name] = {{"requests", c.requests}, {"successes", c.successes}, {"failures", c.failures},
                          {"rejected", c.rejected}, {"averageResponseTimeMs", c.avg_latency_ms}};
    }
    json instances = json::object();
    for (const auto& [id, c] : snap.per_instance) {
        instances[id] = {{"requests", c.requests}, {"successes", c.successes}, {"failures", c.failures},
                         {"attempts", c.attempts}, {"errors", c.attempt_failures},
                         {"averageResponseTimeMs", c.avg_latency_ms},
                         {"activeConnections", balancer_.activeConnections(id)}};
    }
    json breakers = json::array();
    for (const auto& b : breakers_.allStats()) {
        breakers.push_back({{"service", b.service}, {"state", std::string(routing::to_string(b.state))},
                            {"failureCount", b.failure_count}, {"rejected", b.rejected},
                            {"timesOpened", b.times_opened}});
    }
    json data = {
        {"totalRequests", snap.total_requests},
        {"successCount", snap.success_count},
        {"failureCount", snap.failure_count},
        {"rejectedCount", snap.rejected_count},
        {"failureRate", snap.failure_rate},
        {"averageResponseTimeMs", snap.average_response_time_ms},
        {"activeConnections", snap.active_connections},
        {"timestamp", epoch_ms(snap.taken_at)},
        {"services", std::move(services)},
        {"instances", std::move(instances)},
        {"circuitBreakers", std::move(breakers)},
    };
    return json_response(200, data);
}

HttpResponse GatewayHandler::instancesView() const {
    std::map<std::string, routing::InstanceLoad, std::less<>> load;
    for (auto& l : balancer_.getInstanceLoad()) load.emplace(l.instance_id, std::move(l));

    json arr = json::array();
    for (const auto& r : balancer_.getInstanceHealth()) {
        routing::InstanceLoad l;
        if (auto it = load.find(r.instance_id); it != load.end()) l = it->second;
        arr.push_back({{"instanceId", r.instance_id},
                       {"healthy", r.healthy},
                       {"observed", r.observed},
                       {"consecutiveFailures", r.consecutive_failures},
                       {"consecutiveSuccesses", r.consecutive_successes},
                       {"lastResponseTimeMs", r.last_response_time_ms},
                       {"lastCheckedAt", epoch_ms(r.last_checked_at)},
                       {"activeConnections", l.active_connections},
                       {"averageResponseTimeMs", l.avg_response_ms},
                       {"samples", l.samples}});
    }
    return json_response(200, arr);
}

HttpResponse GatewayHandler::servicesView() const {
    json arr = json::array();
    for (const auto& name : registry_.listServices()) {
        auto def = registry_.getService(name);
        if (!def) continue;  // unregistered since listServices()
        json insts = json::array();
        for (const auto& i : registry_.getInstances(name)) {
            insts.push_back({{"id", i.id}, {"url", i.url}, {"weight", i.weight},
                             {"status", std::string(routing::to_string(i.status))}});
        }
        arr.push_back({{"name", def->name},
                       {"healthCheckPath", def->health_check_path},
                       {"baseTimeoutMs", def->base_timeout.count()},
                       {"retryPolicy", {{"maxRetries", def->retry_policy.max_retries},
                                        {"baseDelayMs", def->retry_policy.base_delay.count()}}},
                       {"circuitBreaker", std::string(routing::to_string(breakers_.get(name)->state()))},
                       {"instances", std::move(insts)}});
    }
    return json_response(200, arr);
}

} // namespace conduit::gateway

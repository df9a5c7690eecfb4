#include "conduit/proxy/proxy_executor.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <optional>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>

#include "conduit/obs/logging.hpp"
#include "conduit/obs/metrics.hpp"
#include "conduit/routing/circuit_breaker.hpp"
#include "conduit/routing/load_balancer.hpp"
#include "conduit/routing/service_registry.hpp"

namespace conduit::proxy {

namespace {

using Clock = Timing::Clock;

double elapsed_ms(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

std::string new_request_id() {
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

/// Keeps the balancer's open-connection counter exact on every exit path.
class ConnectionGuard {
public:
    ConnectionGuard(routing::LoadBalancer& lb, std::string id) : lb_(lb), id_(std::move(id)) {
        lb_.recordConnectionStart(id_);
    }
    ~ConnectionGuard() { lb_.recordConnectionEnd(id_); }
    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

private:
    routing::LoadBalancer& lb_;
    std::string id_;
};

DispatchErrorKind map_transport(TransportErrorKind k) noexcept {
    switch (k) {
        case TransportErrorKind::ConnectionRefused:
        case TransportErrorKind::ConnectionReset:
        case TransportErrorKind::DnsFailure:  return DispatchErrorKind::UpstreamUnreachable;
        case TransportErrorKind::Timeout:     return DispatchErrorKind::UpstreamTimeout;
        case TransportErrorKind::Cancelled:   return DispatchErrorKind::ClientCancelled;
        case TransportErrorKind::Protocol:    return DispatchErrorKind::UpstreamServerError;
    }
    return DispatchErrorKind::Internal;
}

} // namespace

Timing Timing::system() {
    Timing t;
    t.now = [] { return Clock::now(); };
    t.sleep = [](std::chrono::milliseconds d, std::stop_token stop) {
        std::mutex m;
        std::condition_variable_any cv;
        std::unique_lock lk(m);
        cv.wait_for(lk, stop, d, [] { return false; });
        return !stop.stop_requested();
    };
    return t;
}

ProxyExecutor::ProxyExecutor(routing::ServiceRegistry& registry,
                             routing::LoadBalancer& balancer,
                             routing::CircuitBreakerRegistry& breakers,
                             obs::MetricsAggregator& metrics,
                             std::shared_ptr<HttpTransport> transport,
                             ProxyConfig cfg,
                             Timing timing)
    : registry_(registry), balancer_(balancer), breakers_(breakers), metrics_(metrics),
      transport_(std::move(transport)), cfg_(cfg), timing_(std::move(timing)),
      log_(obs::logger("proxy")) {}

std::chrono::milliseconds ProxyExecutor::backoff(std::chrono::milliseconds base,
                                                 std::uint32_t attempt) const noexcept {
    // 2^attempt saturates well before overflowing the rep
    const auto shift = std::min<std::uint32_t>(attempt, 30);
    const auto raw = base.count() * (std::int64_t{1} << shift);
    if (raw < 0 || raw > cfg_.max_delay.count()) return cfg_.max_delay;
    return std::chrono::milliseconds{raw};
}

OutboundRequest ProxyExecutor::buildOutbound(const ProxyRequest& req,
                                             const routing::Route& route,
                                             const routing::ServiceInstance& inst,
                                             const std::string& request_id) {
    OutboundRequest out;
    out.method = req.method;

    std::string_view base = inst.url;
    while (!base.empty() && base.back() == '/') base.remove_suffix(1);
    out.url.assign(base);
    out.url += route.rewritePath(req.path);
    if (!req.query.empty()) {
        out.url += '?';
        out.url += req.query;
    }

    out.headers = strip_hop_by_hop(req.headers);
    std::erase_if(out.headers, [](const auto& h) { return iequals(h.first, "Host"); });
    if (auto ep = parse_http_url(inst.url)) {
        out.headers.emplace_back("Host", host_header(*ep));
    }

    if (!req.client_key.empty()) {
        std::string xff;
        if (auto prior = find_header(out.headers, "X-Forwarded-For")) {
            xff.assign(*prior);
            xff += ", ";
        }
        xff += req.client_key;
        set_header(out.headers, "X-Forwarded-For", std::move(xff));
    }
    set_header(out.headers, "X-Request-ID", request_id);

    if (method_carries_body(req.method)) out.body = req.body;
    return out;
}

ForwardResult ProxyExecutor::forward(const ProxyRequest& req, const routing::Route& route,
                                     std::stop_token stop) {
    const Clock::time_point started = timing_.now();
    const Clock::time_point deadline = started + route.timeout.value_or(cfg_.timeout);
    const std::string& service = route.target_service;

    routing::ServiceDefinition def;
    if (auto d = registry_.getService(service)) {
        def = std::move(*d);
    } else {
        def.retry_policy = routing::RetryPolicy{cfg_.max_retries, cfg_.base_delay};
    }
    const std::uint32_t max_retries = route.max_retries.value_or(def.retry_policy.max_retries);

    auto inst = balancer_.selectInstance(service, req.client_key, started);
    if (!inst) {
        metrics_.record(service, {}, obs::Outcome::Failure, elapsed_ms(started, timing_.now()));
        return conduit_detail::unexpected<DispatchError>(DispatchError{
            DispatchErrorKind::NoHealthyInstance,
            "No healthy instance available for service '" + service + "'", std::nullopt, std::nullopt});
    }

    auto breaker = breakers_.get(service);
    if (!breaker->allowRequest(started)) {
        metrics_.record(service, {}, obs::Outcome::Rejected, 0.0);
        return conduit_detail::unexpected<DispatchError>(DispatchError{
            DispatchErrorKind::CircuitOpen,
            "Service '" + service + "' is temporarily unavailable", std::nullopt, std::nullopt});
    }

    std::string request_id;
    if (auto rid = find_header(req.headers, "X-Request-ID"); rid && !rid->empty()) {
        request_id.assign(*rid);
    } else {
        request_id = new_request_id();
    }

    // Every admitted request settles the breaker, exceptions included.
    try {
        std::optional<DispatchError> last;
        for (std::uint32_t attempt = 0;; ++attempt) {
            if (stop.stop_requested()) {
                return finish(service, inst->id, started,
                              DispatchError{DispatchErrorKind::ClientCancelled, "Client closed request",
                                            std::nullopt, std::nullopt});
            }

            const Clock::time_point attempt_start = timing_.now();
            if (attempt_start >= deadline) {
                return finish(service, inst->id, started,
                              DispatchError{DispatchErrorKind::UpstreamTimeout,
                                            "Request to service '" + service + "' timed out",
                                            std::nullopt, std::nullopt});
            }
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - attempt_start);
            const auto budget = std::min(def.base_timeout, remaining);

            TransportResult res = [&] {
                ConnectionGuard conn(balancer_, inst->id);
                return transport_->send(buildOutbound(req, route, *inst, request_id), budget, stop);
            }();
            const Clock::time_point attempt_end = timing_.now();
            const double latency = elapsed_ms(attempt_start, attempt_end);

            if (res) {
                HttpResponse resp = std::move(*res);
                resp.headers = strip_hop_by_hop(resp.headers);
                const auto kind = classify_status(resp.status);
                if (!kind || !is_retryable(*kind)) {
                    balancer_.recordSuccess(inst->id, latency);
                    breaker->recordSuccess();
                    metrics_.record(service, inst->id, obs::Outcome::Success, elapsed_ms(started, attempt_end));
                    if (kind) log_->debug("{} {} -> {}: relaying {}", req.method, req.path, inst->id, resp.status);
                    return resp;
                }
                balancer_.recordFailure(inst->id, latency);
                last = DispatchError{DispatchErrorKind::UpstreamServerError,
                                     "Service '" + service + "' responded " + std::to_string(resp.status),
                                     std::move(resp), std::nullopt};
            } else {
                const TransportError& te = res.error();
                const bool caller_cancelled = te.kind == TransportErrorKind::Cancelled && stop.stop_requested();
                if (caller_cancelled) {
                    return finish(service, inst->id, started,
                                  DispatchError{DispatchErrorKind::ClientCancelled, "Client closed request",
                                                std::nullopt, std::nullopt});
                }
                balancer_.recordFailure(inst->id, latency);

                auto kind = map_transport(te.kind);
                if (kind == DispatchErrorKind::ClientCancelled) kind = DispatchErrorKind::UpstreamTimeout;
                if (kind == DispatchErrorKind::UpstreamTimeout && attempt_end >= deadline) {
                    return finish(service, inst->id, started,
                                  DispatchError{kind, "Request to service '" + service + "' timed out",
                                                std::nullopt, std::nullopt});
                }
                last = DispatchError{kind,
                                     "Service '" + service + "' unavailable: " + te.message,
                                     std::nullopt, std::nullopt};
                if (te.kind == TransportErrorKind::Protocol) break;  // malformed reply is not retried
            }

            if (attempt >= max_retries) break;

            const auto delay = backoff(def.retry_policy.base_delay, attempt);
            if (timing_.now() + delay >= deadline) {
                log_->debug("{} {}: backoff {} ms exceeds the remaining budget, giving up",
                            req.method, req.path, delay.count());
                break;
            }
            log_->debug("{} {} -> {} failed ({}), retry {}/{} in {} ms",
                        req.method, req.path, inst->id, code(last->kind), attempt + 1, max_retries, delay.count());
            if (!timing_.sleep(delay, stop)) {
                return finish(service, inst->id, started,
                              DispatchError{DispatchErrorKind::ClientCancelled, "Client closed request",
                                            std::nullopt, std::nullopt});
            }

            auto next = balancer_.selectInstance(service, req.client_key, inst->id, timing_.now());
            if (!next) break;
            inst = std::move(next);
        }

        log_->warn("{} {} -> service '{}' failed: {}", req.method, req.path, service, last->message);
        return finish(service, inst->id, started, std::move(*last));
    } catch (...) {
        const Clock::time_point now = timing_.now();
        breaker->recordFailure(now);
        metrics_.record(service, inst->id, obs::Outcome::Failure, elapsed_ms(started, now));
        log_->error("{} {} -> service '{}': dispatch aborted by an exception", req.method, req.path, service);
        throw;
    }
}

ForwardResult ProxyExecutor::finish(const std::string& service, const std::string& instance_id,
                                    Clock::time_point started, DispatchError err) {
    const Clock::time_point now = timing_.now();
    breakers_.get(service)->recordFailure(now);
    metrics_.record(service, instance_id, obs::Outcome::Failure, elapsed_ms(started, now));
    return conduit_detail::unexpected<DispatchError>(std::move(err));
}

} // namespace conduit::proxy

#pragma once
/**
 * @file gateway_handler.hpp
 * @brief Outermost request boundary: operator endpoints, route resolution,
 *        per-route rate limiting and dispatch through the ProxyExecutor.
 *
 * Every response is either a relayed backend response or a JSON document.
 * Exceptions never cross handle(); they become a generic 500 envelope.
 */

#include <chrono>
#include <memory>
#include <stop_token>
#include <string_view>

#include "conduit/proxy/http_types.hpp"

namespace spdlog { class logger; }
namespace conduit::obs { class MetricsAggregator; }
namespace conduit::proxy {
class ProxyExecutor;
class RateLimiter;
}
namespace conduit::routing {
class ServiceRegistry;
class LoadBalancer;
class CircuitBreakerRegistry;
}

namespace conduit::gateway {

class GatewayHandler {
public:
    GatewayHandler(routing::ServiceRegistry& registry,
                   routing::LoadBalancer& balancer,
                   routing::CircuitBreakerRegistry& breakers,
                   obs::MetricsAggregator& metrics,
                   proxy::ProxyExecutor& executor,
                   proxy::RateLimiter& limiter);

    GatewayHandler(const GatewayHandler&) = delete;
    GatewayHandler& operator=(const GatewayHandler&) = delete;

    /// Handle one inbound request. Never throws.
    proxy::HttpResponse handle(const proxy::ProxyRequest& req, std::stop_token stop = {}) noexcept;

    /// True for GET /health, /metrics, /instances, /services.
    [[nodiscard]] static bool isOpsEndpoint(std::string_view method, std::string_view path) noexcept;

private:
    proxy::HttpResponse dispatch(const proxy::ProxyRequest& req, std::stop_token stop);
    proxy::HttpResponse ops(std::string_view path) const;

    proxy::HttpResponse healthView() const;
    proxy::HttpResponse metricsView() const;
    proxy::HttpResponse instancesView() const;
    proxy::HttpResponse servicesView() const;

    routing::ServiceRegistry&        registry_;
    routing::LoadBalancer&           balancer_;
    routing::CircuitBreakerRegistry& breakers_;
    obs::MetricsAggregator&          metrics_;
    proxy::ProxyExecutor&            executor_;
    proxy::RateLimiter&              limiter_;
    std::shared_ptr<spdlog::logger>  log_;
    const std::chrono::steady_clock::time_point started_;
};

} // namespace conduit::gateway

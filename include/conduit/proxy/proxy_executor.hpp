#pragma once
/**
 * @file proxy_executor.hpp
 * @brief Forwards one inbound request to a backend instance with retries,
 *        exponential backoff, a whole-request deadline and circuit breaking.
 *
 * Bookkeeping per request:
 *   - LoadBalancer health/latency: once per network attempt (each attempt may
 *     target a different instance). Caller cancellations are not recorded there.
 *   - CircuitBreaker and MetricsAggregator: exactly once per request.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>

#include "conduit/compat/expected.hpp"
#include "conduit/config/constants.hpp"
#include "conduit/proxy/dispatch_error.hpp"
#include "conduit/proxy/http_types.hpp"
#include "conduit/proxy/transport.hpp"
#include "conduit/routing/route.hpp"
#include "conduit/routing/service.hpp"

namespace spdlog { class logger; }
namespace conduit::obs { class MetricsAggregator; }
namespace conduit::routing {
class ServiceRegistry;
class LoadBalancer;
class CircuitBreakerRegistry;
}

namespace conduit::proxy {

/// Proxy-wide defaults; per-service retry policy and per-route overrides take precedence.
struct ProxyConfig {
    std::chrono::milliseconds timeout{config::constants::PROXY_TIMEOUT_MS};     ///< Whole-request budget
    std::uint32_t             max_retries{config::constants::PROXY_MAX_RETRIES};
    std::chrono::milliseconds base_delay{config::constants::PROXY_BASE_DELAY_MS};
    std::chrono::milliseconds max_delay{config::constants::PROXY_MAX_DELAY_MS};  ///< Backoff ceiling
};

/**
 * @struct Timing
 * @brief Clock and sleeper used by the retry loop, replaceable in tests.
 */
struct Timing {
    using Clock = std::chrono::steady_clock;

    std::function<Clock::time_point()> now;
    /// Sleep for `d`; returns false if `stop` fired first.
    std::function<bool(std::chrono::milliseconds d, std::stop_token stop)> sleep;

    static Timing system();
};

using ForwardResult = conduit_detail::expected<HttpResponse, DispatchError>;

class ProxyExecutor {
public:
    ProxyExecutor(routing::ServiceRegistry& registry,
                  routing::LoadBalancer& balancer,
                  routing::CircuitBreakerRegistry& breakers,
                  obs::MetricsAggregator& metrics,
                  std::shared_ptr<HttpTransport> transport,
                  ProxyConfig cfg = {},
                  Timing timing = Timing::system());

    ProxyExecutor(const ProxyExecutor&) = delete;
    ProxyExecutor& operator=(const ProxyExecutor&) = delete;

    /**
     * @brief Forward `req` according to `route`.
     * @param stop Caller cancellation (client disconnect). Aborts the in-flight
     *             attempt and any pending backoff.
     * @return The relayed backend response (2xx-4xx), or a DispatchError. Exhausted
     *         5xx/429 responses come back as UpstreamServerError carrying the
     *         backend response for verbatim relay.
     */
    ForwardResult forward(const ProxyRequest& req, const routing::Route& route,
                          std::stop_token stop = {});

    /// Delay before retry number `attempt + 1`: base * 2^attempt, capped at max_delay.
    [[nodiscard]] std::chrono::milliseconds backoff(std::chrono::milliseconds base,
                                                    std::uint32_t attempt) const noexcept;

    /// Outbound request for `inst`: rewritten URL, sanitized and forwarding headers.
    [[nodiscard]] static OutboundRequest buildOutbound(const ProxyRequest& req,
                                                       const routing::Route& route,
                                                       const routing::ServiceInstance& inst,
                                                       const std::string& request_id);

    [[nodiscard]] const ProxyConfig& config() const noexcept { return cfg_; }

private:
    /// Terminal failure: one breaker failure and one metrics record for the request.
    ForwardResult finish(const std::string& service, const std::string& instance_id,
                         Timing::Clock::time_point started, DispatchError err);

    routing::ServiceRegistry&        registry_;
    routing::LoadBalancer&           balancer_;
    routing::CircuitBreakerRegistry& breakers_;
    obs::MetricsAggregator&          metrics_;
    std::shared_ptr<HttpTransport>   transport_;
    const ProxyConfig                cfg_;
    Timing                           timing_;
    std::shared_ptr<spdlog::logger>  log_;
};

} // namespace conduit::proxy

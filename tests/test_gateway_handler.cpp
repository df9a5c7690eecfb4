/**
 * @file test_gateway_handler.cpp
 * @brief End-to-end tests of the request boundary over a scripted transport:
 *        route resolution, rate limiting, error envelopes and operator views.
 */

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "conduit/gateway/gateway_handler.hpp"
#include "conduit/obs/metrics.hpp"
#include "conduit/proxy/proxy_executor.hpp"
#include "conduit/proxy/rate_limiter.hpp"
#include "conduit/routing/circuit_breaker.hpp"
#include "conduit/routing/health_tracker.hpp"
#include "conduit/routing/load_balancer.hpp"
#include "conduit/routing/service_registry.hpp"
#include "support/mock_transport.hpp"

using namespace std::chrono_literals;
using json = nlohmann::json;
using conduit::gateway::GatewayHandler;
using conduit::obs::MetricsAggregator;
using conduit::proxy::HttpResponse;
using conduit::proxy::ProxyExecutor;
using conduit::proxy::ProxyRequest;
using conduit::proxy::RateLimiter;
using conduit::proxy::TransportErrorKind;
using conduit::proxy::find_header;
using conduit::routing::BalancerConfig;
using conduit::routing::CircuitBreakerRegistry;
using conduit::routing::HealthThresholds;
using conduit::routing::HealthTracker;
using conduit::routing::LoadBalancer;
using conduit::routing::RateLimit;
using conduit::routing::RegistryErr;
using conduit::routing::Route;
using conduit::routing::ServiceDefinition;
using conduit::routing::ServiceInstance;
using conduit::routing::ServiceRegistry;
using conduit::testing::ManualClock;
using conduit::testing::MockTransport;
using conduit::testing::fail_with;
using conduit::testing::respond;

namespace {

/// Gateway over one "orders" service with two instances and two routes.
struct Gateway {
  Gateway() : health(HealthThresholds{3, 2}) {
    ServiceDefinition d;
    d.name = "orders";
    d.retry_policy.max_retries = 0;
    std::vector<ServiceInstance> insts{
      ServiceInstance{.id = "o1", .url = "http://10.0.0.1:8080"},
      ServiceInstance{.id = "o2", .url = "http://10.0.0.2:8080"},
    };
    EXPECT_EQ(registry.registerService(d, insts), RegistryErr::Ok);

    Route all;
    all.pattern = "/api/orders/*";
    all.target_service = "orders";
    EXPECT_EQ(registry.addRoute(all), RegistryErr::Ok);

    Route limited;
    limited.pattern = "/api/orders/export";
    limited.target_service = "orders";
    limited.methods = {"POST"};
    limited.rate_limit = RateLimit{60000ms, 2};
    EXPECT_EQ(registry.addRoute(limited), RegistryErr::Ok);
  }

  HttpResponse call(std::string method, std::string path, std::string client = "198.51.100.7") {
    ProxyRequest req;
    req.method = std::move(method);
    req.path = std::move(path);
    req.client_key = std::move(client);
    return handler.handle(req);
  }

  HealthTracker health;
  std::shared_ptr<MockTransport> transport = std::make_shared<MockTransport>();
  ServiceRegistry registry{health, transport};
  MetricsAggregator metrics;
  LoadBalancer balancer{registry, health, metrics, BalancerConfig{}};
  CircuitBreakerRegistry breakers;
  ManualClock clock;
  ProxyExecutor executor{registry, balancer, breakers, metrics, transport, {}, clock.timing()};
  RateLimiter limiter;
  GatewayHandler handler{registry, balancer, breakers, metrics, executor, limiter};
};

json body_of(const HttpResponse& r) { return json::parse(r.body); }

} // namespace

/**
 * @test Gateway_UnknownRoute_404Envelope
 */
TEST(GatewayHandler, Gateway_UnknownRoute_404Envelope) {
  Gateway g;
  auto r = g.call("GET", "/api/nope");
  EXPECT_EQ(r.status, 404u);
  EXPECT_EQ(find_header(r.headers, "Content-Type").value_or(""), "application/json");

  auto j = body_of(r);
  EXPECT_FALSE(j["success"].get<bool>());
  EXPECT_EQ(j["error"]["code"], "ROUTE_NOT_FOUND");
  EXPECT_EQ(j["error"]["message"], "Route GET /api/nope not found");
  EXPECT_EQ(g.transport->calls(), 0);
}

/**
 * @test Gateway_RelaysBackendResponse
 */
TEST(GatewayHandler, Gateway_RelaysBackendResponse) {
  Gateway g;
  g.transport->push(respond(418, "teapot", {{"X-Backend", "o1"}, {"Connection", "close"}}));

  auto r = g.call("GET", "/api/orders/1");
  EXPECT_EQ(r.status, 418u);
  EXPECT_EQ(r.body, "teapot");
  EXPECT_EQ(find_header(r.headers, "X-Backend").value_or(""), "o1");
  EXPECT_FALSE(find_header(r.headers, "Connection").has_value());
}

/**
 * @test Gateway_RateLimited_429WithRetryAfter
 * @brief Third POST in the window is shed; other clients and routes are unaffected.
 */
TEST(GatewayHandler, Gateway_RateLimited_429WithRetryAfter) {
  Gateway g;
  EXPECT_EQ(g.call("POST", "/api/orders/export").status, 200u);
  EXPECT_EQ(g.call("POST", "/api/orders/export").status, 200u);

  auto r = g.call("POST", "/api/orders/export");
  EXPECT_EQ(r.status, 429u);
  EXPECT_EQ(body_of(r)["error"]["code"], "RATE_LIMITED");
  auto ra = find_header(r.headers, "Retry-After");
  ASSERT_TRUE(ra.has_value());
  EXPECT_GE(std::stoi(std::string(*ra)), 1);
  EXPECT_EQ(g.transport->calls(), 2);

  EXPECT_EQ(g.call("POST", "/api/orders/export", "192.0.2.50").status, 200u);
  EXPECT_EQ(g.call("GET", "/api/orders/export").status, 200u);
  EXPECT_EQ(g.metrics.snapshot().rejected_count, 1u);
}

/**
 * @test Gateway_UpstreamUnreachable_503Envelope
 */
TEST(GatewayHandler, Gateway_UpstreamUnreachable_503Envelope) {
  Gateway g;
  g.transport->push(fail_with(TransportErrorKind::ConnectionRefused, "connection refused"));

  auto r = g.call("GET", "/api/orders/1");
  EXPECT_EQ(r.status, 503u);
  EXPECT_EQ(body_of(r)["error"]["code"], "UPSTREAM_UNREACHABLE");
}

/**
 * @test Gateway_UnexpectedException_500
 * @brief Exceptions escaping the dispatch path become a generic 500 envelope.
 */
TEST(GatewayHandler, Gateway_UnexpectedException_500) {
  Gateway g;
  g.transport->setFallback([](auto&&...) -> conduit::proxy::TransportResult {
    throw std::runtime_error("transport exploded");
  });

  auto r = g.call("GET", "/api/orders/1");
  EXPECT_EQ(r.status, 500u);
  auto j = body_of(r);
  EXPECT_EQ(j["error"]["code"], "INTERNAL_SERVER_ERROR");
  EXPECT_EQ(j["error"]["message"], "Internal server error");
}

/**
 * @test Gateway_OpsHealth
 */
TEST(GatewayHandler, Gateway_OpsHealth) {
  Gateway g;
  auto r = g.call("GET", "/health");
  EXPECT_EQ(r.status, 200u);
  auto j = body_of(r);
  EXPECT_TRUE(j["success"].get<bool>());
  EXPECT_EQ(j["data"]["status"], "ok");
  EXPECT_EQ(j["data"]["services"], 1);
  EXPECT_EQ(j["data"]["routes"], 2);
  EXPECT_EQ(j["data"]["instances"]["total"], 2);

  for (int i = 0; i < 3; ++i) {
    g.health.recordFailure("o1", 1);
    g.health.recordFailure("o2", 1);
  }
  auto degraded = body_of(g.call("GET", "/health"));
  EXPECT_EQ(degraded["data"]["status"], "degraded");
  EXPECT_EQ(degraded["data"]["instances"]["unhealthy"], 2);
}

/**
 * @test Gateway_OpsMetrics
 */
TEST(GatewayHandler, Gateway_OpsMetrics) {
  Gateway g;
  g.transport->push(respond(200));
  g.transport->push(respond(500));
  (void)g.call("GET", "/api/orders/1");
  (void)g.call("GET", "/api/orders/2");

  auto j = body_of(g.call("GET", "/metrics"))["data"];
  EXPECT_EQ(j["totalRequests"], 2);
  EXPECT_EQ(j["successCount"], 1);
  EXPECT_EQ(j["failureCount"], 1);
  EXPECT_DOUBLE_EQ(j["failureRate"].get<double>(), 0.5);
  EXPECT_EQ(j["services"]["orders"]["requests"], 2);
  ASSERT_EQ(j["circuitBreakers"].size(), 1u);
  EXPECT_EQ(j["circuitBreakers"][0]["state"], "closed");
  EXPECT_EQ(j["circuitBreakers"][0]["failureCount"], 1);
}

/**
 * @test Gateway_OpsInstancesAndServices
 */
TEST(GatewayHandler, Gateway_OpsInstancesAndServices) {
  Gateway g;
  auto inst = body_of(g.call("GET", "/instances"))["data"];
  ASSERT_EQ(inst.size(), 2u);
  EXPECT_EQ(inst[0]["instanceId"], "o1");
  EXPECT_TRUE(inst[0]["healthy"].get<bool>());
  EXPECT_EQ(inst[0]["samples"], 0);
  EXPECT_EQ(inst[0]["activeConnections"], 0);

  ASSERT_EQ(g.call("GET", "/api/orders/1").status, 200u);
  auto after = body_of(g.call("GET", "/instances"))["data"];
  ASSERT_EQ(after.size(), 2u);
  EXPECT_EQ(after[0]["samples"].get<int>() + after[1]["samples"].get<int>(), 1);
  EXPECT_EQ(after[0]["activeConnections"], 0);

  auto svcs = body_of(g.call("GET", "/services"))["data"];
  ASSERT_EQ(svcs.size(), 1u);
  EXPECT_EQ(svcs[0]["name"], "orders");
  EXPECT_EQ(svcs[0]["instances"].size(), 2u);
  EXPECT_EQ(svcs[0]["circuitBreaker"], "closed");
}

/**
 * @test Gateway_OpsEndpointsAreGetOnly
 */
TEST(GatewayHandler, Gateway_OpsEndpointsAreGetOnly) {
  EXPECT_TRUE(GatewayHandler::isOpsEndpoint("GET", "/metrics"));
  EXPECT_FALSE(GatewayHandler::isOpsEndpoint("POST", "/metrics"));
  EXPECT_FALSE(GatewayHandler::isOpsEndpoint("GET", "/metrics/extra"));
}

/**
 * @test RateLimiter_WindowResets
 */
TEST(RateLimiter, RateLimiter_WindowResets) {
  RateLimiter rl;
  Route r;
  r.pattern = "/x";
  r.target_service = "s";
  r.rate_limit = RateLimit{1000ms, 1};
  const auto t0 = RateLimiter::Clock::now();

  EXPECT_TRUE(rl.admit(r, "c", t0).allowed);
  auto denied = rl.admit(r, "c", t0 + 400ms);
  EXPECT_FALSE(denied.allowed);
  EXPECT_EQ(denied.retry_after, 600ms);
  EXPECT_TRUE(rl.admit(r, "c", t0 + 1000ms).allowed);
  EXPECT_EQ(rl.purgeExpired(t0 + 5000ms), 1u);

  Route open = r;
  open.rate_limit.reset();
  for (int i = 0; i < 10; ++i) EXPECT_TRUE(rl.admit(open, "c", t0).allowed);
}

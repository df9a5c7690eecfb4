/**
 * @file test_proxy_executor.cpp
 * @brief Tests for the forwarding pipeline: retries, backoff, deadline, circuit
 *        breaking, header rewriting and per-request bookkeeping.
 */

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>

#include "conduit/obs/metrics.hpp"
#include "conduit/proxy/proxy_executor.hpp"
#include "conduit/routing/circuit_breaker.hpp"
#include "conduit/routing/health_tracker.hpp"
#include "conduit/routing/load_balancer.hpp"
#include "conduit/routing/service_registry.hpp"
#include "support/mock_transport.hpp"

using namespace std::chrono_literals;
using conduit::obs::MetricsAggregator;
using conduit::proxy::DispatchErrorKind;
using conduit::proxy::ProxyConfig;
using conduit::proxy::ProxyExecutor;
using conduit::proxy::ProxyRequest;
using conduit::proxy::TransportErrorKind;
using conduit::proxy::find_header;
using conduit::routing::Algorithm;
using conduit::routing::BalancerConfig;
using conduit::routing::BreakerConfig;
using conduit::routing::BreakerState;
using conduit::routing::CircuitBreakerRegistry;
using conduit::routing::HealthThresholds;
using conduit::routing::HealthTracker;
using conduit::routing::InstanceList;
using conduit::routing::LoadBalancer;
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

/// Full dispatch stack over a scripted transport and a manual clock.
struct Pipeline {
  explicit Pipeline(InstanceList insts, std::uint32_t retries = 3, HealthThresholds th = {100, 2},
                    std::string service = "orders")
      : health(th) {
    ServiceDefinition d;
    d.name = std::move(service);
    d.retry_policy.max_retries = retries;
    d.retry_policy.base_delay = 1000ms;
    EXPECT_EQ(registry.registerService(d, insts), RegistryErr::Ok);
  }

  ProxyExecutor& exec(ProxyConfig cfg = {}) {
    if (!executor) {
      executor = std::make_unique<ProxyExecutor>(registry, balancer, breakers, metrics,
                                                 transport, cfg, clock.timing());
    }
    return *executor;
  }

  static Route route(std::string pattern = "/api/orders/*", std::string service = "orders") {
    Route r;
    r.pattern = std::move(pattern);
    r.target_service = std::move(service);
    return r;
  }

  static ProxyRequest get(std::string path = "/api/orders/7") {
    ProxyRequest req;
    req.method = "GET";
    req.path = std::move(path);
    req.client_key = "203.0.113.9";
    return req;
  }

  HealthTracker health;
  std::shared_ptr<MockTransport> transport = std::make_shared<MockTransport>();
  ServiceRegistry registry{health, transport};
  MetricsAggregator metrics;
  LoadBalancer balancer{registry, health, metrics, BalancerConfig{}};
  CircuitBreakerRegistry breakers{BreakerConfig{5, 60000ms}};
  ManualClock clock;
  std::unique_ptr<ProxyExecutor> executor;
};

InstanceList one() { return {ServiceInstance{.id = "o1", .url = "http://10.0.0.1:8080"}}; }

InstanceList two() {
  return {
    ServiceInstance{.id = "o1", .url = "http://10.0.0.1:8080"},
    ServiceInstance{.id = "o2", .url = "http://10.0.0.2:8080"},
  };
}

} // namespace

/**
 * @test Proxy_Success_RelaysResponse
 * @brief One attempt, backend response relayed, one success recorded.
 */
TEST(ProxyExecutor, Proxy_Success_RelaysResponse) {
  Pipeline p(one());
  p.transport->push(respond(200, R"({"id":7})", {{"Content-Type", "application/json"}}));

  auto res = p.exec().forward(Pipeline::get(), Pipeline::route());
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(res->status, 200u);
  EXPECT_EQ(res->body, R"({"id":7})");
  EXPECT_EQ(p.transport->calls(), 1);

  auto s = p.metrics.snapshot();
  EXPECT_EQ(s.total_requests, 1u);
  EXPECT_EQ(s.success_count, 1u);
  EXPECT_EQ(p.balancer.activeConnections("o1"), 0);
}

/**
 * @test Proxy_Backoff_Doubles
 * @brief Four failed attempts sleep 1000, 2000, 4000 ms between them.
 */
TEST(ProxyExecutor, Proxy_Backoff_Doubles) {
  Pipeline p(one());
  p.transport->setFallback([](auto&&...) { return fail_with(TransportErrorKind::ConnectionRefused); });

  auto res = p.exec().forward(Pipeline::get(), Pipeline::route());
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, DispatchErrorKind::UpstreamUnreachable);
  EXPECT_EQ(res.error().status(), 503u);
  EXPECT_EQ(p.transport->calls(), 4);

  const auto sleeps = p.clock.sleeps();
  ASSERT_EQ(sleeps.size(), 3u);
  EXPECT_EQ(sleeps[0], 1000ms);
  EXPECT_EQ(sleeps[1], 2000ms);
  EXPECT_EQ(sleeps[2], 4000ms);

  // one request, one breaker failure, four network attempts
  auto s = p.metrics.snapshot();
  EXPECT_EQ(s.total_requests, 1u);
  EXPECT_EQ(s.failure_count, 1u);
  EXPECT_EQ(s.per_instance["o1"].attempts, 4u);
  EXPECT_EQ(p.breakers.get("orders")->failureCount(), 1u);
}

/**
 * @test Proxy_Backoff_CappedAtMaxDelay
 */
TEST(ProxyExecutor, Proxy_Backoff_CappedAtMaxDelay) {
  Pipeline p(one());
  ProxyConfig cfg;
  cfg.max_delay = 3000ms;
  auto& ex = p.exec(cfg);
  EXPECT_EQ(ex.backoff(1000ms, 0), 1000ms);
  EXPECT_EQ(ex.backoff(1000ms, 1), 2000ms);
  EXPECT_EQ(ex.backoff(1000ms, 2), 3000ms);
  EXPECT_EQ(ex.backoff(1000ms, 40), 3000ms);
}

/**
 * @test Proxy_RetryRecoversOnSecondAttempt
 * @brief A transient failure followed by success yields the success response.
 */
TEST(ProxyExecutor, Proxy_RetryRecoversOnSecondAttempt) {
  Pipeline p(one());
  p.transport->push(fail_with(TransportErrorKind::ConnectionReset));
  p.transport->push(respond(201, "created"));

  auto res = p.exec().forward(Pipeline::get(), Pipeline::route());
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(res->status, 201u);
  EXPECT_EQ(p.transport->calls(), 2);
  EXPECT_EQ(p.breakers.get("orders")->failureCount(), 0u);
  EXPECT_EQ(p.metrics.snapshot().success_count, 1u);
}

/**
 * @test Proxy_ClientError_NotRetried
 * @brief A backend 4xx is relayed untouched after one attempt.
 */
TEST(ProxyExecutor, Proxy_ClientError_NotRetried) {
  Pipeline p(one());
  p.transport->push(respond(404, "no such order"));

  auto res = p.exec().forward(Pipeline::get(), Pipeline::route());
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(res->status, 404u);
  EXPECT_EQ(res->body, "no such order");
  EXPECT_EQ(p.transport->calls(), 1);
  EXPECT_TRUE(p.clock.sleeps().empty());
}

/**
 * @test Proxy_ServerError_RelayedAfterExhaustion
 * @brief Retries exhausted on 5xx: the last backend response is carried for relay.
 */
TEST(ProxyExecutor, Proxy_ServerError_RelayedAfterExhaustion) {
  Pipeline p(one(), 1);
  p.transport->push(respond(500, "boom-1"));
  p.transport->push(respond(502, "boom-2"));

  auto res = p.exec().forward(Pipeline::get(), Pipeline::route());
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, DispatchErrorKind::UpstreamServerError);
  ASSERT_TRUE(res.error().upstream.has_value());
  EXPECT_EQ(res.error().status(), 502u);

  auto out = conduit::proxy::to_response(res.error());
  EXPECT_EQ(out.status, 502u);
  EXPECT_EQ(out.body, "boom-2");
  EXPECT_EQ(p.transport->calls(), 2);
}

/**
 * @test Proxy_RouteMaxRetriesOverridesService
 */
TEST(ProxyExecutor, Proxy_RouteMaxRetriesOverridesService) {
  Pipeline p(one(), 3);
  p.transport->setFallback([](auto&&...) { return respond(503); });

  auto r = Pipeline::route();
  r.max_retries = 0;
  auto res = p.exec().forward(Pipeline::get(), r);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(p.transport->calls(), 1);
}

/**
 * @test Proxy_CircuitOpensAfterFiveFailedRequests
 * @brief Five failed requests open the breaker; the sixth is rejected with no
 *        network attempt; after the reset timeout a successful trial closes it.
 */
TEST(ProxyExecutor, Proxy_CircuitOpensAfterFiveFailedRequests) {
  Pipeline p({ServiceInstance{.id = "pay-1", .url = "http://10.0.2.1:8080"}}, 0, {100, 2}, "payments");
  p.transport->setFallback([](auto&&...) { return respond(503, "down"); });
  auto& ex = p.exec();
  const Route r = Pipeline::route("/api/payments/*", "payments");
  const ProxyRequest req = Pipeline::get("/api/payments/charge");

  for (int i = 0; i < 5; ++i) {
    auto res = ex.forward(req, r);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, DispatchErrorKind::UpstreamServerError);
  }
  EXPECT_EQ(p.transport->calls(), 5);
  EXPECT_EQ(p.breakers.get("payments")->state(), BreakerState::Open);

  auto rejected = ex.forward(req, r);
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error().kind, DispatchErrorKind::CircuitOpen);
  EXPECT_EQ(rejected.error().status(), 503u);
  EXPECT_EQ(p.transport->calls(), 5);
  EXPECT_EQ(p.metrics.snapshot().rejected_count, 1u);

  p.clock.advance(60000ms);
  p.transport->setFallback([](auto&&...) { return respond(200, "back"); });
  auto trial = ex.forward(req, r);
  ASSERT_TRUE(trial.has_value());
  EXPECT_EQ(p.breakers.get("payments")->state(), BreakerState::Closed);
  EXPECT_EQ(p.breakers.get("payments")->failureCount(), 0u);
  EXPECT_EQ(p.transport->calls(), 6);
}

/**
 * @test Proxy_ThrowingTrial_ReopensCircuit
 * @brief A half-open trial whose transport throws still settles the breaker:
 *        the circuit reopens, the failure is counted, and the next trial after
 *        the reset timeout is admitted and closes it.
 */
TEST(ProxyExecutor, Proxy_ThrowingTrial_ReopensCircuit) {
  Pipeline p({ServiceInstance{.id = "pay-1", .url = "http://10.0.2.1:8080"}}, 0, {100, 2}, "payments");
  p.transport->setFallback([](auto&&...) { return respond(503, "down"); });
  auto& ex = p.exec();
  const Route r = Pipeline::route("/api/payments/*", "payments");
  const ProxyRequest req = Pipeline::get("/api/payments/charge");

  for (int i = 0; i < 5; ++i) ASSERT_FALSE(ex.forward(req, r).has_value());
  ASSERT_EQ(p.breakers.get("payments")->state(), BreakerState::Open);

  p.clock.advance(60000ms);
  p.transport->setFallback([](auto&&...) -> conduit::proxy::TransportResult {
    throw std::runtime_error("socket layer blew up");
  });
  EXPECT_THROW(ex.forward(req, r), std::runtime_error);
  EXPECT_EQ(p.breakers.get("payments")->state(), BreakerState::Open);
  EXPECT_EQ(p.metrics.snapshot().per_service.at("payments").failures, 6u);
  EXPECT_EQ(p.transport->calls(), 6);

  auto rejected = ex.forward(req, r);
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error().kind, DispatchErrorKind::CircuitOpen);

  p.clock.advance(60000ms);
  p.transport->setFallback([](auto&&...) { return respond(200, "back"); });
  auto trial = ex.forward(req, r);
  ASSERT_TRUE(trial.has_value());
  EXPECT_EQ(trial->status, 200u);
  EXPECT_EQ(p.breakers.get("payments")->state(), BreakerState::Closed);
  EXPECT_EQ(p.transport->calls(), 7);
}

/**
 * @test Proxy_DeadlineYieldsGatewayTimeout
 * @brief An attempt that runs into the whole-request deadline returns 504 at once.
 */
TEST(ProxyExecutor, Proxy_DeadlineYieldsGatewayTimeout) {
  Pipeline p(one());
  auto* clock = &p.clock;
  p.transport->setFallback([clock](const auto&, std::chrono::milliseconds budget, std::stop_token) {
    clock->advance(budget);
    return fail_with(TransportErrorKind::Timeout);
  });

  auto r = Pipeline::route();
  r.timeout = 5000ms;
  auto res = p.exec().forward(Pipeline::get(), r);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, DispatchErrorKind::UpstreamTimeout);
  EXPECT_EQ(res.error().status(), 504u);
  EXPECT_EQ(p.transport->calls(), 1);
  ASSERT_EQ(p.transport->timeouts().size(), 1u);
  EXPECT_EQ(p.transport->timeouts()[0], 5000ms);
}

/**
 * @test Proxy_BackoffBeyondDeadline_GivesUp
 * @brief No sleep is started when the backoff cannot finish inside the budget.
 */
TEST(ProxyExecutor, Proxy_BackoffBeyondDeadline_GivesUp) {
  Pipeline p(one());
  p.transport->setFallback([](auto&&...) { return fail_with(TransportErrorKind::ConnectionRefused); });

  auto r = Pipeline::route();
  r.timeout = 2500ms;
  auto res = p.exec().forward(Pipeline::get(), r);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, DispatchErrorKind::UpstreamUnreachable);
  // attempt 0, sleep 1000, attempt 1; the 2000 ms backoff would cross the deadline
  EXPECT_EQ(p.transport->calls(), 2);
  EXPECT_EQ(p.clock.sleeps().size(), 1u);
}

/**
 * @test Proxy_CallerCancel_NotChargedToInstance
 * @brief Client disconnect maps to 499 and leaves the instance health untouched.
 */
TEST(ProxyExecutor, Proxy_CallerCancel_NotChargedToInstance) {
  Pipeline p(one());
  std::stop_source src;
  p.transport->setFallback([&src](auto&&...) {
    src.request_stop();
    return fail_with(TransportErrorKind::Cancelled, "operation aborted");
  });

  auto res = p.exec().forward(Pipeline::get(), Pipeline::route(), src.get_token());
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, DispatchErrorKind::ClientCancelled);
  EXPECT_EQ(res.error().status(), 499u);
  EXPECT_EQ(p.transport->calls(), 1);

  auto rec = p.health.record("o1");
  EXPECT_TRUE(!rec || rec->consecutive_failures == 0u);
  EXPECT_EQ(p.metrics.snapshot().per_instance["o1"].attempts, 0u);
}

/**
 * @test Proxy_NoHealthyInstance
 */
TEST(ProxyExecutor, Proxy_NoHealthyInstance) {
  Pipeline p(one(), 3, HealthThresholds{1, 1});
  p.health.recordFailure("o1", 1);

  auto res = p.exec().forward(Pipeline::get(), Pipeline::route());
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, DispatchErrorKind::NoHealthyInstance);
  EXPECT_EQ(res.error().status(), 503u);
  EXPECT_EQ(p.transport->calls(), 0);
  EXPECT_EQ(p.breakers.get("orders")->failureCount(), 0u);
  EXPECT_EQ(p.metrics.snapshot().failure_count, 1u);
}

/**
 * @test Proxy_RetryMovesToAnotherInstance
 */
TEST(ProxyExecutor, Proxy_RetryMovesToAnotherInstance) {
  Pipeline p(two());
  p.transport->push(fail_with(TransportErrorKind::ConnectionRefused));
  p.transport->push(respond(200));

  auto res = p.exec().forward(Pipeline::get(), Pipeline::route());
  ASSERT_TRUE(res.has_value());
  auto reqs = p.transport->requests();
  ASSERT_EQ(reqs.size(), 2u);
  EXPECT_NE(reqs[0].url.substr(0, 20), reqs[1].url.substr(0, 20));
}

/**
 * @test Proxy_OutboundRewrite
 * @brief Prefix stripping, query preservation and header sanitation.
 */
TEST(ProxyExecutor, Proxy_OutboundRewrite) {
  ProxyRequest req;
  req.method = "POST";
  req.path = "/api/orders/7/items";
  req.query = "page=2";
  req.body = "{}";
  req.client_key = "198.51.100.4";
  req.headers = {
    {"Host", "gateway.local"},
    {"Connection", "keep-alive, X-Trace"},
    {"X-Trace", "abc"},
    {"Keep-Alive", "timeout=5"},
    {"X-Forwarded-For", "192.0.2.1"},
    {"Authorization", "Bearer t"},
  };

  auto r = Pipeline::route("/api/orders/*");
  r.strip_path_prefix = true;
  ServiceInstance inst{.id = "o1", .url = "http://10.0.0.1:8080/"};

  auto out = ProxyExecutor::buildOutbound(req, r, inst, "rid-1");
  EXPECT_EQ(out.method, "POST");
  EXPECT_EQ(out.url, "http://10.0.0.1:8080/7/items?page=2");
  EXPECT_EQ(out.body, "{}");
  EXPECT_FALSE(find_header(out.headers, "Connection").has_value());
  EXPECT_FALSE(find_header(out.headers, "Keep-Alive").has_value());
  EXPECT_FALSE(find_header(out.headers, "X-Trace").has_value());
  EXPECT_EQ(find_header(out.headers, "Host").value_or(""), "10.0.0.1:8080");
  EXPECT_EQ(find_header(out.headers, "X-Forwarded-For").value_or(""), "192.0.2.1, 198.51.100.4");
  EXPECT_EQ(find_header(out.headers, "X-Request-ID").value_or(""), "rid-1");
  EXPECT_EQ(find_header(out.headers, "Authorization").value_or(""), "Bearer t");
}

/**
 * @test Proxy_OutboundHost_BracketsIpv6
 * @brief IPv6 literals keep their brackets in Host; port 80 is left implicit.
 */
TEST(ProxyExecutor, Proxy_OutboundHost_BracketsIpv6) {
  const auto r = Pipeline::route();
  const auto req = Pipeline::get();

  auto v6 = ProxyExecutor::buildOutbound(req, r, ServiceInstance{.id = "a", .url = "http://[::1]:8080"}, "rid");
  EXPECT_EQ(v6.url, "http://[::1]:8080/api/orders/7");
  EXPECT_EQ(find_header(v6.headers, "Host").value_or(""), "[::1]:8080");

  auto v6_default = ProxyExecutor::buildOutbound(req, r, ServiceInstance{.id = "b", .url = "http://[2001:db8::5]"}, "rid");
  EXPECT_EQ(find_header(v6_default.headers, "Host").value_or(""), "[2001:db8::5]");

  auto v4_default = ProxyExecutor::buildOutbound(req, r, ServiceInstance{.id = "c", .url = "http://10.0.0.9:80"}, "rid");
  EXPECT_EQ(find_header(v4_default.headers, "Host").value_or(""), "10.0.0.9");
}

/**
 * @test Proxy_GetDropsBody_RequestIdGenerated
 */
TEST(ProxyExecutor, Proxy_GetDropsBody_RequestIdGenerated) {
  Pipeline p(one());
  auto req = Pipeline::get();
  req.body = "ignored";

  ASSERT_TRUE(p.exec().forward(req, Pipeline::route()).has_value());
  auto sent = p.transport->requests().at(0);
  EXPECT_TRUE(sent.body.empty());
  EXPECT_EQ(sent.url, "http://10.0.0.1:8080/api/orders/7");
  auto rid = find_header(sent.headers, "X-Request-ID");
  ASSERT_TRUE(rid.has_value());
  EXPECT_EQ(rid->size(), 36u);
}

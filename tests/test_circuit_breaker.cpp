/**
 * @file test_circuit_breaker.cpp
 * @brief Tests for the closed/open/half-open state machine with injected time.
 */

#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

#include "conduit/routing/circuit_breaker.hpp"

using namespace std::chrono_literals;
using conduit::routing::BreakerConfig;
using conduit::routing::BreakerState;
using conduit::routing::CircuitBreaker;
using conduit::routing::CircuitBreakerRegistry;
using Clock = std::chrono::steady_clock;

namespace {

BreakerConfig cfg(std::uint32_t threshold = 5, std::chrono::milliseconds reset = 60000ms) {
  return BreakerConfig{threshold, reset};
}

void fail_n(CircuitBreaker& cb, int n, Clock::time_point at) {
  for (int i = 0; i < n; ++i) {
    ASSERT_TRUE(cb.allowRequest(at));
    cb.recordFailure(at);
  }
}

} // namespace

/**
 * @test Breaker_OpensAtThreshold
 * @brief Closed until the Nth consecutive failure, then Open and rejecting.
 */
TEST(CircuitBreaker, Breaker_OpensAtThreshold) {
  CircuitBreaker cb("payments", cfg());
  const auto t0 = Clock::now();

  fail_n(cb, 4, t0);
  EXPECT_EQ(cb.state(), BreakerState::Closed);
  EXPECT_EQ(cb.failureCount(), 4u);

  fail_n(cb, 1, t0);
  EXPECT_EQ(cb.state(), BreakerState::Open);
  EXPECT_FALSE(cb.allowRequest(t0 + 1s));
  EXPECT_FALSE(cb.allowRequest(t0 + 59s));
  EXPECT_EQ(cb.stats().rejected, 2u);
  EXPECT_EQ(cb.stats().times_opened, 1u);
}

/**
 * @test Breaker_SuccessResetsCount
 * @brief A success while closed zeroes the failure count.
 */
TEST(CircuitBreaker, Breaker_SuccessResetsCount) {
  CircuitBreaker cb("svc", cfg(3));
  const auto t0 = Clock::now();
  fail_n(cb, 2, t0);
  cb.recordSuccess();
  EXPECT_EQ(cb.failureCount(), 0u);
  fail_n(cb, 2, t0);
  EXPECT_EQ(cb.state(), BreakerState::Closed);
}

/**
 * @test Breaker_HalfOpen_SuccessCloses
 * @brief After resetTimeout the next call is the trial; success closes with count 0.
 */
TEST(CircuitBreaker, Breaker_HalfOpen_SuccessCloses) {
  CircuitBreaker cb("svc", cfg(2, 1000ms));
  const auto t0 = Clock::now();
  fail_n(cb, 2, t0);
  ASSERT_EQ(cb.state(), BreakerState::Open);

  // no timer: Open persists until the next allowRequest()
  EXPECT_EQ(cb.state(), BreakerState::Open);
  EXPECT_TRUE(cb.allowRequest(t0 + 1000ms));
  EXPECT_EQ(cb.state(), BreakerState::HalfOpen);

  cb.recordSuccess();
  EXPECT_EQ(cb.state(), BreakerState::Closed);
  EXPECT_EQ(cb.failureCount(), 0u);
  EXPECT_TRUE(cb.allowRequest(t0 + 1001ms));
}

/**
 * @test Breaker_HalfOpen_SingleTrial
 * @brief Only one request passes while the trial is outstanding.
 */
TEST(CircuitBreaker, Breaker_HalfOpen_SingleTrial) {
  CircuitBreaker cb("svc", cfg(1, 100ms));
  const auto t0 = Clock::now();
  fail_n(cb, 1, t0);

  EXPECT_TRUE(cb.allowRequest(t0 + 200ms));
  EXPECT_FALSE(cb.allowRequest(t0 + 201ms));
  EXPECT_FALSE(cb.allowRequest(t0 + 202ms));
  EXPECT_EQ(cb.state(), BreakerState::HalfOpen);
}

/**
 * @test Breaker_HalfOpen_FailureReopens
 * @brief A failed trial returns to Open and restarts the reset timer.
 */
TEST(CircuitBreaker, Breaker_HalfOpen_FailureReopens) {
  CircuitBreaker cb("svc", cfg(1, 1000ms));
  const auto t0 = Clock::now();
  fail_n(cb, 1, t0);

  ASSERT_TRUE(cb.allowRequest(t0 + 1000ms));
  cb.recordFailure(t0 + 1500ms);
  EXPECT_EQ(cb.state(), BreakerState::Open);
  EXPECT_FALSE(cb.allowRequest(t0 + 2000ms));      // 500ms after the new failure
  EXPECT_TRUE(cb.allowRequest(t0 + 2500ms));
  EXPECT_EQ(cb.stats().times_opened, 2u);
}

/**
 * @test Breaker_Reset
 * @brief Operator reset forces Closed.
 */
TEST(CircuitBreaker, Breaker_Reset) {
  CircuitBreaker cb("svc", cfg(1));
  fail_n(cb, 1, Clock::now());
  cb.reset();
  EXPECT_EQ(cb.state(), BreakerState::Closed);
  EXPECT_EQ(cb.failureCount(), 0u);
}

/**
 * @test Breaker_HalfOpen_ConcurrentTrialIsExclusive
 * @brief Under contention exactly one caller wins the half-open trial.
 */
TEST(CircuitBreaker, Breaker_HalfOpen_ConcurrentTrialIsExclusive) {
  CircuitBreaker cb("svc", cfg(1, 10ms));
  const auto t0 = Clock::now();
  fail_n(cb, 1, t0);

  std::atomic<int> admitted{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (cb.allowRequest(t0 + 50ms)) admitted.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(admitted.load(), 1);
}

/**
 * @test BreakerRegistry_OnePerService
 * @brief get() returns the same breaker per service; services are isolated.
 */
TEST(CircuitBreakerRegistry, BreakerRegistry_OnePerService) {
  CircuitBreakerRegistry reg(cfg(1));
  auto a1 = reg.get("a");
  auto a2 = reg.get("a");
  auto b = reg.get("b");
  EXPECT_EQ(a1.get(), a2.get());
  EXPECT_NE(a1.get(), b.get());

  fail_n(*a1, 1, Clock::now());
  EXPECT_EQ(a1->state(), BreakerState::Open);
  EXPECT_EQ(b->state(), BreakerState::Closed);

  auto stats = reg.allStats();
  ASSERT_EQ(stats.size(), 2u);
  EXPECT_EQ(stats[0].service, "a");
  EXPECT_EQ(stats[0].state, BreakerState::Open);
  EXPECT_EQ(conduit::routing::to_string(stats[1].state), "closed");
}

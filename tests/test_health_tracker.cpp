/**
 * @file test_health_tracker.cpp
 * @brief Tests for the consecutive failure/success hysteresis and observer notifications.
 */

#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "conduit/obs/health_events.hpp"
#include "conduit/routing/health_tracker.hpp"

using conduit::obs::HealthEvent;
using conduit::obs::HealthObserver;
using conduit::obs::HealthTransition;
using conduit::routing::HealthThresholds;
using conduit::routing::HealthTracker;
using conduit::routing::InstanceStatus;

namespace {

class RecordingObserver final : public HealthObserver {
 public:
  void onTransition(const HealthTransition& t) override {
    std::lock_guard lk(mu);
    events.push_back(t);
  }
  std::mutex mu;
  std::vector<HealthTransition> events;
};

} // namespace

/**
 * @test Health_AbsentRecord_AssumedHealthy
 * @brief Unknown ids are healthy with Unknown status; tracked ids start unobserved.
 */
TEST(HealthTracker, Health_AbsentRecord_AssumedHealthy) {
  HealthTracker t;
  EXPECT_TRUE(t.isHealthy("nobody"));
  EXPECT_EQ(t.status("nobody"), InstanceStatus::Unknown);
  EXPECT_FALSE(t.record("nobody").has_value());

  t.track("i1");
  ASSERT_TRUE(t.record("i1").has_value());
  EXPECT_TRUE(t.record("i1")->healthy);
  EXPECT_FALSE(t.record("i1")->observed);
  EXPECT_EQ(t.status("i1"), InstanceStatus::Unknown);
}

/**
 * @test Health_FlipsExactlyAtThresholds
 * @brief healthy -> unhealthy at the Nth failure, back at the Mth success, not before.
 */
TEST(HealthTracker, Health_FlipsExactlyAtThresholds) {
  HealthTracker t(HealthThresholds{3, 2});
  t.track("i1");

  t.recordFailure("i1", 10);
  t.recordFailure("i1", 10);
  EXPECT_TRUE(t.isHealthy("i1"));
  t.recordFailure("i1", 10);
  EXPECT_FALSE(t.isHealthy("i1"));
  EXPECT_EQ(t.status("i1"), InstanceStatus::Unhealthy);

  t.recordSuccess("i1", 5);
  EXPECT_FALSE(t.isHealthy("i1"));
  t.recordSuccess("i1", 5);
  EXPECT_TRUE(t.isHealthy("i1"));
  EXPECT_EQ(t.status("i1"), InstanceStatus::Healthy);

  auto rec = *t.record("i1");
  EXPECT_EQ(rec.consecutive_failures, 0u);
  EXPECT_EQ(rec.consecutive_successes, 2u);
  EXPECT_DOUBLE_EQ(rec.last_response_time_ms, 5.0);
}

/**
 * @test Health_SuccessResetsFailureStreak
 * @brief Interleaved successes prevent an unhealthy flip.
 */
TEST(HealthTracker, Health_SuccessResetsFailureStreak) {
  HealthTracker t(HealthThresholds{3, 2});
  t.track("i1");
  for (int i = 0; i < 10; ++i) {
    t.recordFailure("i1", 1);
    t.recordFailure("i1", 1);
    t.recordSuccess("i1", 1);
  }
  EXPECT_TRUE(t.isHealthy("i1"));
}

/**
 * @test Health_ObserversSeeTransitions
 * @brief Exactly one event per flip, in order, with the streak that caused it.
 */
TEST(HealthTracker, Health_ObserversSeeTransitions) {
  HealthTracker t(HealthThresholds{2, 1});
  auto obs = std::make_shared<RecordingObserver>();
  t.addObserver(obs);
  t.track("i1");

  t.recordFailure("i1", 1);
  t.recordFailure("i1", 1);
  t.recordFailure("i1", 1);  // already unhealthy: no second event
  t.recordSuccess("i1", 1);

  ASSERT_EQ(obs->events.size(), 2u);
  EXPECT_EQ(obs->events[0].event, HealthEvent::InstanceFailed);
  EXPECT_EQ(obs->events[0].instance_id, "i1");
  EXPECT_EQ(obs->events[0].consecutive_failures, 2u);
  EXPECT_EQ(obs->events[1].event, HealthEvent::InstanceRecovered);
  EXPECT_EQ(conduit::obs::to_string(obs->events[1].event), "instance.recovered");
}

/**
 * @test Health_RetainDropsRemoved
 * @brief retain() keeps exactly the listed ids; records() is sorted.
 */
TEST(HealthTracker, Health_RetainDropsRemoved) {
  HealthTracker t;
  t.track("c");
  t.track("a");
  t.track("b");
  t.retain({"a", "c"});

  auto recs = t.records();
  ASSERT_EQ(recs.size(), 2u);
  EXPECT_EQ(recs[0].instance_id, "a");
  EXPECT_EQ(recs[1].instance_id, "c");
  EXPECT_TRUE(t.forget("a"));
  EXPECT_FALSE(t.forget("a"));
}

/**
 * @test Health_ConcurrentUpdates_NoLostCounts
 * @brief Per-record locking keeps streak counters exact under concurrent writers.
 */
TEST(HealthTracker, Health_ConcurrentUpdates_NoLostCounts) {
  HealthTracker t(HealthThresholds{1000000, 1});
  t.track("i1");
  std::vector<std::thread> threads;
  for (int k = 0; k < 4; ++k) {
    threads.emplace_back([&] {
      for (int i = 0; i < 1000; ++i) t.recordFailure("i1", 1);
    });
  }
  for (auto& th : threads) th.join();
  EXPECT_EQ(t.record("i1")->consecutive_failures, 4000u);
}

/**
 * @test Health_LateOutcome_DoesNotRecreateRecord
 * @brief Outcomes arriving after forget()/retain() leave no record behind.
 */
TEST(HealthTracker, Health_LateOutcome_DoesNotRecreateRecord) {
  HealthTracker t(HealthThresholds{1, 1});
  auto obs = std::make_shared<RecordingObserver>();
  t.addObserver(obs);
  t.track("gone");
  t.track("kept");

  ASSERT_TRUE(t.forget("gone"));
  t.recordFailure("gone", 1);
  t.recordSuccess("gone", 1);
  EXPECT_FALSE(t.record("gone").has_value());

  t.retain({});
  t.recordFailure("kept", 1);
  EXPECT_FALSE(t.record("kept").has_value());
  EXPECT_EQ(t.size(), 0u);
  EXPECT_TRUE(obs->events.empty());

  t.recordFailure("never-tracked", 1);
  EXPECT_EQ(t.size(), 0u);
  EXPECT_TRUE(t.isHealthy("never-tracked"));
}

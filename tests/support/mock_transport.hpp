#pragma once
/**
 * @file mock_transport.hpp
 * @brief Scripted in-process HttpTransport and a manual clock for dispatch tests.
 */

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "conduit/proxy/proxy_executor.hpp"
#include "conduit/proxy/transport.hpp"

namespace conduit::testing {

using proxy::HttpResponse;
using proxy::OutboundRequest;
using proxy::TransportError;
using proxy::TransportErrorKind;
using proxy::TransportResult;

inline TransportResult respond(unsigned status, std::string body = {}, proxy::Headers headers = {}) {
  return HttpResponse{status, std::move(headers), std::move(body)};
}

inline TransportResult fail_with(TransportErrorKind kind, std::string message = "scripted") {
  return conduit_detail::unexpected<TransportError>(TransportError{kind, std::move(message)});
}

/**
 * Replays queued results in order; once the queue is empty every call goes to
 * the fallback handler (200 "ok" unless replaced). Records every request.
 */
class MockTransport final : public proxy::HttpTransport {
 public:
  using Handler = std::function<TransportResult(const OutboundRequest&, std::chrono::milliseconds,
                                                std::stop_token)>;

  void push(TransportResult r) {
    std::lock_guard lk(mu_);
    script_.push_back(std::move(r));
  }

  void setFallback(Handler h) {
    std::lock_guard lk(mu_);
    fallback_ = std::move(h);
  }

  /// Called before every exchange (e.g. to advance a ManualClock).
  void onSend(std::function<void(const OutboundRequest&)> hook) {
    std::lock_guard lk(mu_);
    hook_ = std::move(hook);
  }

  TransportResult send(const OutboundRequest& req, std::chrono::milliseconds timeout,
                       std::stop_token stop) override {
    Handler fallback;
    std::function<void(const OutboundRequest&)> hook;
    std::optional<TransportResult> scripted;
    {
      std::lock_guard lk(mu_);
      requests_.push_back(req);
      timeouts_.push_back(timeout);
      hook = hook_;
      if (!script_.empty()) {
        scripted = std::move(script_.front());
        script_.pop_front();
      } else {
        fallback = fallback_;
      }
    }
    if (hook) hook(req);
    if (scripted) return std::move(*scripted);
    if (fallback) return fallback(req, timeout, stop);
    return respond(200, "ok");
  }

  int calls() const {
    std::lock_guard lk(mu_);
    return static_cast<int>(requests_.size());
  }

  std::vector<OutboundRequest> requests() const {
    std::lock_guard lk(mu_);
    return requests_;
  }

  std::vector<std::chrono::milliseconds> timeouts() const {
    std::lock_guard lk(mu_);
    return timeouts_;
  }

 private:
  mutable std::mutex mu_;
  std::deque<TransportResult> script_;
  Handler fallback_;
  std::function<void(const OutboundRequest&)> hook_;
  std::vector<OutboundRequest> requests_;
  std::vector<std::chrono::milliseconds> timeouts_;
};

/// Steady clock that only moves when told to; sleeps advance it and are recorded.
class ManualClock {
 public:
  using Clock = std::chrono::steady_clock;

  Clock::time_point now() const {
    std::lock_guard lk(mu_);
    return now_;
  }

  void advance(std::chrono::milliseconds d) {
    std::lock_guard lk(mu_);
    now_ += d;
  }

  std::vector<std::chrono::milliseconds> sleeps() const {
    std::lock_guard lk(mu_);
    return sleeps_;
  }

  proxy::Timing timing() {
    proxy::Timing t;
    t.now = [this] { return now(); };
    t.sleep = [this](std::chrono::milliseconds d, std::stop_token stop) {
      if (stop.stop_requested()) return false;
      std::lock_guard lk(mu_);
      sleeps_.push_back(d);
      now_ += d;
      return true;
    };
    return t;
  }

 private:
  mutable std::mutex mu_;
  Clock::time_point now_{Clock::time_point{} + std::chrono::hours(1)};
  std::vector<std::chrono::milliseconds> sleeps_;
};

} // namespace conduit::testing

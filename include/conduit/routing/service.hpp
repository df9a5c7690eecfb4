/**
 * @file service.hpp
 * @brief Backend service model shared across registry, balancer and proxy.
 *
 * Defines the service definition (how to reach and retry a backend fleet) and
 * the `ServiceInstance` descriptor. Centralizing these types keeps comparisons
 * consistent across modules and avoids ODR issues.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "conduit/config/constants.hpp"

namespace conduit::routing {

/**
 * @brief Reachability of an instance as last observed.
 *
 * @note Semantics:
 *  - Unknown:   No health check or request outcome observed yet (assumed healthy).
 *  - Healthy:   Eligible for selection.
 *  - Unhealthy: Ineligible until enough consecutive successes are observed.
 */
enum class InstanceStatus : std::uint8_t {
  Unknown = 0,
  Healthy = 1,
  Unhealthy = 2
};

/// Lowercase label used in logs and JSON ("unknown", "healthy", "unhealthy").
std::string_view to_string(InstanceStatus s) noexcept;

/**
 * @brief Retry behaviour for requests forwarded to a service.
 */
struct RetryPolicy final {
  /// Retries after the first attempt (total attempts = max_retries + 1).
  std::uint32_t max_retries{config::constants::PROXY_MAX_RETRIES};

  /// Backoff unit; attempt N sleeps base_delay * 2^N.
  std::chrono::milliseconds base_delay{config::constants::PROXY_BASE_DELAY_MS};

  bool operator==(const RetryPolicy&) const = default;
};

/**
 * @brief Static description of a backend service.
 *
 * Created at startup or configuration reload; immutable during normal operation.
 */
struct ServiceDefinition final {
  /// Logical service name, e.g. "orders".
  std::string name;

  /// Path probed with GET by the health loop.
  std::string health_check_path{config::constants::HEALTH_PATH_DEFAULT};

  /// Budget for a single network attempt.
  std::chrono::milliseconds base_timeout{config::constants::SERVICE_BASE_TIMEOUT_MS};

  RetryPolicy retry_policy{};

  bool operator==(const ServiceDefinition&) const = default;
};

/**
 * @brief One independently reachable copy of a backend service.
 *
 * @note `id` must be unique across the whole registry: health records,
 *       connection counters and session affinity are keyed by it.
 */
struct ServiceInstance final {
  /// Instance identifier, e.g. "orders-1".
  std::string id;

  /// Base URL, e.g. "http://10.0.0.5:8080".
  std::string url;

  /// Relative share for weighted round-robin (>= 1).
  std::uint32_t weight{config::constants::INSTANCE_WEIGHT_DEFAULT};

  /// Reachability as reported by the registry (derived from the health record).
  InstanceStatus status{InstanceStatus::Unknown};

  bool operator==(const ServiceInstance&) const = default;
};

using InstanceList = std::vector<ServiceInstance>;

} // namespace conduit::routing

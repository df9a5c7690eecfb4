#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the dispatch components.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (JSON file + CONDUIT_* environment variables).
 */

#include <cstdint>

namespace conduit::config::constants {

// =====================
// Listener Defaults
// =====================
inline constexpr const char* LISTEN_ADDRESS_DEFAULT = "0.0.0.0";
inline constexpr uint16_t    LISTEN_PORT_DEFAULT    = 3000;
inline constexpr uint32_t    LISTEN_THREADS_DEFAULT = 4;

// =====================
// Load Balancer Defaults
// =====================
inline constexpr uint32_t LB_FAILURE_THRESHOLD   = 3;        ///< Consecutive failures before unhealthy
inline constexpr uint32_t LB_RECOVERY_THRESHOLD  = 2;        ///< Consecutive successes before healthy again
inline constexpr bool     LB_STICKY_SESSIONS     = false;    ///< Session affinity off by default
inline constexpr uint32_t LB_SESSION_TTL_MS      = 300000;   ///< 5 min affinity lifetime
inline constexpr uint64_t LB_HASH_SEED_DEFAULT   = 0xC0D417EULL; ///< Deterministic ip-hash salt
inline constexpr uint32_t INSTANCE_WEIGHT_DEFAULT = 1;
inline constexpr uint32_t INSTANCE_WEIGHT_MAX     = 1000;    ///< Bounds the weighted RR expansion

// =====================
// Health Checking Defaults
// =====================
inline constexpr uint32_t HEALTH_INTERVAL_MS        = 30000; ///< Background sweep period
inline constexpr uint32_t HEALTH_TIMEOUT_MS         = 5000;  ///< Per-probe timeout
inline constexpr uint32_t HEALTH_MAX_CONCURRENCY    = 8;     ///< Probes in flight per sweep
inline constexpr const char* HEALTH_PATH_DEFAULT    = "/health";

// =====================
// Circuit Breaker Defaults
// =====================
inline constexpr uint32_t BREAKER_FAILURE_THRESHOLD = 5;
inline constexpr uint32_t BREAKER_RESET_TIMEOUT_MS  = 60000;

// =====================
// Proxy Defaults
// =====================
inline constexpr uint32_t PROXY_TIMEOUT_MS      = 30000; ///< Whole-request budget
inline constexpr uint32_t PROXY_MAX_RETRIES     = 3;
inline constexpr uint32_t PROXY_BASE_DELAY_MS   = 1000;  ///< Backoff unit (delay = base * 2^attempt)
inline constexpr uint32_t PROXY_MAX_DELAY_MS    = 30000; ///< Backoff ceiling
inline constexpr uint32_t SERVICE_BASE_TIMEOUT_MS = 10000; ///< Per-attempt budget

} // namespace conduit::config::constants

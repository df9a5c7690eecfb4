#pragma once


/**
 * @file selection_policy.hpp
 * @brief Instance selection algorithms over a pre-filtered (healthy) candidate set.
 * @note Policies are pure functions of their inputs; per-service counters and
 *       per-instance statistics are owned and synchronized by the LoadBalancer.
 */
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "conduit/config/constants.hpp"
#include "conduit/routing/service.hpp"

namespace conduit::routing {

/**
 * @enum Algorithm
 * @brief Configurable selection strategies.
 */
enum class Algorithm : std::uint8_t {
    RoundRobin,         ///< Per-service counter mod candidate count
    WeightedRoundRobin, ///< Round-robin over the weight-expanded candidate list
    LeastConnections,   ///< Fewest open connections, first in list order on ties
    LeastResponseTime,  ///< Lowest running-average latency, first in list order on ties
    IpHash,             ///< Stable hash of the client key
    Random              ///< Uniform pick
};

/// Configuration spelling, e.g. "weighted-round-robin".
std::string_view to_string(Algorithm a) noexcept;

/// Parse the configuration spelling; nullopt for unknown names.
std::optional<Algorithm> parse_algorithm(std::string_view name) noexcept;

/// Candidate view handed to the policies (statistics sampled by the caller).
struct Candidate final {
    const ServiceInstance* instance{nullptr};
    std::int64_t connections{0};     ///< Open connections right now
    double       avg_response_ms{0}; ///< Running average; 0 when never sampled
};

/// Minimal per-request context used by policies.
struct SelectionContext final {
    std::uint64_t    tick{0};       ///< Value taken from the per-service round-robin counter
    std::string_view client_key{};  ///< Client identity (ip-hash)
    std::uint64_t    seed{config::constants::LB_HASH_SEED_DEFAULT};
};

// ---------------- Policies (index into `cands`; callers guarantee non-empty) ----------------

std::size_t choose_round_robin(std::span<const Candidate> cands, const SelectionContext& ctx) noexcept;
std::size_t choose_weighted_round_robin(std::span<const Candidate> cands, const SelectionContext& ctx) noexcept;
std::size_t choose_least_connections(std::span<const Candidate> cands) noexcept;
std::size_t choose_least_response_time(std::span<const Candidate> cands) noexcept;
std::size_t choose_ip_hash(std::span<const Candidate> cands, const SelectionContext& ctx) noexcept;
std::size_t choose_random(std::span<const Candidate> cands) noexcept;

/// Dispatch on `algo`. Returns 0 for an empty span.
std::size_t choose(Algorithm algo, std::span<const Candidate> cands, const SelectionContext& ctx) noexcept;

/// 64-bit stable hash of a client key (FNV-1a followed by an avalanche mix).
std::uint64_t client_hash(std::string_view key, std::uint64_t seed) noexcept;

} // namespace conduit::routing

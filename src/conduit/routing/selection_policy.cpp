
#include "conduit/routing/selection_policy.hpp"

#include <algorithm>
#include <random>

namespace conduit::routing {

namespace {

/// 64-bit avalanche mix used by the hashing strategy.
std::uint64_t mix(std::uint64_t x, std::uint64_t seed) noexcept {
    // Named constants (splitmix64/wyhash-style avalanching)
    constexpr std::uint64_t PHI = 0x9e3779b97f4a7c15ULL;        // golden ratio constant
    constexpr std::uint64_t M1  = 0xff51afd7ed558ccdULL;        // mix multiplier 1
    constexpr std::uint64_t M2  = 0xc4ceb9fe1a85ec53ULL;        // mix multiplier 2

    x ^= seed + PHI + (x << 6) + (x >> 2);
    x ^= (x >> 33); x *= M1;
    x ^= (x >> 33); x *= M2;
    x ^= (x >> 33);
    return x;
}

std::mt19937_64& thread_rng() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return rng;
}

} // namespace

std::string_view to_string(Algorithm a) noexcept {
    switch (a) {
        case Algorithm::RoundRobin:         return "round-robin";
        case Algorithm::WeightedRoundRobin: return "weighted-round-robin";
        case Algorithm::LeastConnections:   return "least-connections";
        case Algorithm::LeastResponseTime:  return "least-response-time";
        case Algorithm::IpHash:             return "ip-hash";
        case Algorithm::Random:             return "random";
    }
    return "round-robin";
}

std::optional<Algorithm> parse_algorithm(std::string_view name) noexcept {
    for (auto a : {Algorithm::RoundRobin, Algorithm::WeightedRoundRobin, Algorithm::LeastConnections,
                   Algorithm::LeastResponseTime, Algorithm::IpHash, Algorithm::Random}) {
        if (to_string(a) == name) return a;
    }
    return std::nullopt;
}

std::uint64_t client_hash(std::string_view key, std::uint64_t seed) noexcept {
    constexpr std::uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
    constexpr std::uint64_t FNV_PRIME  = 0x100000001b3ULL;
    std::uint64_t h = FNV_OFFSET;
    for (unsigned char c : key) { h ^= c; h *= FNV_PRIME; }
    return mix(h, seed);
}

// ---------------- Policies ----------------

std::size_t choose_round_robin(std::span<const Candidate> cands, const SelectionContext& ctx) noexcept {
    return static_cast<std::size_t>(ctx.tick % cands.size());
}

std::size_t choose_weighted_round_robin(std::span<const Candidate> cands, const SelectionContext& ctx) noexcept {
    // Position in the virtual list where each candidate is repeated `weight` times,
    // located by cumulative weight instead of materializing the expansion.
    std::uint64_t total = 0;
    for (const auto& c : cands) total += std::max<std::uint32_t>(c.instance->weight, 1);
    auto pos = ctx.tick % total;
    for (std::size_t i = 0; i < cands.size(); ++i) {
        const std::uint64_t w = std::max<std::uint32_t>(cands[i].instance->weight, 1);
        if (pos < w) return i;
        pos -= w;
    }
    return cands.size() - 1;
}

std::size_t choose_least_connections(std::span<const Candidate> cands) noexcept {
    std::size_t best = 0;
    for (std::size_t i = 1; i < cands.size(); ++i) {
        if (cands[i].connections < cands[best].connections) best = i; // strict: list order on ties
    }
    return best;
}

std::size_t choose_least_response_time(std::span<const Candidate> cands) noexcept {
    std::size_t best = 0;
    for (std::size_t i = 1; i < cands.size(); ++i) {
        if (cands[i].avg_response_ms < cands[best].avg_response_ms) best = i;
    }
    return best;
}

std::size_t choose_ip_hash(std::span<const Candidate> cands, const SelectionContext& ctx) noexcept {
    return static_cast<std::size_t>(client_hash(ctx.client_key, ctx.seed) % cands.size());
}

std::size_t choose_random(std::span<const Candidate> cands) noexcept {
    std::uniform_int_distribution<std::size_t> dist(0, cands.size() - 1);
    return dist(thread_rng());
}

std::size_t choose(Algorithm algo, std::span<const Candidate> cands, const SelectionContext& ctx) noexcept {
    if (cands.empty()) return 0;
    switch (algo) {
        case Algorithm::RoundRobin:         return choose_round_robin(cands, ctx);
        case Algorithm::WeightedRoundRobin: return choose_weighted_round_robin(cands, ctx);
        case Algorithm::LeastConnections:   return choose_least_connections(cands);
        case Algorithm::LeastResponseTime:  return choose_least_response_time(cands);
        case Algorithm::IpHash:             return choose_ip_hash(cands, ctx);
        case Algorithm::Random:             return choose_random(cands);
    }
    return choose_round_robin(cands, ctx);
}

} // namespace conduit::routing

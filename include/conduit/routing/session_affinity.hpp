#pragma once
/**
 * @file session_affinity.hpp
 * @brief Client key -> instance id bindings with a sliding TTL (sticky sessions).
 */

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "conduit/config/constants.hpp"
#include "conduit/routing/string_key.hpp"

namespace conduit::routing {

/** @class SessionAffinityTable
 *  @brief Thread-safe map of client bindings for one service.
 *  @details lookup() does not extend a binding; the load balancer re-binds after
 *           every sticky selection, which slides the expiry forward.
 */
class SessionAffinityTable {
public:
    using Clock = std::chrono::steady_clock;

    explicit SessionAffinityTable(std::chrono::milliseconds ttl =
                                      std::chrono::milliseconds{config::constants::LB_SESSION_TTL_MS}) noexcept
        : ttl_(ttl) {}

    /// Bound instance id for `client_key`, or nullopt if absent/expired (expired entries are erased).
    std::optional<std::string> lookup(std::string_view client_key, Clock::time_point now);

    /// Bind (or re-bind) `client_key` and set its expiry to now + ttl.
    void bind(std::string_view client_key, std::string_view instance_id, Clock::time_point now);

    /// Drop every binding that points at `instance_id`.
    std::size_t unbindInstance(std::string_view instance_id);

    /// Call `fn(instance_id)` once per distinct bound instance.
    void forEachBoundInstance(const std::function<void(std::string_view)>& fn) const;

    /// Erase expired bindings; returns how many were removed.
    std::size_t purgeExpired(Clock::time_point now);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::chrono::milliseconds ttl() const noexcept { return ttl_; }

private:
    struct Binding {
        std::string       instance_id;
        Clock::time_point expires_at;
    };

    const std::chrono::milliseconds ttl_;
    mutable std::mutex mu_;
    StringMap<Binding> bindings_;
};

} // namespace conduit::routing

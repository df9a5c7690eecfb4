#include "conduit/routing/session_affinity.hpp"

#include <unordered_set>

namespace conduit::routing {

std::optional<std::string> SessionAffinityTable::lookup(std::string_view client_key, Clock::time_point now) {
    std::lock_guard lk(mu_);
    auto it = bindings_.find(client_key);
    if (it == bindings_.end()) return std::nullopt;
    if (now >= it->second.expires_at) {
        bindings_.erase(it);
        return std::nullopt;
    }
    return it->second.instance_id;
}

void SessionAffinityTable::bind(std::string_view client_key, std::string_view instance_id, Clock::time_point now) {
    std::lock_guard lk(mu_);
    auto [it, inserted] = bindings_.try_emplace(std::string(client_key));
    it->second.instance_id.assign(instance_id);
    it->second.expires_at = now + ttl_;
}

void SessionAffinityTable::forEachBoundInstance(const std::function<void(std::string_view)>& fn) const {
    std::unordered_set<std::string> ids;
    {
        std::lock_guard lk(mu_);
        for (const auto& kv : bindings_) ids.insert(kv.second.instance_id);
    }
    for (const auto& id : ids) fn(id);
}

std::size_t SessionAffinityTable::unbindInstance(std::string_view instance_id) {
    std::lock_guard lk(mu_);
    return std::erase_if(bindings_, [&](const auto& kv) { return kv.second.instance_id == instance_id; });
}

std::size_t SessionAffinityTable::purgeExpired(Clock::time_point now) {
    std::lock_guard lk(mu_);
    return std::erase_if(bindings_, [&](const auto& kv) { return now >= kv.second.expires_at; });
}

std::size_t SessionAffinityTable::size() const {
    std::lock_guard lk(mu_);
    return bindings_.size();
}

} // namespace conduit::routing

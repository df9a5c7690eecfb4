#include "conduit/routing/service.hpp"

namespace conduit::routing {

std::string_view to_string(InstanceStatus s) noexcept {
    switch (s) {
        case InstanceStatus::Unknown:   return "unknown";
        case InstanceStatus::Healthy:   return "healthy";
        case InstanceStatus::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

} // namespace conduit::routing

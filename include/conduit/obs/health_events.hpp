#pragma once
/**
 * @file health_events.hpp
 * @brief Observer interface for instance health transitions.
 * @details Collaborators (ops dashboards, log sinks) subscribe explicitly instead of
 *          listening on a global event bus.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace conduit::obs {

    /** @enum HealthEvent
     *  @brief Direction of a health transition.
     */
    enum class HealthEvent : std::uint8_t {
        InstanceFailed,     ///< healthy -> unhealthy
        InstanceRecovered   ///< unhealthy -> healthy
    };

    /// Event name as published to observers ("instance.failed", "instance.recovered").
    std::string_view to_string(HealthEvent e) noexcept;

    /** @struct HealthTransition
     *  @brief Payload of a single transition.
     */
    struct HealthTransition {
        std::string   instance_id;          ///< Instance that flipped
        HealthEvent   event{HealthEvent::InstanceFailed};
        std::uint32_t consecutive_failures{0};
        std::uint32_t consecutive_successes{0};
        std::chrono::system_clock::time_point at{}; ///< Wall-clock time of the flip
    };

    /** @class HealthObserver
     *  @brief Sink for health transitions. Called on the thread that caused the flip.
     */
    class HealthObserver {
    public:
        virtual ~HealthObserver() = default;
        virtual void onTransition(const HealthTransition& t) = 0;
    };

    /// Observer that writes transitions to the "health" logger.
    std::shared_ptr<HealthObserver> make_logging_health_observer();

} // namespace conduit::obs

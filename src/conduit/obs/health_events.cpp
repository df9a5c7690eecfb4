/**
* @file health_events.cpp
 * @brief Logging implementation of HealthObserver.
 */
#include "conduit/obs/health_events.hpp"
#include "conduit/obs/logging.hpp"

namespace conduit::obs {

    std::string_view to_string(HealthEvent e) noexcept {
        switch (e) {
            case HealthEvent::InstanceFailed:    return "instance.failed";
            case HealthEvent::InstanceRecovered: return "instance.recovered";
        }
        return "instance.unknown";
    }

    namespace {

    class LoggingHealthObserver final : public HealthObserver {
    public:
        LoggingHealthObserver() : log_(logger("health")) {}

        void onTransition(const HealthTransition& t) override {
            if (t.event == HealthEvent::InstanceFailed) {
                log_->warn("{} instance={} consecutive_failures={}",
                           to_string(t.event), t.instance_id, t.consecutive_failures);
            } else {
                log_->info("{} instance={} consecutive_successes={}",
                           to_string(t.event), t.instance_id, t.consecutive_successes);
            }
        }

    private:
        std::shared_ptr<spdlog::logger> log_;
    };

    } // namespace

    std::shared_ptr<HealthObserver> make_logging_health_observer() {
        return std::make_shared<LoggingHealthObserver>();
    }

} // namespace conduit::obs

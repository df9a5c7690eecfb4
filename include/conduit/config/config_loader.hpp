#pragma once
/**
 * @file config_loader.hpp
 * @brief Gateway configuration: JSON file, CONDUIT_* environment overrides, validation.
 * @details All defaults reference named constants to avoid magic numbers.
 *          Validation runs once at startup; any violation throws ConfigError.
 */

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "conduit/config/constants.hpp"
#include "conduit/proxy/proxy_executor.hpp"
#include "conduit/routing/circuit_breaker.hpp"
#include "conduit/routing/health_tracker.hpp"
#include "conduit/routing/load_balancer.hpp"
#include "conduit/routing/route.hpp"
#include "conduit/routing/service.hpp"
#include "conduit/routing/service_registry.hpp"

namespace conduit::config {

    /// Invalid or unreadable configuration.
    class ConfigError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /** @struct ListenConfig
     *  @brief Inbound HTTP listener.
     */
    struct ListenConfig {
        std::string   address{constants::LISTEN_ADDRESS_DEFAULT};
        std::uint16_t port{constants::LISTEN_PORT_DEFAULT};
        std::uint32_t threads{constants::LISTEN_THREADS_DEFAULT};
    };

    /** @struct ServiceConfig
     *  @brief One backend service and its static instance list.
     */
    struct ServiceConfig {
        routing::ServiceDefinition definition;
        routing::InstanceList      instances;
    };

    /** @struct GatewayConfig
     *  @brief Aggregate of sub-configs required to wire the dispatch core.
     */
    struct GatewayConfig {
        ListenConfig                listen;
        std::string                 log_level{"info"};
        routing::BalancerConfig     balancer;          ///< Algorithm, stickiness, hash seed
        routing::HealthThresholds   thresholds;        ///< Health hysteresis (balancer section)
        routing::HealthCheckConfig  health;            ///< Background polling
        routing::BreakerConfig      breaker;
        proxy::ProxyConfig          proxy;
        std::vector<ServiceConfig>  services;
        routing::RouteList          routes;
    };

    /// Environment lookup, replaceable in tests.
    using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

    /// Reads the process environment.
    std::optional<std::string> process_env(const char* name);

    /** @class Loader
     *  @brief Source of gateway configuration.
     */
    class Loader {
    public:
        /**
         * @brief Parse a JSON file, apply environment overrides and validate.
         * @throws ConfigError if the file cannot be read, parsed or validated.
         */
        static GatewayConfig load_from_file(const std::string& path, const EnvLookup& env = process_env);

        /// Same as load_from_file() for an in-memory JSON document.
        static GatewayConfig load_from_json(std::string_view text, const EnvLookup& env = process_env);

        /// Valid configuration with named defaults and no services.
        static GatewayConfig load_defaults();

        /// Apply CONDUIT_* overrides. Malformed values throw ConfigError.
        static void apply_env(GatewayConfig& cfg, const EnvLookup& env);

        /// Fail fast on any invalid value.
        static void validate(const GatewayConfig& cfg);
    };

} // namespace conduit::config

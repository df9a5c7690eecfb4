/**
 * @file main.cpp
 * @brief conduit_gateway: bootstrap, wiring and lifecycle of the dispatch core.
 *
 * **Bootstrap**
 * - Load config (JSON file + CONDUIT_* env), apply log level.
 * - Construct HealthTracker, ServiceRegistry, MetricsAggregator, LoadBalancer,
 *   CircuitBreakerRegistry, RateLimiter, ProxyExecutor, GatewayHandler and pass
 *   references down; there are no process-wide singletons.
 *
 * **Lifecycle**
 * - Start background health checks and the HTTP listener.
 * - Purge expired sticky sessions and rate-limit windows once a minute, and drop
 *   balancer state of services that were unregistered.
 * - SIGINT/SIGTERM: stop the listener, then health checks.
 *
 * Usage: conduit_gateway [config.json]
 */

#include <chrono>
#include <csignal>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/spdlog.h>

#include "conduit/config/config_loader.hpp"
#include "conduit/gateway/gateway_handler.hpp"
#include "conduit/gateway/http_listener.hpp"
#include "conduit/obs/health_events.hpp"
#include "conduit/obs/logging.hpp"
#include "conduit/obs/metrics.hpp"
#include "conduit/proxy/beast_transport.hpp"
#include "conduit/proxy/proxy_executor.hpp"
#include "conduit/proxy/rate_limiter.hpp"
#include "conduit/routing/circuit_breaker.hpp"
#include "conduit/routing/health_tracker.hpp"
#include "conduit/routing/load_balancer.hpp"
#include "conduit/routing/service_registry.hpp"
#include "conduit/version.hpp"

namespace asio = boost::asio;
using namespace conduit;

namespace {

config::GatewayConfig load(int argc, char** argv) {
    if (argc > 1) return config::Loader::load_from_file(argv[1]);
    auto cfg = config::Loader::load_defaults();
    config::Loader::apply_env(cfg, config::process_env);
    config::Loader::validate(cfg);
    return cfg;
}

constexpr auto kJanitorPeriod = std::chrono::seconds(60);

} // namespace

int main(int argc, char** argv) {
    config::GatewayConfig cfg;
    try {
        cfg = load(argc, argv);
    } catch (const config::ConfigError& e) {
        std::cerr << "conduit_gateway: invalid configuration: " << e.what() << "\n";
        return 2;
    }
    obs::set_log_level(cfg.log_level);
    auto log = obs::logger("main");
    log->info("conduit-gateway {} starting (algorithm={}, services={}, routes={})", version_string,
              routing::to_string(cfg.balancer.algorithm), cfg.services.size(), cfg.routes.size());

    auto transport = std::make_shared<proxy::BeastTransport>();

    routing::HealthTracker health(cfg.thresholds);
    health.addObserver(obs::make_logging_health_observer());

    routing::ServiceRegistry registry(health, transport, cfg.health);
    for (const auto& svc : cfg.services) {
        if (auto rc = registry.registerService(svc.definition, svc.instances); rc != routing::RegistryErr::Ok) {
            log->critical("cannot register service '{}': {}", svc.definition.name, routing::to_string(rc));
            return 2;
        }
    }
    if (auto rc = registry.setRoutes(cfg.routes); rc != routing::RegistryErr::Ok) {
        log->critical("cannot load route table: {}", routing::to_string(rc));
        return 2;
    }

    obs::MetricsAggregator metrics;
    routing::LoadBalancer balancer(registry, health, metrics, cfg.balancer);
    routing::CircuitBreakerRegistry breakers(cfg.breaker);
    proxy::RateLimiter limiter;
    proxy::ProxyExecutor executor(registry, balancer, breakers, metrics, transport, cfg.proxy);
    gateway::GatewayHandler handler(registry, balancer, breakers, metrics, executor, limiter);

    gateway::HttpListener listener(
        gateway::ListenerOptions{cfg.listen.address, cfg.listen.port, cfg.listen.threads}, handler);
    try {
        listener.start();
    } catch (const std::exception& e) {
        log->critical("cannot listen on {}:{}: {}", cfg.listen.address, cfg.listen.port, e.what());
        return 1;
    }
    registry.startHealthChecks();

    asio::io_context control;
    asio::steady_timer janitor(control);
    std::function<void()> arm = [&] {
        janitor.expires_after(kJanitorPeriod);
        janitor.async_wait([&](const boost::system::error_code& ec) {
            if (ec) return;
            const auto sessions = balancer.purgeExpiredSessions();
            const auto windows = limiter.purgeExpired();
            const auto stale = balancer.pruneUnregistered();
            if (sessions + windows + stale > 0) {
                log->debug("purged {} sessions, {} rate windows, {} unregistered entries",
                           sessions, windows, stale);
            }
            arm();
        });
    };
    arm();

    asio::signal_set signals(control, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec) return;
        log->info("signal {} received, shutting down", sig);
        janitor.cancel();
        control.stop();
    });
    control.run();

    listener.stop();
    registry.stopHealthChecks();
    log->info("conduit-gateway stopped");
    spdlog::shutdown();
    return 0;
}

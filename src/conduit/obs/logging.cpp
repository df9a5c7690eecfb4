/**
 * @file logging.cpp
 * @brief spdlog-backed component loggers.
 */
#include "conduit/obs/logging.hpp"

#include <array>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace conduit::obs {

namespace {

constexpr const char* kPattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";

spdlog::sink_ptr shared_sink() {
    static spdlog::sink_ptr sink = [] {
        auto s = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        s->set_pattern(kPattern);
        return s;
    }();
    return sink;
}

std::mutex g_create_mu;

constexpr std::array<std::string_view, 7> kLevelNames{
    "trace", "debug", "info", "warn", "error", "critical", "off"};

} // namespace

std::shared_ptr<spdlog::logger> logger(const std::string& component) {
    if (auto existing = spdlog::get(component)) return existing;

    std::lock_guard<std::mutex> lk(g_create_mu);
    if (auto existing = spdlog::get(component)) return existing; // raced
    auto lg = std::make_shared<spdlog::logger>(component, shared_sink());
    lg->set_level(spdlog::get_level());
    spdlog::register_logger(lg);
    return lg;
}

bool is_valid_log_level(std::string_view level) noexcept {
    for (auto n : kLevelNames) if (n == level) return true;
    return false;
}

bool set_log_level(std::string_view level) {
    if (!is_valid_log_level(level)) return false;
    // spdlog::set_level applies to every registered logger and becomes the default.
    spdlog::set_level(spdlog::level::from_str(std::string(level)));
    return true;
}

} // namespace conduit::obs

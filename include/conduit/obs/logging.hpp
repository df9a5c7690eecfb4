#pragma once
/**
 * @file logging.hpp
 * @brief Named spdlog loggers sharing one stderr sink.
 */

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace conduit::obs {

/**
 * @brief Get (or lazily create) the logger for a component, e.g. "registry".
 * @details All component loggers write through the same colour stderr sink and
 *          honour the level set by set_log_level().
 */
std::shared_ptr<spdlog::logger> logger(const std::string& component);

/**
 * @brief Apply a textual level ("trace", "debug", "info", "warn", "error", "off").
 * @return false if the level name is not recognised (level left unchanged).
 */
bool set_log_level(std::string_view level);

/// True if `level` names a valid spdlog level.
bool is_valid_log_level(std::string_view level) noexcept;

} // namespace conduit::obs

/**
 * @file Log.hpp
 * @brief Diagnostics seam for the stratum core
 *
 * Every recoverable anomaly (type mismatch on get, codec fallback, skipped
 * override replay, cycle in a container graph) is reported through a single
 * spdlog logger named "stratum". Hosts decide routing and formatting by
 * installing their own logger.
 */

#ifndef STRATUM_LOG_HPP
#define STRATUM_LOG_HPP

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace stratum {

/// Name under which the default logger is created.
inline constexpr const char* kLoggerName = "stratum";

/**
 * @brief Get the logger used by the core.
 *
 * Lazily creates a stderr color logger at warn level when the host has not
 * installed one.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Replace the logger used by the core.
 * @param logger New logger; nullptr restores the default logger
 */
void set_logger(std::shared_ptr<spdlog::logger> logger);

/**
 * @brief Set the level of the active logger from its name.
 *
 * Accepts "trace", "debug", "info", "warn", "error", "critical", "off"
 * (case-insensitive).
 *
 * @return false if the name is not a known level (level left unchanged)
 */
bool set_log_level(const std::string& level);

} // namespace stratum

#endif // STRATUM_LOG_HPP

#pragma once

/**
 * @file log.hpp
 * @brief spdlog logger construction for verso components
 */

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace verso::log {

/// Name under which the shared verso logger is registered with spdlog.
inline constexpr const char* kLoggerName = "verso";

/// Pattern used by the default stderr logger.
inline constexpr const char* kDefaultPattern = "[%l] %v";

/**
 * Create a logger writing to the given sinks. The logger is not registered
 * with spdlog, so callers (tests in particular) own its lifetime.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger>
make_logger(const std::string& name,
            std::vector<spdlog::sink_ptr> sinks,
            spdlog::level::level_enum level = spdlog::level::info);

/**
 * Shared stderr logger, created and registered on first use.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> default_logger();

/**
 * Return @p logger if set, otherwise the shared default logger.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger>
logger_or_default(std::shared_ptr<spdlog::logger> logger);

}  // namespace verso::log

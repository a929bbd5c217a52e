/**
 * @file log.cpp
 * @brief spdlog logger construction
 */

#include "verso/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace verso::log {

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            std::vector<spdlog::sink_ptr> sinks,
                                            spdlog::level::level_enum level)
{
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(kDefaultPattern);
    return logger;
}

std::shared_ptr<spdlog::logger> default_logger()
{
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_pattern(kDefaultPattern);
    logger->set_level(spdlog::level::warn);
    return logger;
}

std::shared_ptr<spdlog::logger> logger_or_default(std::shared_ptr<spdlog::logger> logger)
{
    if (logger) {
        return logger;
    }
    return default_logger();
}

}  // namespace verso::log

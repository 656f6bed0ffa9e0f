#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace geosphere {

/**
 * @brief Get the logger of a module, creating it on first use
 * @param module_name Logger name (e.g., "converter")
 * @return Thread-safe logger shared by every caller using the same name
 */
std::shared_ptr<spdlog::logger> create_module_logger(const std::string& module_name);

/**
 * @brief Set the level of every registered logger
 * @param level One of trace, debug, info, warn, error, off
 * @throw Error if the level name is unknown
 */
void set_log_level(const std::string& level);

class Config;

/**
 * @brief Apply the "logging" section of a config (logging.level, default "info")
 */
void configure_logging(const Config& config);

}  // namespace geosphere

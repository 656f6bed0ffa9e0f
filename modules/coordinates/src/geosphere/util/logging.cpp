#include <geosphere/util/logging.hpp>

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <geosphere/errors.hpp>
#include <geosphere/util/config.hpp>

namespace geosphere {

namespace {
    std::mutex logger_mutex;
}

std::shared_ptr<spdlog::logger> create_module_logger(const std::string& module_name) {
    std::lock_guard<std::mutex> lock(logger_mutex);

    auto logger = spdlog::get(module_name);
    if (logger) {
        return logger;
    }

    logger = spdlog::stdout_color_mt(module_name);
    logger->set_level(spdlog::get_level());
    return logger;
}

void set_log_level(const std::string& level) {
    spdlog::level::level_enum log_level;
    if (level == "trace") {
        log_level = spdlog::level::trace;
    } else if (level == "debug") {
        log_level = spdlog::level::debug;
    } else if (level == "info") {
        log_level = spdlog::level::info;
    } else if (level == "warn") {
        log_level = spdlog::level::warn;
    } else if (level == "error") {
        log_level = spdlog::level::err;
    } else if (level == "off") {
        log_level = spdlog::level::off;
    } else {
        throw Error("unknown log level: " + level);
    }

    spdlog::set_level(log_level);
}

void configure_logging(const Config& config) {
    set_log_level(config.param<std::string>("logging", "level", "info"));
}

}  // namespace geosphere

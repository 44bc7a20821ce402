#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

namespace logging {
    spdlog::level::level_enum parse_level(const std::string& level_name) {
        if (level_name == "trace") {
            return spdlog::level::trace;
        }
        if (level_name == "debug") {
            return spdlog::level::debug;
        }
        if (level_name == "info") {
            return spdlog::level::info;
        }
        if (level_name == "warn") {
            return spdlog::level::warn;
        }
        if (level_name == "error") {
            return spdlog::level::err;
        }
        if (level_name == "off") {
            return spdlog::level::off;
        }
        throw std::invalid_argument("Unknown log level: " + level_name);
    }

    void init(const std::string& level_name) {
        auto logger = spdlog::get(LOGGER_NAME);
        if (!logger) {
            logger = spdlog::stdout_color_mt(LOGGER_NAME);
        }

        logger->set_pattern(LOG_PATTERN);
        logger->set_level(parse_level(level_name));
        spdlog::set_default_logger(logger);
    }
}  // namespace logging

#ifndef OFFLINE_CACHE_LOGGING_HPP
#define OFFLINE_CACHE_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

namespace logging {
    inline constexpr const char* LOGGER_NAME = "offline_cache";
    inline constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";

    // Throws std::invalid_argument for an unknown level name.
    spdlog::level::level_enum parse_level(const std::string& level_name);

    void init(const std::string& level_name);
}  // namespace logging

#endif

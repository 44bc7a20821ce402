#ifndef OFFLINE_CACHE_CONSTANTS_HPP
#define OFFLINE_CACHE_CONSTANTS_HPP

#include <array>
#include <string_view>

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr long long ONE_SECOND_MS = 1000LL;
    inline constexpr long long ONE_MINUTE_MS = 60LL * ONE_SECOND_MS;
    inline constexpr long long DEFAULT_API_TTL_MS = 5LL * ONE_MINUTE_MS;
    inline constexpr long long CONTROL_REPLY_TIMEOUT_MS = 10LL * ONE_SECOND_MS;

    inline constexpr long HTTP_OK = 200;
    inline constexpr long HTTP_OK_UPPER_BOUNDARY = 300;
    inline constexpr long HTTP_CACHEABLE_UPPER_BOUNDARY = 400;
    inline constexpr long HTTP_UNAUTHORIZED = 401;
    inline constexpr long HTTP_SERVICE_UNAVAILABLE = 503;

    inline constexpr const char* STORED_AT_HEADER = "sw-cached-at";
    inline constexpr const char* CACHE_VERSION_HEADER = "sw-cache-version";
    inline constexpr const char* CONTENT_TYPE_HEADER = "content-type";

    inline constexpr const char* STATIC_PARTITION = "static";
    inline constexpr const char* DYNAMIC_PARTITION = "dynamic";
    inline constexpr const char* API_PARTITION = "api";
    inline constexpr std::array<std::string_view, 3> MANAGED_PARTITIONS = {STATIC_PARTITION, DYNAMIC_PARTITION, API_PARTITION};

    inline constexpr const char* OFFLINE_TEXT_BODY = "Offline - resource not available";
    inline constexpr const char* OFFLINE_JSON_ERROR = "Offline - data not available";
    inline constexpr const char* SERVICE_UNAVAILABLE_BODY = "Service Unavailable";
}  // namespace constants

#endif

#ifndef OFFLINE_CACHE_STRING_UTILS_HPP
#define OFFLINE_CACHE_STRING_UTILS_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    std::string trim(std::string s);

    std::string to_lower(std::string s);

    std::string to_upper(std::string s);

    bool starts_with(std::string_view s, std::string_view prefix);

    std::filesystem::path append_to_path(const std::filesystem::path& path, const std::string& str);

    std::vector<std::string> split_comma_delimited_string(std::string_view sv);

    std::string iso8601_utc(long long unix_ms);
}  // namespace string_utils

#endif

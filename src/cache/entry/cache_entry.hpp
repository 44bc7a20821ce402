#ifndef OFFLINE_CACHE_CACHE_ENTRY_HPP
#define OFFLINE_CACHE_CACHE_ENTRY_HPP

#include <string>

#include "../../http/model/model.hpp"

namespace cache::entry {
    struct CacheEntry {
        std::string key_;
        std::string url_;
        http::model::Response response_;
        long long stored_at_ms_ = 0;
        std::string version_;
    };

    // "<METHOD> <url-without-fragment>"
    [[nodiscard]] std::string make_cache_key(const std::string& method, const std::string& url);
    [[nodiscard]] std::string make_cache_key(const http::model::Request& req);
    [[nodiscard]] std::string url_from_key(const std::string& key);

    // Bytes charged against a storage quota.
    [[nodiscard]] size_t approximate_size(const CacheEntry& entry);
}  // namespace cache::entry

#endif

#include "cache_entry.hpp"

#include <string>

#include "../../http/model/url.hpp"
#include "../../utils/string_utils.hpp"

namespace cache::entry {
    std::string make_cache_key(const std::string& method, const std::string& url) {
        std::string normalized;
        if (auto parsed = http::model::parse_url(url)) {
            normalized = parsed->without_fragment();
        } else {
            normalized = url.substr(0, url.find('#'));
        }
        return string_utils::to_upper(method) + " " + normalized;
    }

    std::string make_cache_key(const http::model::Request& req) { return make_cache_key(req.method_, req.url_); }

    std::string url_from_key(const std::string& key) {
        auto pos = key.find(' ');
        return pos == std::string::npos ? key : key.substr(pos + 1);
    }

    size_t approximate_size(const CacheEntry& entry) {
        size_t size = entry.key_.size() + entry.url_.size() + entry.version_.size() + entry.response_.body_.size() + entry.response_.status_text_.size();
        for (const auto& [name, value] : entry.response_.headers_) {
            size += name.size() + value.size();
        }
        return size;
    }
}  // namespace cache::entry

#ifndef OFFLINE_CACHE_FALLBACK_HPP
#define OFFLINE_CACHE_FALLBACK_HPP

#include <string>

#include "../http/model/model.hpp"

namespace strategies::fallback {
    // 503 text/plain for page-like and asset requests.
    http::model::Response offline_text_response();

    // 503 application/json {error, timestamp} for api-like requests.
    http::model::Response offline_json_response(long long now_ms);

    // Bare 503 returned when a revalidation fetch fails with nothing cached.
    http::model::Response service_unavailable_response();

    // Copy of resp carrying the stored-at stamp and, when non-empty, the cache version.
    http::model::Response stamped_copy(const http::model::Response& resp, long long stored_at_ms, const std::string& version);
}  // namespace strategies::fallback

#endif

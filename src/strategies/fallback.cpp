#include "fallback.hpp"

#include <json/json.h>

#include <string>

#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"

namespace strategies::fallback {
    namespace {
        constexpr const char* SERVICE_UNAVAILABLE_TEXT = "Service Unavailable";
    }

    http::model::Response offline_text_response() {
        return http::model::make_text_response(constants::HTTP_SERVICE_UNAVAILABLE, SERVICE_UNAVAILABLE_TEXT, constants::OFFLINE_TEXT_BODY, "text/plain");
    }

    http::model::Response offline_json_response(long long now_ms) {
        Json::Value body;
        body["error"] = constants::OFFLINE_JSON_ERROR;
        body["timestamp"] = string_utils::iso8601_utc(now_ms);

        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";

        return http::model::make_text_response(constants::HTTP_SERVICE_UNAVAILABLE, SERVICE_UNAVAILABLE_TEXT, Json::writeString(writer, body),
                                               "application/json");
    }

    http::model::Response service_unavailable_response() {
        http::model::Response r;
        r.status_ = constants::HTTP_SERVICE_UNAVAILABLE;
        r.status_text_ = SERVICE_UNAVAILABLE_TEXT;
        r.body_ = constants::SERVICE_UNAVAILABLE_BODY;
        return r;
    }

    http::model::Response stamped_copy(const http::model::Response& resp, long long stored_at_ms, const std::string& version) {
        http::model::Response stamped = resp;
        stamped.set_header(constants::STORED_AT_HEADER, std::to_string(stored_at_ms));
        if (!version.empty()) {
            stamped.set_header(constants::CACHE_VERSION_HEADER, version);
        }
        return stamped;
    }
}  // namespace strategies::fallback

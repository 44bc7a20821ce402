#ifndef OFFLINE_CACHE_MODEL_HPP
#define OFFLINE_CACHE_MODEL_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace http::model {
    struct Request {
        std::string url_;
        std::string method_ = "GET";
        std::string body_;

        std::vector<std::string> headers_;

        // 0 means no explicit timeout; the transport's connect timeout still applies.
        long timeout_ms_ = 0;
    };

    struct Response {
        long status_ = 0;

        std::string status_text_;
        std::string body_;
        std::string effective_url_;

        // Header names are stored lower-cased.
        std::map<std::string, std::string> headers_;

        [[nodiscard]] std::optional<std::string> header(const std::string& name) const;
        void set_header(const std::string& name, std::string value);

        // 2xx, the fetch API's response.ok.
        [[nodiscard]] bool is_ok() const;
        // [200, 400), the bound used for cache-worthiness.
        [[nodiscard]] bool is_cacheable() const;
    };

    Response make_text_response(long status, std::string status_text, std::string body, const std::string& content_type);
}  // namespace http::model

#endif

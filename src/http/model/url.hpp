#ifndef OFFLINE_CACHE_URL_HPP
#define OFFLINE_CACHE_URL_HPP

#include <optional>
#include <string>
#include <string_view>

namespace http::model {
    struct Url {
        std::string scheme_;
        std::string host_;
        std::string port_;
        std::string path_ = "/";
        std::string query_;     // including the leading '?', empty if absent
        std::string fragment_;  // including the leading '#', empty if absent

        [[nodiscard]] std::string origin() const;
        [[nodiscard]] std::string path_and_query() const;
        [[nodiscard]] std::string without_fragment() const;
    };

    // Absolute URLs only ("scheme://authority/path?query#fragment"); nullopt otherwise.
    std::optional<Url> parse_url(std::string_view raw);

    // Resolves root-relative and absolute URLs against an origin such as "https://app.example".
    std::string resolve_url(const std::string& origin, const std::string& url);
}  // namespace http::model

#endif

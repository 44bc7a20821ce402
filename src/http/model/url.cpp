#include "url.hpp"

#include <string>
#include <string_view>

#include "../../utils/string_utils.hpp"

namespace http::model {
    std::string Url::origin() const {
        std::string out = scheme_ + "://" + host_;
        if (!port_.empty()) {
            out += ":" + port_;
        }
        return out;
    }

    std::string Url::path_and_query() const { return path_ + query_; }

    std::string Url::without_fragment() const { return origin() + path_and_query(); }

    std::optional<Url> parse_url(std::string_view raw) {
        const auto scheme_end = raw.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::nullopt;
        }

        Url url;
        url.scheme_ = string_utils::to_lower(std::string(raw.substr(0, scheme_end)));

        std::string_view rest = raw.substr(scheme_end + 3);

        const auto fragment_pos = rest.find('#');
        if (fragment_pos != std::string_view::npos) {
            url.fragment_ = std::string(rest.substr(fragment_pos));
            rest = rest.substr(0, fragment_pos);
        }

        const auto query_pos = rest.find('?');
        if (query_pos != std::string_view::npos) {
            url.query_ = std::string(rest.substr(query_pos));
            rest = rest.substr(0, query_pos);
        }

        const auto path_pos = rest.find('/');
        std::string_view authority = rest.substr(0, path_pos);
        if (path_pos != std::string_view::npos) {
            url.path_ = std::string(rest.substr(path_pos));
        }

        if (authority.empty()) {
            return std::nullopt;
        }

        // userinfo is not part of the origin
        const auto at_pos = authority.rfind('@');
        if (at_pos != std::string_view::npos) {
            authority = authority.substr(at_pos + 1);
        }

        const auto port_pos = authority.rfind(':');
        if (port_pos != std::string_view::npos && authority.find(']', port_pos) == std::string_view::npos) {
            url.port_ = std::string(authority.substr(port_pos + 1));
            authority = authority.substr(0, port_pos);
        }

        url.host_ = string_utils::to_lower(std::string(authority));

        if ((url.scheme_ == "http" && url.port_ == "80") || (url.scheme_ == "https" && url.port_ == "443")) {
            url.port_.clear();
        }

        return url;
    }

    std::string resolve_url(const std::string& origin, const std::string& url) {
        if (parse_url(url)) {
            return url;
        }

        std::string base = origin;
        while (!base.empty() && base.back() == '/') {
            base.pop_back();
        }

        if (url.empty()) {
            return base + "/";
        }

        if (url.front() == '/') {
            return base + url;
        }

        return base + "/" + url;
    }
}  // namespace http::model

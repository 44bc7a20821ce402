#include "model.hpp"

#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

namespace http::model {
    std::optional<std::string> Response::header(const std::string& name) const {
        auto it = headers_.find(string_utils::to_lower(name));
        if (it == headers_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void Response::set_header(const std::string& name, std::string value) { headers_[string_utils::to_lower(name)] = std::move(value); }

    bool Response::is_ok() const { return status_ >= constants::HTTP_OK && status_ < constants::HTTP_OK_UPPER_BOUNDARY; }

    bool Response::is_cacheable() const { return status_ >= constants::HTTP_OK && status_ < constants::HTTP_CACHEABLE_UPPER_BOUNDARY; }

    Response make_text_response(long status, std::string status_text, std::string body, const std::string& content_type) {
        Response r;
        r.status_ = status;
        r.status_text_ = std::move(status_text);
        r.body_ = std::move(body);
        r.set_header(constants::CONTENT_TYPE_HEADER, content_type);
        return r;
    }
}  // namespace http::model

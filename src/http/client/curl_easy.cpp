#include "curl_easy.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"

namespace http::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long MAX_REDIRECTS = 10L;
        static constexpr long CONNECT_TIMEOUT_MS = 10'000L;
        static constexpr long NO_TIMEOUT = 0L;
        static constexpr const char* USER_AGENT = "offline-cache/1.0";
        static constexpr const char* ACCEPT_ENCODING = "";
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long TCP_KEEPALIVE = 1L;
        static constexpr long TCP_KEEPIDLE = 120L;
        static constexpr long TCP_KEEPINTVL = 60L;
        static constexpr long ENABLED = 1L;
        static constexpr long DISABLED = 0L;
        static constexpr const char* CUSTOM_REQUEST = nullptr;
    };

    CurlEasy::CurlEasy() : handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once();
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_url(const std::string& u) { setopt(CURLOPT_URL, u.c_str()); }

    void CurlEasy::set_headers(const std::vector<std::string>& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& h : hs) {
            headers_ = curl_slist_append(headers_, h.c_str());
        }
        setopt(CURLOPT_HTTPHEADER, headers_);
    }

    void CurlEasy::set_defaults_once() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, CurlDefaults::CONNECT_TIMEOUT_MS);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_USERAGENT, CurlDefaults::USER_AGENT);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
    }

    void CurlEasy::enable_keepalive() {
        setopt(CURLOPT_TCP_KEEPALIVE, CurlDefaults::TCP_KEEPALIVE);
        setopt(CURLOPT_TCP_KEEPIDLE, CurlDefaults::TCP_KEEPIDLE);
        setopt(CURLOPT_TCP_KEEPINTVL, CurlDefaults::TCP_KEEPINTVL);
    }

    void CurlEasy::enable_compression() {
        // Empty string accepts every encoding libcurl was built with.
        setopt(CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);
    }

    void CurlEasy::prepare_for_new_request(const http::model::Request& req, std::string& body) {
        last_response_headers_.clear();
        last_status_text_.clear();
        error_buf_[0] = '\0';
        body.clear();

        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, &body);
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, this);
        setopt(CURLOPT_TIMEOUT_MS, req.timeout_ms_ > 0 ? req.timeout_ms_ : CurlDefaults::NO_TIMEOUT);

        // Reset the verb state left behind by the previous request on this handle.
        setopt(CURLOPT_NOBODY, CurlDefaults::DISABLED);
        setopt(CURLOPT_CUSTOMREQUEST, CurlDefaults::CUSTOM_REQUEST);
        setopt(CURLOPT_HTTPGET, CurlDefaults::ENABLED);

        const std::string method = string_utils::to_upper(req.method_);
        if (method == "GET") {
            return;
        }

        if (method == "HEAD") {
            setopt(CURLOPT_NOBODY, CurlDefaults::ENABLED);
            return;
        }

        setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body_.size()));
        setopt(CURLOPT_COPYPOSTFIELDS, req.body_.c_str());
        if (method != "POST") {
            setopt(CURLOPT_CUSTOMREQUEST, method.c_str());
        }
    }

    bool CurlEasy::parse_status_line(const char* buffer, size_t bytes, std::string& out_reason) {
        if (!string_utils::ieq_prefix(buffer, bytes, "HTTP/")) {
            return false;
        }

        std::string line = string_utils::trim(std::string(buffer, bytes));
        // "HTTP/1.1 200 OK" -> skip version and code
        auto first_space = line.find(' ');
        if (first_space == std::string::npos) {
            out_reason.clear();
            return true;
        }
        auto second_space = line.find(' ', first_space + 1);
        out_reason = second_space == std::string::npos ? std::string{} : line.substr(second_space + 1);
        return true;
    }

    bool CurlEasy::parse_header_line(const char* buffer, size_t bytes, std::string& out_name, std::string& out_value) {
        const char* end = buffer + bytes;
        const char* colon = buffer;
        while (colon < end && *colon != ':') {
            ++colon;
        }
        if (colon == end || colon == buffer) {
            return false;
        }

        out_name = string_utils::to_lower(string_utils::trim(std::string(buffer, colon)));

        const char* start = colon + 1;
        while (start < end && (*start == ' ' || *start == '\t')) {
            ++start;
        }
        while (end > start && (end[-1] == '\r' || end[-1] == '\n' || end[-1] == ' ' || end[-1] == '\t')) {
            --end;
        }
        out_value.assign(start, end);
        return true;
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;

        // A new status line starts a new header block (redirects, 100-continue).
        std::string reason;
        if (parse_status_line(buffer, bytes, reason)) {
            self->last_response_headers_.clear();
            self->last_status_text_ = std::move(reason);
            return bytes;
        }

        std::string name;
        std::string value;
        if (parse_header_line(buffer, bytes, name, value)) {
            auto [it, inserted] = self->last_response_headers_.emplace(name, value);
            if (!inserted) {
                it->second += ", " + value;
            }
        }

        return bytes;
    }

    http::model::Response CurlEasy::fetch(const http::model::Request& req) {
        set_url(req.url_);
        set_headers(req.headers_);

        std::string body;
        prepare_for_new_request(req, body);

        perform_throw(req.url_);
        return make_response(body);
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }
    // explicit instantiations for used types (optional but can help some compilers)
    template void CurlEasy::setopt<long>(int, long);
    template void CurlEasy::setopt<const char*>(int, const char*);
    template void CurlEasy::setopt<void*>(int, void*);

    void CurlEasy::perform_throw(const std::string& url) {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        std::string err = "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        spdlog::debug("Network failure for {}: {}", url, err);
        throw http::error::NetworkError(url, err);
    }

    http::model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        char* eff = nullptr;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);

        http::model::Response r;
        r.status_ = code;
        r.status_text_ = std::move(last_status_text_);
        r.body_ = std::move(incoming_body);
        r.effective_url_ = eff != nullptr ? eff : std::string{};
        r.headers_ = std::move(last_response_headers_);
        return r;
    }

}  // namespace http::client

#ifndef OFFLINE_CACHE_CURL_EASY_HPP
#define OFFLINE_CACHE_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <map>
#include <string>
#include <vector>

#include "../model/model.hpp"
#include "interface.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = 256;

    class CurlEasy : public IHttpClient {
       public:
        CurlEasy();

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response fetch(const http::model::Request& req) override;
        void set_url(const std::string& u);
        void set_headers(const std::vector<std::string>& hs);
        void enable_keepalive();
        void enable_compression();

        static bool parse_header_line(const char* buffer, size_t bytes, std::string& out_name, std::string& out_value);
        static bool parse_status_line(const char* buffer, size_t bytes, std::string& out_reason);

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void perform_throw(const std::string& url);
        http::model::Response make_response(std::string& incoming_body);
        void set_defaults_once();
        void prepare_for_new_request(const http::model::Request& req, std::string& body);
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);

        std::string last_status_text_;
        std::map<std::string, std::string> last_response_headers_;
        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
    };
}  // namespace http::client

#endif

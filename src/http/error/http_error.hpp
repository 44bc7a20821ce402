#ifndef OFFLINE_CACHE_HTTP_ERROR_HPP
#define OFFLINE_CACHE_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

namespace http::error {
    // A fetch that produced no HTTP response at all (DNS, connect, TLS, timeout, reset).
    struct NetworkError : public std::runtime_error {
        std::string url_;
        explicit NetworkError(std::string u, const std::string &msg);
    };
}  // namespace http::error

#endif

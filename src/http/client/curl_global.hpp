#ifndef OFFLINE_CACHE_CURL_GLOBAL_HPP
#define OFFLINE_CACHE_CURL_GLOBAL_HPP

#include <string>

namespace http::client {

    // Must outlive every CurlEasy handle; create exactly one per process.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;

        [[nodiscard]] static std::string version();
    };

}  // namespace http::client

#endif

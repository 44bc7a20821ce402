#ifndef OFFLINE_CACHE_CLIENT_INTERFACE_HPP
#define OFFLINE_CACHE_CLIENT_INTERFACE_HPP

#include <functional>
#include <memory>

#include "../model/model.hpp"

namespace http::client {
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        // Any HTTP status is returned as a Response; throws http::error::NetworkError
        // when no response was received.
        virtual http::model::Response fetch(const http::model::Request& req) = 0;
    };

    // Clients are not shared between threads; every task asks the factory for its own.
    using HttpClientFactory = std::function<std::unique_ptr<IHttpClient>()>;
}  // namespace http::client

#endif

#ifndef OFFLINE_CACHE_TESTS_FAKE_HTTP_CLIENT_HPP
#define OFFLINE_CACHE_TESTS_FAKE_HTTP_CLIENT_HPP

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../../src/http/client/interface.hpp"
#include "../../src/http/error/http_error.hpp"
#include "../../src/http/model/model.hpp"

namespace test_support {
    // Scripted origin shared by every client the factory hands out.
    // Unscripted urls fail like an unreachable host.
    class FakeNetwork {
       public:
        void respond(const std::string& url, long status, std::string body, std::map<std::string, std::string> headers = {}) {
            http::model::Response resp;
            resp.status_ = status;
            resp.status_text_ = status < 400 ? "OK" : "Error";
            resp.body_ = std::move(body);
            resp.effective_url_ = url;
            for (auto& [name, value] : headers) {
                resp.set_header(name, std::move(value));
            }

            std::lock_guard<std::mutex> lock(mutex_);
            routes_[url] = std::move(resp);
        }

        void fail(const std::string& url) {
            std::lock_guard<std::mutex> lock(mutex_);
            routes_[url] = std::nullopt;
        }

        // Fetches block until release().
        void hold() {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = true;
        }

        void release() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                held_ = false;
            }
            cv_.notify_all();
        }

        http::model::Response handle(const http::model::Request& req) {
            std::unique_lock<std::mutex> lock(mutex_);
            ++calls_[req.url_];
            requests_.push_back(req);
            cv_.notify_all();

            cv_.wait(lock, [this]() { return !held_; });

            auto it = routes_.find(req.url_);
            if (it == routes_.end() || !it->second) {
                throw http::error::NetworkError(req.url_, "Could not resolve host");
            }
            return *it->second;
        }

        [[nodiscard]] size_t calls(const std::string& url) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = calls_.find(url);
            return it == calls_.end() ? 0 : it->second;
        }

        [[nodiscard]] size_t total_calls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_.size();
        }

        [[nodiscard]] std::vector<http::model::Request> requests() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_;
        }

        // True once url has been requested at least n times.
        bool wait_for_calls(const std::string& url, size_t n, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
            std::unique_lock<std::mutex> lock(mutex_);
            return cv_.wait_for(lock, timeout, [this, &url, n]() {
                auto it = calls_.find(url);
                return it != calls_.end() && it->second >= n;
            });
        }

       private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        bool held_ = false;
        std::map<std::string, std::optional<http::model::Response>> routes_;
        std::map<std::string, size_t> calls_;
        std::vector<http::model::Request> requests_;
    };

    class FakeHttpClient : public http::client::IHttpClient {
       public:
        explicit FakeHttpClient(std::shared_ptr<FakeNetwork> network) : network_(std::move(network)) {}

        http::model::Response fetch(const http::model::Request& req) override { return network_->handle(req); }

       private:
        std::shared_ptr<FakeNetwork> network_;
    };

    inline http::client::HttpClientFactory make_factory(const std::shared_ptr<FakeNetwork>& network) {
        return [network]() { return std::make_unique<FakeHttpClient>(network); };
    }
}  // namespace test_support

#endif

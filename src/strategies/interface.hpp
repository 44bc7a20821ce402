#ifndef OFFLINE_CACHE_STRATEGY_INTERFACE_HPP
#define OFFLINE_CACHE_STRATEGY_INTERFACE_HPP

#pragma once

#include <memory>
#include <vector>

#include "../cache/store/store_manager.hpp"
#include "../config/worker_config.hpp"
#include "../http/client/interface.hpp"
#include "../http/model/model.hpp"
#include "../routing/classifier.hpp"
#include "../utils/failure_kind.hpp"
#include "../utils/thread_pool.hpp"

namespace strategies {
    enum class ResponseSource { CACHE, NETWORK, SYNTHESIZED };

    const char* to_string(ResponseSource source);

    struct Resolution {
        http::model::Response response_;
        ResponseSource source_ = ResponseSource::NETWORK;
        // How the response was degraded, in the order the failures were observed.
        std::vector<failures::FailureKind> failures_;
    };

    // Everything an executor borrows for one resolution. The worker owns all of it.
    struct StrategyContext {
        cache::store::StoreManager* store_ = nullptr;
        http::client::HttpClientFactory client_factory_;
        concurrency::ThreadPool* background_pool_ = nullptr;
        std::shared_ptr<const config::WorkerConfig> config_;
    };

    class IStrategy {
       public:
        IStrategy() = default;
        virtual ~IStrategy() = default;
        IStrategy(const IStrategy&) = delete;
        IStrategy& operator=(const IStrategy&) = delete;
        IStrategy(IStrategy&&) = delete;
        IStrategy& operator=(IStrategy&&) = delete;

        // NetworkFailure and CacheMiss are resolved locally; only unexpected errors escape.
        virtual Resolution resolve(const http::model::Request& req) = 0;
        [[nodiscard]] virtual routing::StrategyTag tag() const = 0;
    };

    // One executor per tag, sharing the same context.
    std::unique_ptr<IStrategy> make_strategy(routing::StrategyTag tag, const StrategyContext& context);
}  // namespace strategies

#endif

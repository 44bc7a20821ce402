#include "stale_while_revalidate.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>

#include "../cache/entry/cache_entry.hpp"
#include "../http/error/http_error.hpp"
#include "../utils/constants.hpp"
#include "fallback.hpp"

namespace strategies {
    StaleWhileRevalidate::StaleWhileRevalidate(StrategyContext context) : context_(std::move(context)) {
        if (context_.background_pool_ == nullptr) {
            throw std::invalid_argument("Stale-while-revalidate requires a background pool");
        }
    }

    std::optional<http::model::Response> StaleWhileRevalidate::revalidate(const StrategyContext& context, const cache::store::Partition& partition,
                                                                          const std::string& key, const http::model::Request& req) {
        try {
            auto http_client = context.client_factory_();
            auto resp = http_client->fetch(req);

            if (resp.is_cacheable()) {
                cache::entry::CacheEntry entry;
                entry.url_ = req.url_;
                entry.response_ = resp;
                entry.stored_at_ms_ = context.store_->now_ms();
                entry.version_ = partition.version_;
                if (!context.store_->put(partition, key, std::move(entry))) {
                    spdlog::debug("Revalidated response for {} was not stored", req.url_);
                }
            } else if (resp.status_ == constants::HTTP_UNAUTHORIZED && req.url_.find("manifest.json") != std::string::npos) {
                spdlog::warn("manifest.json returned 401, check the deploy configuration");
            }

            return resp;
        } catch (const http::error::NetworkError& e) {
            spdlog::warn("Network failed for {}: {}", req.url_, e.what());
            return std::nullopt;
        } catch (const std::exception& e) {
            spdlog::error("Revalidation transport error for {}: {}", req.url_, e.what());
            return std::nullopt;
        }
    }

    Resolution StaleWhileRevalidate::resolve(const http::model::Request& req) {
        auto* store = context_.store_;
        const auto partition = store->open_partition(constants::DYNAMIC_PARTITION);
        const auto key = cache::entry::make_cache_key(req);

        auto cached = store->get(partition, key);

        // Not awaited when a cached entry is served.
        std::future<std::optional<http::model::Response>> pending =
            context_.background_pool_->submit([context = context_, partition, key, req]() { return revalidate(context, partition, key, req); });

        if (cached) {
            spdlog::debug("Stale cache hit: {}", req.url_);
            return Resolution{.response_ = std::move(cached->response_), .source_ = ResponseSource::CACHE, .failures_ = {}};
        }

        spdlog::debug("No cache, waiting on network: {}", req.url_);
        Resolution resolution{.response_ = {}, .source_ = ResponseSource::NETWORK, .failures_ = {failures::FailureKind::CACHE_MISS}};

        if (auto resp = pending.get()) {
            resolution.response_ = std::move(*resp);
            return resolution;
        }

        resolution.failures_.push_back(failures::FailureKind::NETWORK_FAILURE);
        if (auto late = store->get(partition, key)) {
            resolution.response_ = std::move(late->response_);
            resolution.source_ = ResponseSource::CACHE;
            return resolution;
        }

        resolution.response_ = fallback::service_unavailable_response();
        resolution.source_ = ResponseSource::SYNTHESIZED;
        return resolution;
    }
}  // namespace strategies

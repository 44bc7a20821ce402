#include "cache_first.hpp"

#include <spdlog/spdlog.h>

#include <exception>

#include "../cache/entry/cache_entry.hpp"
#include "../http/error/http_error.hpp"
#include "../utils/constants.hpp"
#include "fallback.hpp"

namespace strategies {
    CacheFirst::CacheFirst(StrategyContext context) : context_(std::move(context)) {}

    Resolution CacheFirst::resolve(const http::model::Request& req) {
        auto* store = context_.store_;
        const auto partition = store->open_partition(constants::STATIC_PARTITION);
        const auto key = cache::entry::make_cache_key(req);

        if (auto cached = store->get(partition, key)) {
            spdlog::debug("Cache hit: {}", req.url_);
            return Resolution{.response_ = std::move(cached->response_), .source_ = ResponseSource::CACHE, .failures_ = {}};
        }

        Resolution resolution{.response_ = {}, .source_ = ResponseSource::NETWORK, .failures_ = {failures::FailureKind::CACHE_MISS}};
        spdlog::debug("Cache miss, fetching: {}", req.url_);

        try {
            auto http_client = context_.client_factory_();
            auto resp = http_client->fetch(req);

            if (!resp.is_cacheable()) {
                resolution.response_ = std::move(resp);
                return resolution;
            }

            const long long stored_at = store->now_ms();
            auto stamped = fallback::stamped_copy(resp, stored_at, partition.version_);

            cache::entry::CacheEntry entry;
            entry.url_ = req.url_;
            entry.response_ = stamped;
            entry.stored_at_ms_ = stored_at;
            entry.version_ = partition.version_;
            if (!store->put(partition, key, std::move(entry))) {
                resolution.failures_.push_back(failures::FailureKind::QUOTA_EXCEEDED);
            }

            resolution.response_ = std::move(stamped);
            return resolution;
        } catch (const http::error::NetworkError& e) {
            spdlog::warn("Cache-first fetch of {} failed: {}", req.url_, e.what());
            resolution.failures_.push_back(failures::FailureKind::NETWORK_FAILURE);
        } catch (const std::exception& e) {
            spdlog::error("Cache-first transport error for {}: {}", req.url_, e.what());
            resolution.failures_.push_back(failures::FailureKind::NETWORK_FAILURE);
        }

        // A concurrent resolution may have stored the entry while this fetch was failing.
        if (auto cached = store->get(partition, key)) {
            spdlog::debug("Fallback cache hit: {}", req.url_);
            resolution.response_ = std::move(cached->response_);
            resolution.source_ = ResponseSource::CACHE;
            return resolution;
        }

        resolution.response_ = fallback::offline_text_response();
        resolution.source_ = ResponseSource::SYNTHESIZED;
        return resolution;
    }
}  // namespace strategies

#include "network_first.hpp"

#include <spdlog/spdlog.h>

#include <exception>

#include "../cache/entry/cache_entry.hpp"
#include "../http/error/http_error.hpp"
#include "../utils/constants.hpp"
#include "fallback.hpp"

namespace strategies {
    NetworkFirst::NetworkFirst(StrategyContext context)
        : context_(std::move(context)), expiration_(context_.config_ ? context_.config_->api_ttl_ms_ : constants::DEFAULT_API_TTL_MS) {}

    Resolution NetworkFirst::resolve(const http::model::Request& req) {
        auto* store = context_.store_;
        const auto partition = store->open_partition(constants::API_PARTITION);
        const auto key = cache::entry::make_cache_key(req);

        Resolution resolution{.response_ = {}, .source_ = ResponseSource::NETWORK, .failures_ = {}};
        spdlog::debug("Network first: {}", req.url_);

        try {
            http::model::Request outbound = req;
            if (context_.config_ && context_.config_->network_first_timeout_ms_ > 0) {
                outbound.timeout_ms_ = context_.config_->network_first_timeout_ms_;
            }

            auto http_client = context_.client_factory_();
            auto resp = http_client->fetch(outbound);

            if (!resp.is_ok()) {
                resolution.response_ = std::move(resp);
                return resolution;
            }

            const long long stored_at = store->now_ms();
            auto stamped = fallback::stamped_copy(resp, stored_at, "");

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
            spdlog::debug("Network failed, trying cache: {} ({})", req.url_, e.what());
            resolution.failures_.push_back(failures::FailureKind::NETWORK_FAILURE);
        } catch (const std::exception& e) {
            spdlog::error("Network-first transport error for {}, trying cache: {}", req.url_, e.what());
            resolution.failures_.push_back(failures::FailureKind::NETWORK_FAILURE);
        }

        const long long now = store->now_ms();
        auto cached = store->get(partition, key);
        if (!cached) {
            resolution.failures_.push_back(failures::FailureKind::CACHE_MISS);
        } else if (expiration_.is_expired(*cached, now)) {
            spdlog::debug("Cached entry for {} is {} ms old, past the {} ms ttl", req.url_, now - cached->stored_at_ms_, expiration_.ttl_ms());
            resolution.failures_.push_back(failures::FailureKind::EXPIRED_ENTRY);
        } else {
            spdlog::debug("Cache offline hit: {}", req.url_);
            resolution.response_ = std::move(cached->response_);
            resolution.source_ = ResponseSource::CACHE;
            return resolution;
        }

        spdlog::warn("Serving offline error for {}", req.url_);
        resolution.response_ = fallback::offline_json_response(now);
        resolution.source_ = ResponseSource::SYNTHESIZED;
        return resolution;
    }
}  // namespace strategies

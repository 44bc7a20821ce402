#include "network_only.hpp"

#include <spdlog/spdlog.h>

#include <exception>

#include "../http/error/http_error.hpp"
#include "fallback.hpp"

namespace strategies {
    NetworkOnly::NetworkOnly(StrategyContext context) : context_(std::move(context)) {}

    Resolution NetworkOnly::resolve(const http::model::Request& req) {
        try {
            auto http_client = context_.client_factory_();
            return Resolution{.response_ = http_client->fetch(req), .source_ = ResponseSource::NETWORK, .failures_ = {}};
        } catch (const http::error::NetworkError& e) {
            spdlog::warn("Network-only fetch of {} failed: {}", req.url_, e.what());
            return Resolution{
                .response_ = fallback::offline_text_response(), .source_ = ResponseSource::SYNTHESIZED, .failures_ = {failures::FailureKind::NETWORK_FAILURE}};
        } catch (const std::exception& e) {
            spdlog::error("Network-only transport error for {}: {}", req.url_, e.what());
            return Resolution{
                .response_ = fallback::offline_text_response(), .source_ = ResponseSource::SYNTHESIZED, .failures_ = {failures::FailureKind::NETWORK_FAILURE}};
        }
    }
}  // namespace strategies

#include "control_client.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "codec.hpp"

namespace control {
    ControlClient::ControlClient(Transport transport, long long timeout_ms) : transport_(std::move(transport)), timeout_ms_(timeout_ms) {
        if (transport_ == nullptr) {
            throw std::invalid_argument("Control transport is required");
        }
    }

    ReplyEnvelope ControlClient::send(Command command) {
        long long message_id = 0;
        std::future<ReplyEnvelope> reply;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            message_id = ++last_message_id_;
            reply = pending_[message_id].get_future();
        }

        transport_(codec::encode_command(CommandEnvelope{.command_ = std::move(command), .message_id_ = message_id}),
                   [this](const std::string& raw) { on_reply(raw); });

        if (reply.wait_for(std::chrono::milliseconds(timeout_ms_)) != std::future_status::ready) {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.erase(message_id);
            throw ControlTimeoutError(message_id, "Control reply timed out for message " + std::to_string(message_id));
        }

        return reply.get();
    }

    void ControlClient::on_reply(const std::string& raw) {
        auto envelope = codec::decode_reply(raw);
        if (!envelope || !envelope->message_id_) {
            spdlog::debug("Ignoring uncorrelated control reply");
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(*envelope->message_id_);
        if (it == pending_.end()) {
            spdlog::debug("Ignoring late control reply for message {}", *envelope->message_id_);
            return;
        }

        it->second.set_value(std::move(*envelope));
        pending_.erase(it);
    }

    template <typename T>
    T ControlClient::expect(Command command) {
        const std::string expected = type_name(command);
        auto envelope = send(std::move(command));

        auto* reply = std::get_if<T>(&envelope.reply_);
        if (reply == nullptr) {
            throw std::runtime_error("Unexpected reply " + reply_type_name(envelope.reply_) + " to " + expected);
        }
        return std::move(*reply);
    }

    cache::store::CacheStats ControlClient::get_cache_stats() { return expect<CacheStatsReply>(CacheStatsCommand{}).stats_; }

    size_t ControlClient::clear_cache() { return expect<ClearCacheReply>(ClearCacheCommand{}).cleared_; }

    std::vector<std::string> ControlClient::precache_urls(const std::vector<std::string>& urls) {
        return expect<PrecacheUrlsReply>(PrecacheUrlsCommand{.urls_ = urls}).succeeded_;
    }

    std::string ControlClient::skip_waiting() { return expect<SkipWaitingReply>(SkipWaitingCommand{}).state_; }

    size_t ControlClient::pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }
}  // namespace control

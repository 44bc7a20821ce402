#ifndef OFFLINE_CACHE_CONTROL_CLIENT_HPP
#define OFFLINE_CACHE_CONTROL_CLIENT_HPP

#pragma once

#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "../utils/constants.hpp"
#include "command.hpp"

namespace control {
    struct ControlTimeoutError : public std::runtime_error {
        long long message_id_;
        explicit ControlTimeoutError(long long message_id, const std::string& msg) : std::runtime_error(msg), message_id_(message_id) {}
    };

    // Host side of the control protocol. Correlates replies with commands by messageId.
    // Must outlive every reply the transport can still deliver.
    class ControlClient {
       public:
        // Posts an encoded command; the worker answers through the sink.
        using Transport = std::function<void(const std::string&, ReplySink)>;

        explicit ControlClient(Transport transport, long long timeout_ms = constants::CONTROL_REPLY_TIMEOUT_MS);

        ~ControlClient() = default;
        ControlClient(const ControlClient&) = delete;
        ControlClient& operator=(const ControlClient&) = delete;
        ControlClient(ControlClient&&) = delete;
        ControlClient& operator=(ControlClient&&) = delete;

        // Throws ControlTimeoutError when no reply arrives in time.
        ReplyEnvelope send(Command command);

        cache::store::CacheStats get_cache_stats();
        size_t clear_cache();
        std::vector<std::string> precache_urls(const std::vector<std::string>& urls);
        std::string skip_waiting();

        [[nodiscard]] size_t pending() const;

       private:
        void on_reply(const std::string& raw);

        template <typename T>
        T expect(Command command);

        Transport transport_;
        long long timeout_ms_;

        mutable std::mutex mutex_;
        long long last_message_id_ = 0;
        std::map<long long, std::promise<ReplyEnvelope>> pending_;
    };
}  // namespace control

#endif

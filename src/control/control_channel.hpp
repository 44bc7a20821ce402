#ifndef OFFLINE_CACHE_CONTROL_CHANNEL_HPP
#define OFFLINE_CACHE_CONTROL_CHANNEL_HPP

#pragma once

#include <functional>
#include <string>

#include "../cache/store/store_manager.hpp"
#include "../http/client/interface.hpp"
#include "../utils/thread_pool.hpp"
#include "command.hpp"

namespace control {
    struct ControlChannelOptions {
        std::string origin_;
        size_t precache_parallelism_ = 4;
    };

    // Worker side of the control protocol. Commands run on the given pool and the reply
    // goes only to the sink that came with the message.
    class ControlChannel {
       public:
        // skip_waiting activates a waiting worker and returns the resulting state name.
        ControlChannel(cache::store::StoreManager& store, http::client::HttpClientFactory client_factory, concurrency::ThreadPool& pool,
                       std::function<std::string()> skip_waiting, ControlChannelOptions options);

        ~ControlChannel() = default;
        ControlChannel(const ControlChannel&) = delete;
        ControlChannel& operator=(const ControlChannel&) = delete;
        ControlChannel(ControlChannel&&) = delete;
        ControlChannel& operator=(ControlChannel&&) = delete;

        // Returns false when the message was dropped without a reply.
        bool on_message(const std::string& raw, ReplySink reply_sink);

        // Synchronous form used by on_message's task.
        Reply handle(const Command& command);

       private:
        cache::store::StoreManager& store_;
        http::client::HttpClientFactory client_factory_;
        concurrency::ThreadPool& pool_;
        std::function<std::string()> skip_waiting_;
        ControlChannelOptions options_;
    };
}  // namespace control

#endif

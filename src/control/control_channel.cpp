#include "control_channel.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <string>

#include "../utils/constants.hpp"
#include "../utils/failure_kind.hpp"
#include "codec.hpp"

namespace control {
    ControlChannel::ControlChannel(cache::store::StoreManager& store, http::client::HttpClientFactory client_factory, concurrency::ThreadPool& pool,
                                   std::function<std::string()> skip_waiting, ControlChannelOptions options)
        : store_(store), client_factory_(std::move(client_factory)), pool_(pool), skip_waiting_(std::move(skip_waiting)), options_(std::move(options)) {}

    bool ControlChannel::on_message(const std::string& raw, ReplySink reply_sink) {
        auto envelope = codec::decode_command(raw);
        if (!envelope) {
            spdlog::debug("No reply sent: {}", failures::to_string(failures::FailureKind::UNRECOGNIZED_COMMAND));
            return false;
        }

        spdlog::debug("Control message {}", type_name(envelope->command_));

        pool_.enqueue([this, envelope = std::move(*envelope), reply_sink = std::move(reply_sink)]() {
            try {
                ReplyEnvelope reply{.reply_ = handle(envelope.command_), .message_id_ = envelope.message_id_};
                reply_sink(codec::encode_reply(reply));
            } catch (const std::exception& e) {
                spdlog::error("Control command {} failed: {}", type_name(envelope.command_), e.what());
            }
        });

        return true;
    }

    Reply ControlChannel::handle(const Command& command) {
        return std::visit(overloaded{
                              [this](const CacheStatsCommand&) -> Reply { return CacheStatsReply{.stats_ = store_.stats()}; },
                              [this](const ClearCacheCommand&) -> Reply { return ClearCacheReply{.cleared_ = store_.clear_managed()}; },
                              [this](const PrecacheUrlsCommand& precache) -> Reply {
                                  auto partition = store_.open_partition(constants::DYNAMIC_PARTITION);
                                  auto result = store_.precache(partition, precache.urls_, client_factory_,
                                                                cache::store::PrecacheOptions{.origin_ = options_.origin_,
                                                                                              .parallelism_ = options_.precache_parallelism_});
                                  return PrecacheUrlsReply{.succeeded_ = std::move(result.succeeded_)};
                              },
                              [this](const SkipWaitingCommand&) -> Reply { return SkipWaitingReply{.state_ = skip_waiting_()}; },
                          },
                          command);
    }
}  // namespace control

#include "codec.hpp"

#include <json/json.h>
#include <simdjson.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <optional>
#include <utility>
#include <string>
#include <string_view>
#include <vector>

namespace control {
    const char* type_name(const Command& command) {
        return std::visit(overloaded{
                              [](const CacheStatsCommand&) { return CACHE_STATS_TYPE; },
                              [](const ClearCacheCommand&) { return CLEAR_CACHE_TYPE; },
                              [](const PrecacheUrlsCommand&) { return PRECACHE_URLS_TYPE; },
                              [](const SkipWaitingCommand&) { return SKIP_WAITING_TYPE; },
                          },
                          command);
    }

    std::string reply_type_name(const Reply& reply) {
        const char* command_type = std::visit(overloaded{
                                                  [](const CacheStatsReply&) { return CACHE_STATS_TYPE; },
                                                  [](const ClearCacheReply&) { return CLEAR_CACHE_TYPE; },
                                                  [](const PrecacheUrlsReply&) { return PRECACHE_URLS_TYPE; },
                                                  [](const SkipWaitingReply&) { return SKIP_WAITING_TYPE; },
                                              },
                                              reply);
        return std::string(command_type) + RESPONSE_SUFFIX;
    }
}  // namespace control

namespace control::codec {
    namespace {
        std::string write_compact(const Json::Value& value) {
            Json::StreamWriterBuilder writer;
            writer["indentation"] = "";
            return Json::writeString(writer, value);
        }

        Json::Value string_array(const std::vector<std::string>& items) {
            Json::Value out(Json::arrayValue);
            for (const auto& item : items) {
                out.append(item);
            }
            return out;
        }

        std::optional<std::vector<std::string>> read_string_array(simdjson::simdjson_result<simdjson::ondemand::array> result) {
            simdjson::ondemand::array items;
            if (std::move(result).get(items) != simdjson::error_code::SUCCESS) {
                return std::nullopt;
            }

            std::vector<std::string> out;
            for (auto raw_item : items) {
                std::string_view item;
                if (raw_item.get_string().get(item) != simdjson::error_code::SUCCESS) {
                    return std::nullopt;
                }
                out.emplace_back(item);
            }
            return out;
        }

        std::optional<long long> read_message_id(simdjson::ondemand::document& doc) {
            int64_t message_id = 0;
            if (doc["messageId"].get_int64().get(message_id) != simdjson::error_code::SUCCESS) {
                return std::nullopt;
            }
            return static_cast<long long>(message_id);
        }

        std::optional<cache::store::CacheStats> read_cache_stats(simdjson::ondemand::document& doc) {
            simdjson::ondemand::object payload;
            if (doc["payload"].get_object().get(payload) != simdjson::error_code::SUCCESS) {
                return std::nullopt;
            }

            simdjson::ondemand::object caches;
            if (payload["caches"].get_object().get(caches) != simdjson::error_code::SUCCESS) {
                return std::nullopt;
            }

            cache::store::CacheStats stats;
            for (auto field : caches) {
                std::string_view name;
                if (field.unescaped_key().get(name) != simdjson::error_code::SUCCESS) {
                    return std::nullopt;
                }

                simdjson::ondemand::object partition;
                if (field.value().get_object().get(partition) != simdjson::error_code::SUCCESS) {
                    return std::nullopt;
                }

                cache::store::PartitionStats partition_stats;
                uint64_t count = 0;
                if (partition["count"].get_uint64().get(count) != simdjson::error_code::SUCCESS) {
                    return std::nullopt;
                }
                partition_stats.count_ = static_cast<size_t>(count);

                auto urls = read_string_array(partition["urls"].get_array());
                if (!urls) {
                    return std::nullopt;
                }
                partition_stats.urls_ = std::move(*urls);
                stats.caches_[std::string(name)] = std::move(partition_stats);
            }

            uint64_t total_caches = 0;
            uint64_t total_entries = 0;
            if (payload["totalCaches"].get_uint64().get(total_caches) != simdjson::error_code::SUCCESS ||
                payload["totalEntries"].get_uint64().get(total_entries) != simdjson::error_code::SUCCESS) {
                return std::nullopt;
            }
            stats.total_caches_ = static_cast<size_t>(total_caches);
            stats.total_entries_ = static_cast<size_t>(total_entries);
            return stats;
        }
    }  // namespace

    std::optional<CommandEnvelope> decode_command(std::string_view json) {
        simdjson::ondemand::parser parser;
        simdjson::padded_string padded(json);
        simdjson::ondemand::document doc;
        if (parser.iterate(padded).get(doc) != simdjson::error_code::SUCCESS) {
            spdlog::debug("Dropping malformed control message");
            return std::nullopt;
        }

        std::string_view raw_type;
        if (doc["type"].get_string().get(raw_type) != simdjson::error_code::SUCCESS) {
            spdlog::debug("Dropping control message without a type");
            return std::nullopt;
        }
        const std::string type(raw_type);

        CommandEnvelope envelope{.command_ = CacheStatsCommand{}, .message_id_ = read_message_id(doc)};

        if (type == CACHE_STATS_TYPE) {
            envelope.command_ = CacheStatsCommand{};
        } else if (type == CLEAR_CACHE_TYPE) {
            envelope.command_ = ClearCacheCommand{};
        } else if (type == SKIP_WAITING_TYPE) {
            envelope.command_ = SkipWaitingCommand{};
        } else if (type == PRECACHE_URLS_TYPE) {
            auto urls = read_string_array(doc["payload"]["urls"].get_array());
            if (!urls) {
                spdlog::debug("Dropping {} without a urls list", type);
                return std::nullopt;
            }
            envelope.command_ = PrecacheUrlsCommand{.urls_ = std::move(*urls)};
        } else {
            spdlog::debug("Dropping unrecognized control message type {}", type);
            return std::nullopt;
        }

        return envelope;
    }

    std::string encode_command(const CommandEnvelope& envelope) {
        Json::Value root;
        root["type"] = type_name(envelope.command_);
        if (envelope.message_id_) {
            root["messageId"] = Json::Int64(*envelope.message_id_);
        }
        if (const auto* precache = std::get_if<PrecacheUrlsCommand>(&envelope.command_)) {
            root["payload"]["urls"] = string_array(precache->urls_);
        }
        return write_compact(root);
    }

    std::optional<ReplyEnvelope> decode_reply(std::string_view json) {
        simdjson::ondemand::parser parser;
        simdjson::padded_string padded(json);
        simdjson::ondemand::document doc;
        if (parser.iterate(padded).get(doc) != simdjson::error_code::SUCCESS) {
            return std::nullopt;
        }

        std::string_view raw_type;
        if (doc["type"].get_string().get(raw_type) != simdjson::error_code::SUCCESS) {
            return std::nullopt;
        }
        const std::string type(raw_type);

        ReplyEnvelope envelope{.reply_ = ClearCacheReply{}, .message_id_ = read_message_id(doc)};

        if (type == std::string(CACHE_STATS_TYPE) + RESPONSE_SUFFIX) {
            auto stats = read_cache_stats(doc);
            if (!stats) {
                return std::nullopt;
            }
            envelope.reply_ = CacheStatsReply{.stats_ = std::move(*stats)};
        } else if (type == std::string(CLEAR_CACHE_TYPE) + RESPONSE_SUFFIX) {
            uint64_t cleared = 0;
            if (doc["payload"]["cleared"].get_uint64().get(cleared) != simdjson::error_code::SUCCESS) {
                return std::nullopt;
            }
            envelope.reply_ = ClearCacheReply{.cleared_ = static_cast<size_t>(cleared)};
        } else if (type == std::string(PRECACHE_URLS_TYPE) + RESPONSE_SUFFIX) {
            auto succeeded = read_string_array(doc["payload"]["succeeded"].get_array());
            if (!succeeded) {
                return std::nullopt;
            }
            envelope.reply_ = PrecacheUrlsReply{.succeeded_ = std::move(*succeeded)};
        } else if (type == std::string(SKIP_WAITING_TYPE) + RESPONSE_SUFFIX) {
            std::string_view state;
            if (doc["payload"]["state"].get_string().get(state) != simdjson::error_code::SUCCESS) {
                return std::nullopt;
            }
            envelope.reply_ = SkipWaitingReply{.state_ = std::string(state)};
        } else {
            return std::nullopt;
        }

        return envelope;
    }

    std::string encode_reply(const ReplyEnvelope& envelope) {
        Json::Value root;
        root["type"] = reply_type_name(envelope.reply_);
        if (envelope.message_id_) {
            root["messageId"] = Json::Int64(*envelope.message_id_);
        }

        root["payload"] = std::visit(overloaded{
                                         [](const CacheStatsReply& reply) {
                                             Json::Value payload;
                                             payload["caches"] = Json::Value(Json::objectValue);
                                             for (const auto& [name, partition_stats] : reply.stats_.caches_) {
                                                 payload["caches"][name]["count"] = Json::UInt64(partition_stats.count_);
                                                 payload["caches"][name]["urls"] = string_array(partition_stats.urls_);
                                             }
                                             payload["totalCaches"] = Json::UInt64(reply.stats_.total_caches_);
                                             payload["totalEntries"] = Json::UInt64(reply.stats_.total_entries_);
                                             return payload;
                                         },
                                         [](const ClearCacheReply& reply) {
                                             Json::Value payload;
                                             payload["cleared"] = Json::UInt64(reply.cleared_);
                                             return payload;
                                         },
                                         [](const PrecacheUrlsReply& reply) {
                                             Json::Value payload;
                                             payload["succeeded"] = string_array(reply.succeeded_);
                                             return payload;
                                         },
                                         [](const SkipWaitingReply& reply) {
                                             Json::Value payload;
                                             payload["state"] = reply.state_;
                                             return payload;
                                         },
                                     },
                                     envelope.reply_);

        return write_compact(root);
    }
}  // namespace control::codec

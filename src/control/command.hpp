#ifndef OFFLINE_CACHE_COMMAND_HPP
#define OFFLINE_CACHE_COMMAND_HPP

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../cache/store/store_manager.hpp"

namespace control {
    inline constexpr const char* CACHE_STATS_TYPE = "CACHE_STATS";
    inline constexpr const char* CLEAR_CACHE_TYPE = "CLEAR_CACHE";
    inline constexpr const char* PRECACHE_URLS_TYPE = "PRECACHE_URLS";
    inline constexpr const char* SKIP_WAITING_TYPE = "SKIP_WAITING";
    inline constexpr const char* RESPONSE_SUFFIX = "_RESPONSE";

    struct CacheStatsCommand {};

    struct ClearCacheCommand {};

    struct PrecacheUrlsCommand {
        std::vector<std::string> urls_;
    };

    struct SkipWaitingCommand {};

    using Command = std::variant<CacheStatsCommand, ClearCacheCommand, PrecacheUrlsCommand, SkipWaitingCommand>;

    struct CacheStatsReply {
        cache::store::CacheStats stats_;
    };

    struct ClearCacheReply {
        size_t cleared_ = 0;
    };

    struct PrecacheUrlsReply {
        std::vector<std::string> succeeded_;
    };

    struct SkipWaitingReply {
        std::string state_;
    };

    using Reply = std::variant<CacheStatsReply, ClearCacheReply, PrecacheUrlsReply, SkipWaitingReply>;

    // {type, payload?, messageId?}
    struct CommandEnvelope {
        Command command_;
        std::optional<long long> message_id_;
    };

    struct ReplyEnvelope {
        Reply reply_;
        std::optional<long long> message_id_;
    };

    // Delivers an encoded reply to the one sender that issued the command.
    using ReplySink = std::function<void(const std::string&)>;

    template <class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    const char* type_name(const Command& command);
    std::string reply_type_name(const Reply& reply);
}  // namespace control

#endif

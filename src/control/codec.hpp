#ifndef OFFLINE_CACHE_CODEC_HPP
#define OFFLINE_CACHE_CODEC_HPP

#include <optional>
#include <string>
#include <string_view>

#include "command.hpp"

namespace control::codec {
    // nullopt for malformed JSON, an unknown type, or a payload of the wrong shape.
    std::optional<CommandEnvelope> decode_command(std::string_view json);
    std::string encode_command(const CommandEnvelope& envelope);

    std::optional<ReplyEnvelope> decode_reply(std::string_view json);
    std::string encode_reply(const ReplyEnvelope& envelope);
}  // namespace control::codec

#endif

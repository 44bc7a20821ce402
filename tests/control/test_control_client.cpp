#include "../../src/control/control_client.hpp"

#include <gtest/gtest.h>

#include <string>

#include "../../src/control/codec.hpp"

namespace {
    TEST(ControlClientTest, TimesOutWhenNoReplyArrives) {
        control::ControlClient client([](const std::string&, control::ReplySink) {}, 20);

        EXPECT_THROW(client.clear_cache(), control::ControlTimeoutError);
        EXPECT_EQ(client.pending(), 0U);
    }

    TEST(ControlClientTest, LateAndUncorrelatedRepliesAreIgnored) {
        control::ReplySink held_sink;
        control::ControlClient client([&held_sink](const std::string&, control::ReplySink sink) { held_sink = std::move(sink); }, 20);

        EXPECT_THROW(client.get_cache_stats(), control::ControlTimeoutError);

        ASSERT_TRUE(held_sink != nullptr);
        held_sink(control::codec::encode_reply(control::ReplyEnvelope{.reply_ = control::ClearCacheReply{.cleared_ = 1}, .message_id_ = 1}));
        held_sink(R"({"type":"CLEAR_CACHE_RESPONSE","payload":{"cleared":1}})");
        EXPECT_EQ(client.pending(), 0U);
    }

    TEST(ControlClientTest, EchoedMessageIdResolvesTheCommand) {
        control::ControlClient client([](const std::string& message, control::ReplySink sink) {
            auto command = control::codec::decode_command(message);
            ASSERT_TRUE(command.has_value());
            sink(control::codec::encode_reply(
                control::ReplyEnvelope{.reply_ = control::ClearCacheReply{.cleared_ = 3}, .message_id_ = command->message_id_}));
        });

        EXPECT_EQ(client.clear_cache(), 3U);
        EXPECT_EQ(client.clear_cache(), 3U);
    }

    TEST(ControlClientTest, MismatchedReplyTypeIsAnError) {
        control::ControlClient client([](const std::string& message, control::ReplySink sink) {
            auto command = control::codec::decode_command(message);
            ASSERT_TRUE(command.has_value());
            sink(control::codec::encode_reply(
                control::ReplyEnvelope{.reply_ = control::SkipWaitingReply{.state_ = "active"}, .message_id_ = command->message_id_}));
        });

        EXPECT_THROW(client.clear_cache(), std::runtime_error);
    }

    TEST(ControlClientTest, RequiresTransport) { EXPECT_THROW(control::ControlClient(nullptr), std::invalid_argument); }
}  // namespace

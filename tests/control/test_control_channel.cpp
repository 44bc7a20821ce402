#include "../../src/control/control_channel.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../../src/cache/backend/memory_backend.hpp"
#include "../../src/control/codec.hpp"
#include "../../src/control/control_client.hpp"
#include "../support/fake_http_client.hpp"
#include "../support/manual_clock.hpp"

namespace {
    // Collects replies delivered to one sender.
    class Inbox {
       public:
        control::ReplySink sink() {
            return [this](const std::string& reply) {
                std::lock_guard<std::mutex> lock(mutex_);
                replies_.push_back(reply);
            };
        }

        std::vector<std::string> replies() {
            std::lock_guard<std::mutex> lock(mutex_);
            return replies_;
        }

       private:
        std::mutex mutex_;
        std::vector<std::string> replies_;
    };

    class ControlChannelTest : public ::testing::Test {
       protected:
        void SetUp() override {
            backend_ = std::make_shared<cache::backend::MemoryBackend>();
            network_ = std::make_shared<test_support::FakeNetwork>();
            store_ = std::make_unique<cache::store::StoreManager>(backend_, std::make_shared<test_support::ManualClock>(), "1.0.1");
            pool_ = std::make_unique<concurrency::ThreadPool>(2);
            channel_ = std::make_unique<control::ControlChannel>(
                *store_, test_support::make_factory(network_), *pool_, [this]() { return skip_waiting_state_; },
                control::ControlChannelOptions{.origin_ = "http://localhost", .precache_parallelism_ = 2});
        }

        void TearDown() override { pool_.reset(); }

        control::Reply send(const std::string& raw) {
            Inbox inbox;
            EXPECT_TRUE(channel_->on_message(raw, inbox.sink()));
            pool_->wait_all();

            auto replies = inbox.replies();
            EXPECT_EQ(replies.size(), 1U);
            auto decoded = control::codec::decode_reply(replies.empty() ? "" : replies.front());
            if (!decoded) {
                ADD_FAILURE() << "Undecodable reply";
                return control::ClearCacheReply{};
            }
            return decoded->reply_;
        }

        std::string skip_waiting_state_ = "active";
        std::shared_ptr<cache::backend::MemoryBackend> backend_;
        std::shared_ptr<test_support::FakeNetwork> network_;
        std::unique_ptr<cache::store::StoreManager> store_;
        std::unique_ptr<concurrency::ThreadPool> pool_;
        std::unique_ptr<control::ControlChannel> channel_;
    };

    TEST_F(ControlChannelTest, ClearThenStatsReportsNoManagedEntries) {
        network_->respond("http://localhost/", 200, "shell");
        auto partition = store_->open_partition("static");
        store_->precache(partition, {"/"}, test_support::make_factory(network_), cache::store::PrecacheOptions{.origin_ = "http://localhost"});
        store_->open_partition("api");

        auto cleared = std::get<control::ClearCacheReply>(send(R"({"type":"CLEAR_CACHE"})"));
        EXPECT_EQ(cleared.cleared_, 2U);

        auto stats = std::get<control::CacheStatsReply>(send(R"({"type":"CACHE_STATS"})"));
        EXPECT_EQ(stats.stats_.total_entries_, 0U);

        auto again = std::get<control::ClearCacheReply>(send(R"({"type":"CLEAR_CACHE"})"));
        EXPECT_EQ(again.cleared_, 0U);
    }

    TEST_F(ControlChannelTest, PrecacheReportsOnlySucceededUrls) {
        network_->respond("http://localhost/a", 200, "a");
        network_->respond("http://localhost/b", 404, "missing");

        auto reply = std::get<control::PrecacheUrlsReply>(send(R"({"type":"PRECACHE_URLS","payload":{"urls":["/a","/b"]}})"));

        EXPECT_THAT(reply.succeeded_, ::testing::ElementsAre("/a"));
        auto dynamic = store_->open_partition("dynamic");
        EXPECT_TRUE(store_->get(dynamic, cache::entry::make_cache_key("GET", "http://localhost/a")).has_value());
        EXPECT_FALSE(store_->get(dynamic, cache::entry::make_cache_key("GET", "http://localhost/b")).has_value());
    }

    TEST_F(ControlChannelTest, SkipWaitingReportsState) {
        auto reply = std::get<control::SkipWaitingReply>(send(R"({"type":"SKIP_WAITING"})"));
        EXPECT_EQ(reply.state_, "active");
    }

    TEST_F(ControlChannelTest, UnknownTypeIsDroppedWithoutReply) {
        Inbox inbox;

        EXPECT_FALSE(channel_->on_message(R"({"type":"CLEAR_NOTIFICATIONS"})", inbox.sink()));
        pool_->wait_all();

        EXPECT_TRUE(inbox.replies().empty());
    }

    TEST_F(ControlChannelTest, ReplyGoesOnlyToTheSender) {
        Inbox sender;
        Inbox bystander;

        ASSERT_TRUE(channel_->on_message(R"({"type":"CACHE_STATS","messageId":4})", sender.sink()));
        pool_->wait_all();

        ASSERT_EQ(sender.replies().size(), 1U);
        EXPECT_THAT(sender.replies().front(), ::testing::HasSubstr(R"("messageId":4)"));
        EXPECT_TRUE(bystander.replies().empty());
    }

    TEST_F(ControlChannelTest, ClientCorrelatesRepliesThroughTheChannel) {
        network_->respond("http://localhost/a", 200, "a");
        control::ControlClient client(
            [this](const std::string& message, control::ReplySink reply_sink) { channel_->on_message(message, std::move(reply_sink)); });

        EXPECT_THAT(client.precache_urls({"/a"}), ::testing::ElementsAre("/a"));
        EXPECT_EQ(client.get_cache_stats().total_entries_, 1U);
        EXPECT_EQ(client.clear_cache(), 1U);
        EXPECT_EQ(client.skip_waiting(), "active");
        EXPECT_EQ(client.pending(), 0U);
    }
}  // namespace

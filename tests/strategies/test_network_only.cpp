#include "../../src/strategies/network_only.hpp"

#include <gtest/gtest.h>

#include <vector>

#include "../../src/strategies/fallback.hpp"
#include "../../src/utils/constants.hpp"
#include "strategy_fixture.hpp"

namespace {
    using strategies::ResponseSource;

    class NetworkOnlyTest : public test_support::StrategyTest {};

    TEST_F(NetworkOnlyTest, PassesThroughWithoutTouchingTheCache) {
        network_->respond("http://localhost/patients", 500, "boom");
        strategies::NetworkOnly strategy(context());

        auto resolution = strategy.resolve(get("http://localhost/patients"));

        EXPECT_EQ(resolution.source_, ResponseSource::NETWORK);
        EXPECT_EQ(resolution.response_.status_, 500);
        EXPECT_EQ(store_->stats().total_entries_, 0U);
    }

    TEST_F(NetworkOnlyTest, TransportFailureIsOfflineText) {
        network_->fail("http://localhost/patients");
        strategies::NetworkOnly strategy(context());

        auto resolution = strategy.resolve(get("http://localhost/patients"));

        EXPECT_EQ(resolution.source_, ResponseSource::SYNTHESIZED);
        EXPECT_EQ(resolution.response_.status_, 503);
        EXPECT_EQ(store_->stats().total_entries_, 0U);
    }

    TEST_F(NetworkOnlyTest, TransportExceptionIsOfflineText) {
        strategies::NetworkOnly strategy(broken_transport_context());

        auto resolution = strategy.resolve(get("http://localhost/patients"));

        EXPECT_EQ(resolution.source_, ResponseSource::SYNTHESIZED);
        EXPECT_EQ(resolution.response_.body_, constants::OFFLINE_TEXT_BODY);
        EXPECT_EQ(resolution.failures_, std::vector<failures::FailureKind>{failures::FailureKind::NETWORK_FAILURE});
    }

    TEST_F(NetworkOnlyTest, FactoryBuildsOneExecutorPerTag) {
        for (auto tag : {routing::StrategyTag::CACHE_FIRST, routing::StrategyTag::NETWORK_FIRST, routing::StrategyTag::STALE_WHILE_REVALIDATE,
                         routing::StrategyTag::NETWORK_ONLY}) {
            EXPECT_EQ(strategies::make_strategy(tag, context())->tag(), tag);
        }
    }

    TEST(FallbackTest, StampedCopyKeepsOriginalHeaders) {
        auto resp = http::model::make_text_response(200, "OK", "x", "text/css");

        auto stamped = strategies::fallback::stamped_copy(resp, 123, "");

        EXPECT_EQ(stamped.header(constants::STORED_AT_HEADER).value_or(""), "123");
        EXPECT_FALSE(stamped.header(constants::CACHE_VERSION_HEADER).has_value());
        EXPECT_EQ(stamped.header("content-type").value_or(""), "text/css");
        EXPECT_FALSE(resp.header(constants::STORED_AT_HEADER).has_value());
    }
}  // namespace

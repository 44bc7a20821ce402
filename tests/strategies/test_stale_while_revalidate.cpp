#include "../../src/strategies/stale_while_revalidate.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../../src/utils/constants.hpp"
#include "strategy_fixture.hpp"

namespace {
    using failures::FailureKind;
    using strategies::ResponseSource;

    class StaleWhileRevalidateTest : public test_support::StrategyTest {};

    TEST_F(StaleWhileRevalidateTest, HitIsServedAndOverwrittenByBackgroundFetch) {
        seed("dynamic", "http://localhost/index.html", "v1", 1);
        network_->respond("http://localhost/index.html", 200, "v2");
        strategies::StaleWhileRevalidate strategy(context());

        auto first = strategy.resolve(get("http://localhost/index.html"));
        EXPECT_EQ(first.source_, ResponseSource::CACHE);
        EXPECT_EQ(first.response_.body_, "v1");

        background_pool_->wait_all();

        auto second = strategy.resolve(get("http://localhost/index.html"));
        EXPECT_EQ(second.source_, ResponseSource::CACHE);
        EXPECT_EQ(second.response_.body_, "v2");
    }

    TEST_F(StaleWhileRevalidateTest, HitDoesNotWaitForTheNetwork) {
        seed("dynamic", "http://localhost/", "shell", 1);
        network_->respond("http://localhost/", 200, "new shell");
        network_->hold();
        strategies::StaleWhileRevalidate strategy(context());

        auto resolution = strategy.resolve(get("http://localhost/"));

        EXPECT_EQ(resolution.response_.body_, "shell");
        EXPECT_TRUE(network_->wait_for_calls("http://localhost/", 1));
        EXPECT_EQ(cached("dynamic", "http://localhost/").value().response_.body_, "shell");

        network_->release();
        background_pool_->wait_all();
        EXPECT_EQ(cached("dynamic", "http://localhost/").value().response_.body_, "new shell");
    }

    TEST_F(StaleWhileRevalidateTest, MissWaitsForTheSameFetch) {
        network_->respond("http://localhost/about.html", 200, "about");
        strategies::StaleWhileRevalidate strategy(context());

        auto resolution = strategy.resolve(get("http://localhost/about.html"));

        EXPECT_EQ(resolution.source_, ResponseSource::NETWORK);
        EXPECT_EQ(resolution.response_.body_, "about");
        EXPECT_THAT(resolution.failures_, ::testing::ElementsAre(FailureKind::CACHE_MISS));
        EXPECT_EQ(network_->calls("http://localhost/about.html"), 1U);
        EXPECT_TRUE(cached("dynamic", "http://localhost/about.html").has_value());
    }

    TEST_F(StaleWhileRevalidateTest, MissAndOutageIsServiceUnavailable) {
        network_->fail("http://localhost/about.html");
        strategies::StaleWhileRevalidate strategy(context());

        auto resolution = strategy.resolve(get("http://localhost/about.html"));

        EXPECT_EQ(resolution.source_, ResponseSource::SYNTHESIZED);
        EXPECT_EQ(resolution.response_.status_, 503);
        EXPECT_EQ(resolution.response_.body_, constants::SERVICE_UNAVAILABLE_BODY);
        EXPECT_THAT(resolution.failures_, ::testing::ElementsAre(FailureKind::CACHE_MISS, FailureKind::NETWORK_FAILURE));
    }

    TEST_F(StaleWhileRevalidateTest, TransportExceptionOnMissIsServiceUnavailable) {
        strategies::StaleWhileRevalidate strategy(broken_transport_context());

        auto resolution = strategy.resolve(get("http://localhost/about.html"));

        EXPECT_EQ(resolution.source_, ResponseSource::SYNTHESIZED);
        EXPECT_EQ(resolution.response_.body_, constants::SERVICE_UNAVAILABLE_BODY);
        EXPECT_THAT(resolution.failures_, ::testing::ElementsAre(FailureKind::CACHE_MISS, FailureKind::NETWORK_FAILURE));
    }

    TEST_F(StaleWhileRevalidateTest, ErrorResponseNeverReplacesCachedEntry) {
        seed("dynamic", "http://localhost/manifest.json", "{}", 1);
        network_->respond("http://localhost/manifest.json", 401, "unauthorized");
        strategies::StaleWhileRevalidate strategy(context());

        EXPECT_EQ(strategy.resolve(get("http://localhost/manifest.json")).response_.body_, "{}");
        background_pool_->wait_all();

        EXPECT_EQ(cached("dynamic", "http://localhost/manifest.json").value().response_.body_, "{}");
    }

    TEST_F(StaleWhileRevalidateTest, UncacheableMissIsPassedThrough) {
        network_->respond("http://localhost/gone.html", 404, "gone");
        strategies::StaleWhileRevalidate strategy(context());

        auto resolution = strategy.resolve(get("http://localhost/gone.html"));

        EXPECT_EQ(resolution.response_.status_, 404);
        EXPECT_FALSE(cached("dynamic", "http://localhost/gone.html").has_value());
    }

    TEST_F(StaleWhileRevalidateTest, RequiresBackgroundPool) {
        auto ctx = context();
        ctx.background_pool_ = nullptr;
        EXPECT_THROW(strategies::StaleWhileRevalidate{ctx}, std::invalid_argument);
    }
}  // namespace

#include "../../src/strategies/cache_first.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "../../src/utils/constants.hpp"
#include "strategy_fixture.hpp"

namespace {
    using failures::FailureKind;
    using strategies::ResponseSource;

    class CacheFirstTest : public test_support::StrategyTest {};

    TEST_F(CacheFirstTest, HitMakesNoNetworkCall) {
        seed("static", "http://localhost/app.js", "cached", 1);
        network_->respond("http://localhost/app.js", 200, "fresh");
        strategies::CacheFirst strategy(context());

        auto resolution = strategy.resolve(get("http://localhost/app.js"));

        EXPECT_EQ(resolution.source_, ResponseSource::CACHE);
        EXPECT_EQ(resolution.response_.body_, "cached");
        EXPECT_EQ(network_->total_calls(), 0U);
    }

    TEST_F(CacheFirstTest, MissFetchesAndStoresStampedCopy) {
        network_->respond("http://localhost/app.js", 200, "fresh", {{"Content-Type", "text/javascript"}});
        clock_->set(42'000);
        strategies::CacheFirst strategy(context());

        auto resolution = strategy.resolve(get("http://localhost/app.js"));

        EXPECT_EQ(resolution.source_, ResponseSource::NETWORK);
        EXPECT_EQ(resolution.response_.body_, "fresh");
        EXPECT_EQ(resolution.response_.header(constants::STORED_AT_HEADER).value_or(""), "42000");
        EXPECT_EQ(resolution.response_.header(constants::CACHE_VERSION_HEADER).value_or(""), "1.0.1");
        EXPECT_THAT(resolution.failures_, ::testing::ElementsAre(FailureKind::CACHE_MISS));

        auto stored = cached("static", "http://localhost/app.js");
        ASSERT_TRUE(stored.has_value());
        EXPECT_EQ(stored->stored_at_ms_, 42'000);
        EXPECT_EQ(stored->response_.header("content-type").value_or(""), "text/javascript");

        auto second = strategy.resolve(get("http://localhost/app.js"));
        EXPECT_EQ(second.source_, ResponseSource::CACHE);
        EXPECT_EQ(network_->calls("http://localhost/app.js"), 1U);
    }

    TEST_F(CacheFirstTest, RedirectStatusIsStoredButErrorIsNot) {
        network_->respond("http://localhost/moved.css", 304, "");
        network_->respond("http://localhost/missing.css", 404, "nope");
        strategies::CacheFirst strategy(context());

        EXPECT_EQ(strategy.resolve(get("http://localhost/moved.css")).response_.status_, 304);
        EXPECT_TRUE(cached("static", "http://localhost/moved.css").has_value());

        auto missing = strategy.resolve(get("http://localhost/missing.css"));
        EXPECT_EQ(missing.response_.status_, 404);
        EXPECT_EQ(missing.source_, ResponseSource::NETWORK);
        EXPECT_FALSE(cached("static", "http://localhost/missing.css").has_value());
    }

    TEST_F(CacheFirstTest, NetworkFailureWithNothingCachedIsOfflineText) {
        network_->fail("http://localhost/app.js");
        strategies::CacheFirst strategy(context());

        auto resolution = strategy.resolve(get("http://localhost/app.js"));

        EXPECT_EQ(resolution.source_, ResponseSource::SYNTHESIZED);
        EXPECT_EQ(resolution.response_.status_, 503);
        EXPECT_EQ(resolution.response_.body_, constants::OFFLINE_TEXT_BODY);
        EXPECT_EQ(resolution.response_.header("content-type").value_or(""), "text/plain");
        EXPECT_THAT(resolution.failures_, ::testing::ElementsAre(FailureKind::CACHE_MISS, FailureKind::NETWORK_FAILURE));
    }

    TEST_F(CacheFirstTest, TransportExceptionIsOfflineText) {
        strategies::CacheFirst strategy(broken_transport_context());

        auto resolution = strategy.resolve(get("http://localhost/app.js"));

        EXPECT_EQ(resolution.source_, ResponseSource::SYNTHESIZED);
        EXPECT_EQ(resolution.response_.body_, constants::OFFLINE_TEXT_BODY);
        EXPECT_THAT(resolution.failures_, ::testing::ElementsAre(FailureKind::CACHE_MISS, FailureKind::NETWORK_FAILURE));
    }

    TEST_F(CacheFirstTest, TransportExceptionRechecksTheCache) {
        auto ctx = context();
        ctx.client_factory_ = [this]() -> std::unique_ptr<http::client::IHttpClient> {
            seed("static", "http://localhost/app.js", "written meanwhile", 5);
            throw std::runtime_error("curl_easy_setopt failed");
        };
        strategies::CacheFirst strategy(ctx);

        auto resolution = strategy.resolve(get("http://localhost/app.js"));

        EXPECT_EQ(resolution.source_, ResponseSource::CACHE);
        EXPECT_EQ(resolution.response_.body_, "written meanwhile");
        EXPECT_THAT(resolution.failures_, ::testing::ElementsAre(FailureKind::CACHE_MISS, FailureKind::NETWORK_FAILURE));
    }

    TEST_F(CacheFirstTest, FullStorageStillReturnsNetworkResponse) {
        use_quota(8);
        network_->respond("http://localhost/app.js", 200, "a response body well past the quota");
        strategies::CacheFirst strategy(context());

        auto resolution = strategy.resolve(get("http://localhost/app.js"));

        EXPECT_EQ(resolution.source_, ResponseSource::NETWORK);
        EXPECT_EQ(resolution.response_.status_, 200);
        EXPECT_EQ(resolution.response_.body_, "a response body well past the quota");
        EXPECT_THAT(resolution.failures_, ::testing::ElementsAre(FailureKind::CACHE_MISS, FailureKind::QUOTA_EXCEEDED));
        EXPECT_FALSE(cached("static", "http://localhost/app.js").has_value());
    }

    TEST_F(CacheFirstTest, FragmentDoesNotChangeTheKey) {
        seed("static", "http://localhost/logo.svg", "svg", 1);
        strategies::CacheFirst strategy(context());

        auto resolution = strategy.resolve(get("http://localhost/logo.svg#icon"));

        EXPECT_EQ(resolution.source_, ResponseSource::CACHE);
        EXPECT_EQ(network_->total_calls(), 0U);
    }
}  // namespace

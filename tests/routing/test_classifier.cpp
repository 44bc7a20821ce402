#include "../../src/routing/classifier.hpp"

#include <gtest/gtest.h>

#include "../../src/config/worker_config.hpp"

namespace {
    using routing::StrategyTag;

    class ClassifierTest : public ::testing::Test {
       protected:
        routing::PatternClassifier classifier_{config::WorkerConfig::defaults()};
    };

    TEST_F(ClassifierTest, AssetsAreCacheFirst) {
        EXPECT_EQ(classifier_.classify("http://localhost/assets/logo.png"), StrategyTag::CACHE_FIRST);
        EXPECT_EQ(classifier_.classify("http://localhost/chunk-ab12CD.js"), StrategyTag::CACHE_FIRST);
        EXPECT_EQ(classifier_.classify("http://localhost/index-9f8e7d.css"), StrategyTag::CACHE_FIRST);
        EXPECT_EQ(classifier_.classify("http://localhost/fonts/inter.woff2"), StrategyTag::CACHE_FIRST);
    }

    TEST_F(ClassifierTest, ApiAuthAndAiEndpointsAreNetworkFirst) {
        EXPECT_EQ(classifier_.classify("http://localhost/api/patients?page=2"), StrategyTag::NETWORK_FIRST);
        EXPECT_EQ(classifier_.classify("http://localhost/auth/session"), StrategyTag::NETWORK_FIRST);
        EXPECT_EQ(classifier_.classify("http://localhost/v1/gemini/generate"), StrategyTag::NETWORK_FIRST);
    }

    TEST_F(ClassifierTest, NavigationIsStaleWhileRevalidate) {
        EXPECT_EQ(classifier_.classify("http://localhost/"), StrategyTag::STALE_WHILE_REVALIDATE);
        EXPECT_EQ(classifier_.classify("http://localhost/index.html"), StrategyTag::STALE_WHILE_REVALIDATE);
        EXPECT_EQ(classifier_.classify("http://localhost/manifest.json"), StrategyTag::STALE_WHILE_REVALIDATE);
        EXPECT_EQ(classifier_.classify("http://localhost/patients/"), StrategyTag::STALE_WHILE_REVALIDATE);
    }

    TEST_F(ClassifierTest, EverythingElseIsNetworkOnly) {
        EXPECT_EQ(classifier_.classify("http://localhost/patients"), StrategyTag::NETWORK_ONLY);
        EXPECT_EQ(classifier_.classify("http://localhost/data.json"), StrategyTag::NETWORK_ONLY);
    }

    TEST_F(ClassifierTest, EarlierPatternSetWins) {
        EXPECT_EQ(classifier_.classify("http://localhost/api/export.css"), StrategyTag::CACHE_FIRST);
    }

    TEST_F(ClassifierTest, FragmentIsIgnoredAndQueryIsMatched) {
        EXPECT_EQ(classifier_.classify("http://localhost/page#/api/"), StrategyTag::NETWORK_ONLY);
        EXPECT_EQ(classifier_.classify("http://localhost/search?next=/auth/"), StrategyTag::NETWORK_FIRST);
    }

    TEST(ClassifierCustomTest, CustomTablesAndRelativeInput) {
        routing::PatternClassifier classifier({R"(\.wasm$)"}, {R"(^/rpc/)"}, {});

        EXPECT_EQ(classifier.classify("/bin/engine.wasm"), StrategyTag::CACHE_FIRST);
        EXPECT_EQ(classifier.classify("http://localhost/rpc/call"), StrategyTag::NETWORK_FIRST);
        EXPECT_EQ(classifier.classify("http://localhost/"), StrategyTag::NETWORK_ONLY);
        EXPECT_STREQ(routing::to_string(StrategyTag::STALE_WHILE_REVALIDATE), "stale-while-revalidate");
    }
}  // namespace

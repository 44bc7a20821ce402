#include "../../src/http/model/url.hpp"

#include <gtest/gtest.h>

#include "../../src/http/model/model.hpp"

namespace {
    TEST(UrlTest, ParsesComponents) {
        auto url = http::model::parse_url("HTTPS://user@App.Example:8443/api/patients?page=2#top");

        ASSERT_TRUE(url.has_value());
        EXPECT_EQ(url->scheme_, "https");
        EXPECT_EQ(url->host_, "app.example");
        EXPECT_EQ(url->port_, "8443");
        EXPECT_EQ(url->path_, "/api/patients");
        EXPECT_EQ(url->query_, "?page=2");
        EXPECT_EQ(url->fragment_, "#top");
        EXPECT_EQ(url->origin(), "https://app.example:8443");
        EXPECT_EQ(url->path_and_query(), "/api/patients?page=2");
    }

    TEST(UrlTest, DropsDefaultPortsAndDefaultsPath) {
        auto url = http::model::parse_url("http://localhost:80");

        ASSERT_TRUE(url.has_value());
        EXPECT_EQ(url->origin(), "http://localhost");
        EXPECT_EQ(url->path_, "/");
    }

    TEST(UrlTest, RejectsRelativeUrls) {
        EXPECT_FALSE(http::model::parse_url("/index.html").has_value());
        EXPECT_FALSE(http::model::parse_url("http:///nohost").has_value());
    }

    TEST(UrlTest, ResolvesAgainstOrigin) {
        EXPECT_EQ(http::model::resolve_url("http://localhost/", "/a"), "http://localhost/a");
        EXPECT_EQ(http::model::resolve_url("http://localhost", "b.js"), "http://localhost/b.js");
        EXPECT_EQ(http::model::resolve_url("http://localhost", "https://cdn.example/x.js"), "https://cdn.example/x.js");
    }

    TEST(ResponseTest, StatusBoundsAndHeaders) {
        http::model::Response resp;
        resp.status_ = 304;
        resp.set_header("Content-Type", "text/html");

        EXPECT_FALSE(resp.is_ok());
        EXPECT_TRUE(resp.is_cacheable());
        EXPECT_EQ(resp.header("content-type").value_or(""), "text/html");
        EXPECT_FALSE(resp.header("etag").has_value());

        resp.status_ = 404;
        EXPECT_FALSE(resp.is_cacheable());
    }
}  // namespace

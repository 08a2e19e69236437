#include "core/Errors.hpp"
#include "core/FeedUrl.hpp"
#include "TestFeeds.hpp"
#include <gtest/gtest.h>

using namespace corkboard::core;
using namespace corkboard::test;

TEST(FeedUrlTest, NormalizesHttpUrls) {
    EXPECT_EQ(normalizeUrl("http://localhost:8080"), std::optional<std::string>("http://localhost:8080/"));
    EXPECT_EQ(normalizeUrl("  https://Example.org/feed  "), std::optional<std::string>("https://example.org/feed"));
    EXPECT_FALSE(normalizeUrl("ftp://example.org/feed").has_value());
    EXPECT_FALSE(normalizeUrl("example.org/feed").has_value());
    EXPECT_FALSE(normalizeUrl("").has_value());
}

TEST(FeedUrlTest, BareHostTriesHttpsThenHttp) {
    auto candidates = candidateUrls("localhost:8080");
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0], "https://localhost:8080/");
    EXPECT_EQ(candidates[1], "http://localhost:8080/");
}

TEST(FeedUrlTest, ExplicitSchemeIsTheOnlyCandidate) {
    auto candidates = candidateUrls("http://a.example.org/feed");
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0], "http://a.example.org/feed");
    EXPECT_TRUE(candidateUrls("gopher://a.example.org").empty());
}

TEST(FeedUrlTest, ResolveFallsBackToHttp) {
    FakeFetcher fetcher;
    fetcher.serve("http://plain.example/rss", "body");

    ResolvedFeed resolved = resolveAndFetch("plain.example/rss", fetcher);
    EXPECT_EQ(resolved.url, "http://plain.example/rss");
    EXPECT_EQ(resolved.body, "body");
    EXPECT_EQ(fetcher.requests("https://plain.example/rss"), 1);
}

TEST(FeedUrlTest, ResolveReportsEveryAttempt) {
    FakeFetcher fetcher;
    try {
        resolveAndFetch("gone.example", fetcher);
        FAIL() << "expected FetchError";
    } catch (const FetchError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("https://gone.example/"), std::string::npos);
        EXPECT_NE(message.find("http://gone.example/"), std::string::npos);
    }
    EXPECT_THROW(resolveAndFetch("", fetcher), FetchError);
}

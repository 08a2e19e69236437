#include "core/Fetcher.hpp"
#include "core/Errors.hpp"
#include <gtest/gtest.h>

using namespace corkboard::core;

TEST(HttpFetcherTest, FeedContentTypes) {
    EXPECT_TRUE(isFeedContentType("application/rss+xml; charset=UTF-8"));
    EXPECT_TRUE(isFeedContentType("Application/Atom+XML"));
    EXPECT_TRUE(isFeedContentType("TEXT/XML"));
    EXPECT_FALSE(isFeedContentType("text/html"));
    EXPECT_FALSE(isFeedContentType(""));
}

TEST(HttpFetcherTest, ContentTypeWithHighBytes) {
    EXPECT_FALSE(isFeedContentType("text/plain; name=\xE9t\xE9"));
    EXPECT_TRUE(isFeedContentType("\xFF\xFEtext/xml"));
}

TEST(HttpFetcherTest, EmptyUrlIsRejectedBeforeAnyRequest) {
    HttpFetcher fetcher;
    EXPECT_THROW(fetcher.fetch(""), FetchError);
}

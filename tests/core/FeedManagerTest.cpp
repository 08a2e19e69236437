#include "core/Errors.hpp"
#include "core/FeedManager.hpp"
#include "core/JsonStore.hpp"
#include "TestFeeds.hpp"
#include <gtest/gtest.h>
#include <memory>

using namespace corkboard::core;
using namespace corkboard::test;

namespace {

const std::string kLocal = "http://localhost:8080/";
const std::string kOther = "http://localhost:9090/";

class FeedManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        reopen();
    }

    // Fresh store and manager over the same file, like a new process
    void reopen() {
        manager_.reset();
        store_ = std::make_unique<JsonStore>(file_.path());
        manager_ = std::make_unique<FeedManager>(*store_, fetcher_);
    }

    std::vector<std::string> unreadTitles() {
        std::vector<std::string> titles;
        for (const auto& marked : manager_->listUnread()) {
            titles.push_back(marked.entry.primaryText);
        }
        return titles;
    }

    TempStoreFile file_;
    FakeFetcher fetcher_;
    std::unique_ptr<JsonStore> store_;
    std::unique_ptr<FeedManager> manager_;
};

std::string datedFeed(const std::string& title, const std::vector<std::pair<std::string, int>>& items) {
    static const char* days[] = {"", "01", "02", "03", "04", "05", "06", "07", "08", "09", "10"};
    std::string body;
    for (const auto& [name, day] : items) {
        body += rssItem(name, "", std::string(days[day]) + " Jan 2024 12:00:00 GMT");
    }
    return rssFeed(title, body);
}

} // namespace

TEST_F(FeedManagerTest, SubscribeThenMarkByIdentity) {
    fetcher_.serve(kLocal, kDescriptionOnlyRss);

    AddResult added = manager_->addFeed("localhost:8080");
    EXPECT_EQ(added.channel.title, "Buzz");
    EXPECT_EQ(added.channel.link, kLocal);
    ASSERT_EQ(added.newEntries.size(), 2u);
    EXPECT_GE(added.newEntries[0].position, 1);
    EXPECT_NE(added.newEntries[0].position, added.newEntries[1].position);

    auto results = manager_->markByIdentity({deriveIdentity("azz", std::nullopt)});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].status, MarkResult::Status::Marked);

    auto unread = manager_->listUnread();
    ASSERT_EQ(unread.size(), 1u);
    EXPECT_EQ(unread[0].entry.primaryText, "bzz");
    EXPECT_EQ(unread[0].position, 1);
}

TEST_F(FeedManagerTest, MarkingByPositionAcrossResets) {
    fetcher_.serve(kLocal, datedFeed("Three", {{"a", 1}, {"b", 2}, {"c", 3}}));
    manager_->addFeed(kLocal);

    EXPECT_TRUE(manager_->markByPosition({1})[0].marked());
    EXPECT_EQ(unreadTitles(), (std::vector<std::string>{"b", "c"}));

    reopen();
    EXPECT_TRUE(manager_->markByPosition({1})[0].marked());

    auto unread = manager_->listUnread();
    ASSERT_EQ(unread.size(), 1u);
    EXPECT_EQ(unread[0].position, 1);
    EXPECT_EQ(unread[0].entry.primaryText, "c");
}

TEST_F(FeedManagerTest, ResetOrdersByPublishDate) {
    fetcher_.serve(kLocal, datedFeed("Shuffled", {{"third", 3}, {"first", 1}, {"second", 2}}));
    manager_->addFeed(kLocal);

    auto unread = manager_->listUnread();
    ASSERT_EQ(unread.size(), 3u);
    EXPECT_EQ(unread[0].position, 1);
    EXPECT_EQ(unread[0].entry.primaryText, "first");
    EXPECT_EQ(unread[1].entry.primaryText, "second");
    EXPECT_EQ(unread[2].entry.primaryText, "third");
}

TEST_F(FeedManagerTest, SubscribingAppendsWithoutRenumbering) {
    fetcher_.serve(kLocal, datedFeed("Newer", {{"n1", 5}, {"n2", 6}}));
    fetcher_.serve(kOther, datedFeed("Older", {{"o1", 1}, {"o2", 2}, {"o3", 3}}));

    manager_->addFeed(kLocal);
    auto listed = manager_->listUnread();
    ASSERT_EQ(listed.size(), 2u);

    reopen();
    AddResult added = manager_->addFeed(kOther);
    ASSERT_EQ(added.newEntries.size(), 3u);
    EXPECT_EQ(added.newEntries[0].position, 3);
    EXPECT_EQ(added.newEntries[1].position, 4);
    EXPECT_EQ(added.newEntries[2].position, 5);

    EXPECT_EQ(*store_->lookupQuickmark(1), listed[0].entry.identity);
    EXPECT_EQ(*store_->lookupQuickmark(2), listed[1].entry.identity);

    // Position 1 still means n1, even though o1 is older
    auto results = manager_->markByPosition({1});
    ASSERT_TRUE(results[0].entry.has_value());
    EXPECT_EQ(results[0].entry->primaryText, "n1");
}

TEST_F(FeedManagerTest, MarkingTwiceIsReportedNoOp) {
    fetcher_.serve(kLocal, datedFeed("Three", {{"a", 1}, {"b", 2}, {"c", 3}}));
    manager_->addFeed(kLocal);
    manager_->listUnread();

    std::string b = deriveIdentity("b", std::nullopt);
    EXPECT_EQ(manager_->markByIdentity({b})[0].status, MarkResult::Status::Marked);
    EXPECT_EQ(manager_->markByIdentity({b})[0].status, MarkResult::Status::AlreadyRead);

    // No compaction, nobody else touched
    EXPECT_EQ(*store_->lookupQuickmark(1), deriveIdentity("a", std::nullopt));
    EXPECT_FALSE(store_->lookupQuickmark(2).has_value());
    EXPECT_EQ(*store_->lookupQuickmark(3), deriveIdentity("c", std::nullopt));
    EXPECT_EQ(store_->loadUnreadEntries().size(), 2u);
}

TEST_F(FeedManagerTest, BatchMarkContinuesPastBadPositions) {
    fetcher_.serve(kLocal, datedFeed("Two", {{"a", 1}, {"b", 2}}));
    manager_->addFeed(kLocal);
    manager_->listUnread();

    auto results = manager_->markByPosition({99, 2, 2});
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].status, MarkResult::Status::InvalidPosition);
    EXPECT_EQ(results[1].status, MarkResult::Status::Marked);
    EXPECT_EQ(results[2].status, MarkResult::Status::InvalidPosition);
    EXPECT_EQ(unreadTitles(), (std::vector<std::string>{"a"}));
}

TEST_F(FeedManagerTest, MarkFailuresAreLeftToTheCaller) {
    fetcher_.serve(kLocal, datedFeed("Two", {{"a", 1}, {"b", 2}}));
    manager_->addFeed(kLocal);
    manager_->listUnread();

    testing::internal::CaptureStderr();
    auto byPosition = manager_->markByPosition({99});
    auto byIdentity = manager_->markByIdentity({std::string(64, 'e')});
    bool removed = manager_->removeFeed("http://localhost:1234/");
    std::string printed = testing::internal::GetCapturedStderr();

    EXPECT_EQ(byPosition[0].status, MarkResult::Status::InvalidPosition);
    EXPECT_EQ(byIdentity[0].status, MarkResult::Status::NotFound);
    EXPECT_FALSE(removed);
    EXPECT_EQ(printed, "");
}

TEST_F(FeedManagerTest, MarkUnknownIdentity) {
    auto results = manager_->markByIdentity({std::string(64, 'f')});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].status, MarkResult::Status::NotFound);
}

TEST_F(FeedManagerTest, MarkAll) {
    fetcher_.serve(kLocal, kTwoEntryRss);
    manager_->addFeed(kLocal);
    EXPECT_EQ(manager_->listUnread().size(), 2u);

    EXPECT_EQ(manager_->markAll(), 2u);
    EXPECT_TRUE(manager_->listUnread().empty());
    EXPECT_TRUE(store_->quickmarks().empty());
    EXPECT_EQ(manager_->markAll(), 0u);
}

TEST_F(FeedManagerTest, RemoveOnlyDropsThatFeedsQuickmarks) {
    fetcher_.serve(kLocal, datedFeed("Local", {{"l1", 1}, {"l2", 3}}));
    fetcher_.serve(kOther, datedFeed("Other", {{"o1", 2}}));
    manager_->addFeed(kLocal);
    manager_->addFeed(kOther);
    manager_->listUnread();   // l1=1, o1=2, l2=3

    EXPECT_TRUE(manager_->removeFeed(kLocal));

    EXPECT_EQ(store_->quickmarks().size(), 1u);
    EXPECT_EQ(*store_->lookupQuickmark(2), deriveIdentity("o1", std::nullopt));
    EXPECT_EQ(store_->countEntries(), 1u);
    ASSERT_EQ(manager_->listFeeds().size(), 1u);
    EXPECT_EQ(manager_->listFeeds()[0].link, kOther);
}

TEST_F(FeedManagerTest, RemoveMatchesUrlWithoutScheme) {
    fetcher_.serve(kLocal, kTwoEntryRss);
    manager_->addFeed("http://localhost:8080");
    EXPECT_EQ(manager_->listFeeds().size(), 1u);

    EXPECT_FALSE(manager_->removeFeed("http://another_url"));
    EXPECT_EQ(manager_->listFeeds().size(), 1u);

    EXPECT_TRUE(manager_->removeFeed("localhost:8080"));
    EXPECT_TRUE(manager_->listFeeds().empty());
    EXPECT_EQ(store_->countEntries(), 0u);
}

TEST_F(FeedManagerTest, SameFeedWithAndWithoutSchemeIsOneSubscription) {
    fetcher_.serve(kLocal, kTwoEntryRss);
    manager_->addFeed("localhost:8080");

    EXPECT_THROW(manager_->addFeed("http://localhost:8080"), StorageError);
    EXPECT_THROW(manager_->addFeed("localhost:8080"), StorageError);
    EXPECT_EQ(manager_->listFeeds().size(), 1u);
}

TEST_F(FeedManagerTest, ProtocolGuessingPrefersHttps) {
    fetcher_.serve("https://secure.example/feed", kTwoEntryRss);
    fetcher_.serve("http://secure.example/feed", kDescriptionOnlyRss);

    AddResult added = manager_->addFeed("secure.example/feed");
    EXPECT_EQ(added.channel.link, "https://secure.example/feed");
    EXPECT_EQ(added.channel.title, "Weekly notes");
    EXPECT_EQ(fetcher_.requests("http://secure.example/feed"), 0);
}

TEST_F(FeedManagerTest, ChannelsWithTheSameTitleCoexist) {
    fetcher_.serve(kLocal, rssFeed("Generated", rssItem("from a")));
    fetcher_.serve(kOther, rssFeed("Generated", rssItem("from b")));
    manager_->addFeed(kLocal);
    manager_->addFeed(kOther);

    EXPECT_EQ(manager_->listFeeds().size(), 2u);
    EXPECT_EQ(store_->countEntries(), 2u);
}

TEST_F(FeedManagerTest, AddAtomFeeds) {
    fetcher_.serve(kLocal, kEmptyAtom);
    AddResult empty = manager_->addFeed(kLocal);
    EXPECT_TRUE(empty.newEntries.empty());
    // The subscription URL wins over the feed's self link
    EXPECT_EQ(empty.channel.link, kLocal);

    fetcher_.serve(kOther, kTwoEntryAtom);
    manager_->addFeed(kOther);
    EXPECT_EQ(manager_->listFeeds().size(), 2u);
    EXPECT_EQ(store_->countEntries(), 2u);
}

TEST_F(FeedManagerTest, FailedAddCommitsNothing) {
    fetcher_.serve(kLocal, "<rss><channel><title>half");
    EXPECT_THROW(manager_->addFeed(kLocal), ParseError);

    fetcher_.serve(kLocal, "<html><body/></html>");
    try {
        manager_->addFeed(kLocal);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.kind(), ParseErrorKind::UnknownFormat);
    }

    EXPECT_THROW(manager_->addFeed(kOther), FetchError);

    reopen();
    EXPECT_TRUE(manager_->listFeeds().empty());
}

TEST_F(FeedManagerTest, UpdateFindsAppendedEntries) {
    fetcher_.serve(kLocal, rssFeed("Weekly", rssItem("Old news", "http://old")));
    manager_->addFeed(kLocal);
    manager_->listUnread();

    reopen();
    fetcher_.serve(kLocal, rssFeed("Weekly", rssItem("Old news", "http://old") +
                                             rssItem("Discussion about recent events", "http://unique")));
    auto reports = manager_->updateFeeds();
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_TRUE(reports[0].ok);
    ASSERT_EQ(reports[0].newEntries.size(), 1u);
    EXPECT_EQ(*reports[0].newEntries[0].entry.link, "http://unique");
    EXPECT_EQ(reports[0].newEntries[0].position, 2);

    // Nothing new the second time round
    reopen();
    reports = manager_->updateFeeds();
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_TRUE(reports[0].ok);
    EXPECT_TRUE(reports[0].newEntries.empty());
    EXPECT_EQ(store_->countEntries(), 2u);
}

TEST_F(FeedManagerTest, UpdateSurvivesUnreachableFeeds) {
    fetcher_.serve(kLocal, rssFeed("Up", rssItem("one")));
    fetcher_.serve(kOther, rssFeed("Down", rssItem("two")));
    manager_->addFeed(kLocal);
    manager_->addFeed(kOther);

    fetcher_.takeDown(kOther);
    fetcher_.serve(kLocal, rssFeed("Up", rssItem("one") + rssItem("three")));

    auto reports = manager_->updateFeeds();
    ASSERT_EQ(reports.size(), 2u);
    for (const auto& report : reports) {
        if (report.link == kLocal) {
            EXPECT_TRUE(report.ok);
            EXPECT_EQ(report.newEntries.size(), 1u);
        } else {
            EXPECT_FALSE(report.ok);
            EXPECT_NE(report.error.find("connection refused"), std::string::npos);
        }
    }
    EXPECT_EQ(store_->countEntries(), 3u);
}

TEST_F(FeedManagerTest, UpdateTrustsBuildDate) {
    const char* monday = "Mon, 01 Jan 2024 00:00:00 GMT";
    const char* tuesday = "Tue, 02 Jan 2024 00:00:00 GMT";
    fetcher_.serve(kLocal, rssFeed("Dated", rssItem("one"), monday));
    manager_->addFeed(kLocal);

    // Same stamp, new item: skipped, a known limitation of the fast path
    fetcher_.serve(kLocal, rssFeed("Dated", rssItem("one") + rssItem("two"), monday));
    EXPECT_TRUE(manager_->updateFeeds()[0].newEntries.empty());

    fetcher_.serve(kLocal, rssFeed("Dated", rssItem("one") + rssItem("two"), tuesday));
    EXPECT_EQ(manager_->updateFeeds()[0].newEntries.size(), 1u);

    auto channel = store_->loadChannel(kLocal);
    ASSERT_TRUE(channel && channel->lastBuildDate);
    EXPECT_EQ(*channel->lastBuildDate, *parseRfc2822(tuesday));
}

TEST_F(FeedManagerTest, ListingFeedsLeavesQuickmarksAlone) {
    fetcher_.serve(kLocal, kTwoEntryRss);
    manager_->addFeed(kLocal);
    manager_->listUnread();
    auto before = store_->quickmarks().positions();

    manager_->listFeeds();
    EXPECT_EQ(store_->quickmarks().positions(), before);
}

#pragma once

#include "core/Channel.hpp"
#include "core/Fetcher.hpp"
#include "core/QuickmarkOverlay.hpp"
#include "core/Store.hpp"
#include "core/Synchronizer.hpp"
#include <string>
#include <vector>

namespace corkboard {
namespace core {

struct AddResult {
    Channel channel;                            // as stored, without entries
    std::vector<QuickmarkedEntry> newEntries;
};

struct UpdateReport {
    std::string link;
    std::string title;
    bool ok = false;
    std::string error;
    std::vector<QuickmarkedEntry> newEntries;
};

struct MarkResult {
    enum class Status {
        Marked,
        AlreadyRead,
        NotFound,
        InvalidPosition
    };

    std::string target;                         // what the caller asked for
    Status status = Status::NotFound;
    std::optional<Entry> entry;

    bool marked() const { return status == Status::Marked; }
};

const char* toString(MarkResult::Status status);

// Command-level operations. Every mutating call saves the store once
// it has succeeded; a throwing call leaves the file untouched.
class FeedManager {
public:
    FeedManager(Store& store, Fetcher& fetcher);

    // Subscription management
    AddResult addFeed(const std::string& url);
    bool removeFeed(const std::string& url);
    std::vector<Channel> listFeeds() const;

    // Checks every subscribed channel. One failing feed never stops the others.
    std::vector<UpdateReport> updateFeeds();

    // Renumbers all unread entries from 1 and returns them in display order
    std::vector<QuickmarkedEntry> listUnread();

    // Marking as read
    std::vector<MarkResult> markByIdentity(const std::vector<std::string>& identities);
    std::vector<MarkResult> markByPosition(const std::vector<int>& positions);
    size_t markAll();

private:
    Store& store_;
    Fetcher& fetcher_;

    // Helper methods
    MarkResult markOne(const std::string& identity, const std::string& target);
    std::optional<std::string> findSubscription(const std::string& url) const;
};

} // namespace core
} // namespace corkboard

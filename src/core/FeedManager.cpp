#include "core/FeedManager.hpp"
#include "core/Errors.hpp"
#include "core/FeedParser.hpp"
#include "core/FeedUrl.hpp"
#include <algorithm>

namespace corkboard {
namespace core {

const char* toString(MarkResult::Status status) {
    switch (status) {
        case MarkResult::Status::Marked: return "marked";
        case MarkResult::Status::AlreadyRead: return "already read";
        case MarkResult::Status::NotFound: return "no such entry";
        case MarkResult::Status::InvalidPosition: return "no entry at that position";
    }
    return "unknown";
}

FeedManager::FeedManager(Store& store, Fetcher& fetcher)
    : store_(store), fetcher_(fetcher) {
}

AddResult FeedManager::addFeed(const std::string& url) {
    if (auto existing = findSubscription(url)) {
        throw StorageError("Already subscribed to " + *existing);
    }

    ResolvedFeed resolved = resolveAndFetch(url, fetcher_);
    Channel channel = parseFeed(resolved.body);
    channel.link = resolved.url;

    if (store_.loadChannel(channel.link)) {
        throw StorageError("Already subscribed to " + channel.link);
    }

    std::vector<Entry> entries = std::move(channel.entries);
    channel.entries.clear();
    store_.addChannel(channel);
    std::vector<Entry> inserted = store_.storeEntries(channel.link, entries);

    AddResult result;
    result.channel = channel;
    result.newEntries = store_.appendQuickmarks(inserted);

    store_.save();
    return result;
}

bool FeedManager::removeFeed(const std::string& url) {
    auto key = findSubscription(url);
    if (!key) {
        return false;
    }

    store_.deleteChannel(*key);
    store_.save();
    return true;
}

std::vector<Channel> FeedManager::listFeeds() const {
    return store_.listChannels();
}

std::vector<UpdateReport> FeedManager::updateFeeds() {
    std::vector<Channel> stored;
    for (const auto& channel : store_.listChannels()) {
        if (auto withEntries = store_.loadChannel(channel.link)) {
            stored.push_back(std::move(*withEntries));
        }
    }

    Fetcher& fetcher = fetcher_;
    auto reports = synchronizeBatch(stored, [&fetcher](const std::string& link) {
        return parseFeed(fetcher.fetch(link));
    });

    std::vector<UpdateReport> updates;
    for (const auto& report : reports) {
        UpdateReport update;
        update.link = report.link;
        update.title = report.title;
        update.ok = report.ok();
        update.error = report.error;

        if (report.ok() && report.outcome->hasChanges()) {
            std::vector<Entry> inserted = store_.storeEntries(report.link, report.outcome->newEntries);
            update.newEntries = store_.appendQuickmarks(inserted);
            if (report.fetchedBuildDate) {
                store_.setLastBuildDate(report.link, report.fetchedBuildDate);
            }
        } else if (report.ok() && report.fetchedBuildDate) {
            // Build date moved without new content; remember it for the next fast-skip
            auto stamp = std::find_if(stored.begin(), stored.end(),
                                      [&report](const Channel& c) { return c.link == report.link; });
            if (stamp != stored.end() &&
                (!stamp->lastBuildDate || *stamp->lastBuildDate < *report.fetchedBuildDate)) {
                store_.setLastBuildDate(report.link, report.fetchedBuildDate);
            }
        }

        updates.push_back(std::move(update));
    }

    store_.save();
    return updates;
}

std::vector<QuickmarkedEntry> FeedManager::listUnread() {
    store_.resetQuickmarks(store_.loadUnreadEntries());

    std::vector<QuickmarkedEntry> listing;
    for (const auto& [position, identity] : store_.quickmarks().positions()) {
        auto entry = store_.findEntry(identity);
        if (!entry) {
            throw StorageError("Quickmark " + std::to_string(position) + " points at unknown entry " + identity);
        }
        listing.push_back(QuickmarkedEntry{position, *entry});
    }

    store_.save();
    return listing;
}

std::vector<MarkResult> FeedManager::markByIdentity(const std::vector<std::string>& identities) {
    std::vector<MarkResult> results;
    for (const auto& identity : identities) {
        results.push_back(markOne(identity, identity));
    }
    store_.save();
    return results;
}

std::vector<MarkResult> FeedManager::markByPosition(const std::vector<int>& positions) {
    std::vector<MarkResult> results;
    for (int position : positions) {
        std::string target = std::to_string(position);
        auto identity = store_.lookupQuickmark(position);
        if (!identity) {
            MarkResult result;
            result.target = target;
            result.status = MarkResult::Status::InvalidPosition;
            results.push_back(result);
            continue;
        }
        results.push_back(markOne(*identity, target));
    }
    store_.save();
    return results;
}

size_t FeedManager::markAll() {
    size_t marked = 0;
    for (const auto& entry : store_.loadUnreadEntries()) {
        if (markOne(entry.identity, entry.identity).marked()) {
            ++marked;
        }
    }
    store_.save();
    return marked;
}

MarkResult FeedManager::markOne(const std::string& identity, const std::string& target) {
    MarkResult result;
    result.target = target;

    auto entry = store_.findEntry(identity);
    if (!entry) {
        result.status = MarkResult::Status::NotFound;
        return result;
    }

    store_.deleteQuickmarkFor(identity);
    result.entry = entry;

    if (entry->read) {
        result.status = MarkResult::Status::AlreadyRead;
        return result;
    }

    size_t affected = store_.setRead(identity, true);
    if (affected != 1) {
        throw StorageError("Marking " + identity + " affected " + std::to_string(affected) +
                           " records instead of one");
    }

    result.entry->read = true;
    result.status = MarkResult::Status::Marked;
    return result;
}

std::optional<std::string> FeedManager::findSubscription(const std::string& url) const {
    for (const auto& candidate : candidateUrls(url)) {
        if (store_.loadChannel(candidate)) {
            return candidate;
        }
    }
    if (store_.loadChannel(url)) {
        return url;
    }
    return std::nullopt;
}

} // namespace core
} // namespace corkboard

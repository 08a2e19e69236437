#pragma once

#include "core/Channel.hpp"
#include "core/QuickmarkOverlay.hpp"
#include <optional>
#include <string>
#include <vector>

namespace corkboard {
namespace core {

// Persistence contract for channels, entries and the quickmark overlay.
// Channels are keyed by their link, entries by identity. Nothing is durable
// until save() returns.
class Store {
public:
    virtual ~Store() = default;

    // Channel management
    virtual std::vector<Channel> listChannels() const = 0;                          // without entries
    virtual std::optional<Channel> loadChannel(const std::string& key) const = 0;   // with entries
    virtual void addChannel(const Channel& channel) = 0;
    virtual void setLastBuildDate(const std::string& key, const std::optional<Timestamp>& date) = 0;
    virtual bool deleteChannel(const std::string& key) = 0;                         // cascades

    // Entries. storeEntries ignores identities already stored and returns
    // the entries it actually inserted.
    virtual std::vector<Entry> storeEntries(const std::string& key, const std::vector<Entry>& entries) = 0;
    virtual std::vector<Entry> loadEntries(const std::string& key) const = 0;      // read and unread
    virtual std::vector<Entry> loadUnreadEntries() const = 0;
    virtual std::optional<Entry> findEntry(const std::string& identity) const = 0;
    virtual size_t setRead(const std::string& identity, bool read) = 0;            // records matched
    virtual size_t countEntries() const = 0;

    // Quickmark overlay
    virtual void resetQuickmarks(const std::vector<Entry>& unread) = 0;
    virtual std::vector<QuickmarkedEntry> appendQuickmarks(const std::vector<Entry>& entries) = 0;
    virtual bool deleteQuickmarkFor(const std::string& identity) = 0;
    virtual size_t deleteQuickmarksForChannel(const std::string& key) = 0;
    virtual std::optional<std::string> lookupQuickmark(int position) const = 0;
    virtual const QuickmarkOverlay& quickmarks() const = 0;

    // Persistence
    virtual void save() = 0;
};

} // namespace core
} // namespace corkboard

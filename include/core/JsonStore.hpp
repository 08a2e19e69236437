#pragma once

#include "core/Store.hpp"
#include <map>
#include <string>
#include <unordered_set>
#include <vector>

namespace corkboard {
namespace core {

// Store kept in a single JSON file. The whole document is loaded on
// construction and rewritten by save().
class JsonStore : public Store {
public:
    explicit JsonStore(const std::string& storageFile = "corkdb.json");

    std::vector<Channel> listChannels() const override;
    std::optional<Channel> loadChannel(const std::string& key) const override;
    void addChannel(const Channel& channel) override;
    void setLastBuildDate(const std::string& key, const std::optional<Timestamp>& date) override;
    bool deleteChannel(const std::string& key) override;

    std::vector<Entry> storeEntries(const std::string& key, const std::vector<Entry>& entries) override;
    std::vector<Entry> loadEntries(const std::string& key) const override;
    std::vector<Entry> loadUnreadEntries() const override;
    std::optional<Entry> findEntry(const std::string& identity) const override;
    size_t setRead(const std::string& identity, bool read) override;
    size_t countEntries() const override { return entries_.size(); }

    void resetQuickmarks(const std::vector<Entry>& unread) override;
    std::vector<QuickmarkedEntry> appendQuickmarks(const std::vector<Entry>& entries) override;
    bool deleteQuickmarkFor(const std::string& identity) override;
    size_t deleteQuickmarksForChannel(const std::string& key) override;
    std::optional<std::string> lookupQuickmark(int position) const override;
    const QuickmarkOverlay& quickmarks() const override { return quickmarks_; }

    void save() override;
    void load();

private:
    struct StoredEntry {
        Entry entry;
        std::string channel;
    };

    std::string storageFile_;
    std::vector<Channel> channels_;
    std::map<std::string, StoredEntry> entries_;
    QuickmarkOverlay quickmarks_;

    // Helper methods
    int findChannelIndex(const std::string& key) const;
    std::unordered_set<std::string> identitiesFor(const std::string& key) const;
};

} // namespace core
} // namespace corkboard

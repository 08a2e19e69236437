#pragma once

#include "core/Channel.hpp"
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace corkboard {
namespace core {

// An unread entry together with the number currently shown for it
struct QuickmarkedEntry {
    int position;
    Entry entry;
};

// Small positive numbers standing in for unread entry identities.
//
// The overlay is only ever in one of two shapes: freshly reset (1..N over
// every unread entry, oldest first) or extended from a reset by appending
// past the current maximum. Positions are never compacted, so a number the
// user has seen keeps pointing at the same entry until the next reset.
class QuickmarkOverlay {
public:
    // Drops every position and numbers the unread entries 1..N by
    // publish date, undated entries first, ties broken by identity
    void reset(std::vector<Entry> entries);

    // Numbers unread, not yet marked entries after the current maximum.
    // Returns the positions handed out, in order.
    std::vector<QuickmarkedEntry> append(std::vector<Entry> entries);

    // Removes the position held by `identity`, if any
    bool remove(const std::string& identity);

    // Removes every position whose identity is in `identities`
    size_t removeAll(const std::unordered_set<std::string>& identities);

    std::optional<std::string> lookup(int position) const;
    std::optional<int> positionOf(const std::string& identity) const;

    int maxPosition() const;
    size_t size() const { return positions_.size(); }
    bool empty() const { return positions_.empty(); }
    const std::map<int, std::string>& positions() const { return positions_; }

    // JSON serialization
    nlohmann::json toJson() const;
    static QuickmarkOverlay fromJson(const nlohmann::json& j);

private:
    static void sortByPublishDate(std::vector<Entry>& entries);

    std::map<int, std::string> positions_;
};

} // namespace core
} // namespace corkboard

#include "core/QuickmarkOverlay.hpp"
#include "core/Errors.hpp"
#include <algorithm>

namespace corkboard {
namespace core {

void QuickmarkOverlay::sortByPublishDate(std::vector<Entry>& entries) {
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        if (a.publishedAt != b.publishedAt) {
            // nullopt orders before any date
            return a.publishedAt < b.publishedAt;
        }
        return a.identity < b.identity;
    });
}

void QuickmarkOverlay::reset(std::vector<Entry> entries) {
    positions_.clear();

    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [](const Entry& entry) { return entry.read; }),
                  entries.end());
    sortByPublishDate(entries);

    int position = 1;
    std::unordered_set<std::string> seen;
    for (const auto& entry : entries) {
        if (seen.insert(entry.identity).second) {
            positions_[position++] = entry.identity;
        }
    }
}

std::vector<QuickmarkedEntry> QuickmarkOverlay::append(std::vector<Entry> entries) {
    sortByPublishDate(entries);

    std::unordered_set<std::string> marked;
    for (const auto& [position, identity] : positions_) {
        marked.insert(identity);
    }

    std::vector<QuickmarkedEntry> added;
    int next = maxPosition() + 1;
    for (const auto& entry : entries) {
        if (entry.read || !marked.insert(entry.identity).second) {
            continue;
        }
        positions_[next] = entry.identity;
        added.push_back(QuickmarkedEntry{next, entry});
        ++next;
    }
    return added;
}

bool QuickmarkOverlay::remove(const std::string& identity) {
    for (auto it = positions_.begin(); it != positions_.end(); ++it) {
        if (it->second == identity) {
            positions_.erase(it);
            return true;
        }
    }
    return false;
}

size_t QuickmarkOverlay::removeAll(const std::unordered_set<std::string>& identities) {
    size_t removed = 0;
    for (auto it = positions_.begin(); it != positions_.end();) {
        if (identities.count(it->second) > 0) {
            it = positions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::optional<std::string> QuickmarkOverlay::lookup(int position) const {
    auto it = positions_.find(position);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int> QuickmarkOverlay::positionOf(const std::string& identity) const {
    for (const auto& [position, marked] : positions_) {
        if (marked == identity) {
            return position;
        }
    }
    return std::nullopt;
}

int QuickmarkOverlay::maxPosition() const {
    return positions_.empty() ? 0 : positions_.rbegin()->first;
}

nlohmann::json QuickmarkOverlay::toJson() const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& [position, identity] : positions_) {
        j.push_back(nlohmann::json{{"position", position}, {"identity", identity}});
    }
    return j;
}

QuickmarkOverlay QuickmarkOverlay::fromJson(const nlohmann::json& j) {
    QuickmarkOverlay overlay;
    if (!j.is_array()) {
        throw StorageError("quickmarks must be an array");
    }
    for (const auto& mark : j) {
        int position = mark.at("position").get<int>();
        if (position < 1) {
            throw StorageError("quickmark position " + std::to_string(position) + " is not positive");
        }
        if (!overlay.positions_.emplace(position, mark.at("identity").get<std::string>()).second) {
            throw StorageError("quickmark position " + std::to_string(position) + " appears twice");
        }
    }
    return overlay;
}

} // namespace core
} // namespace corkboard

#pragma once

#include "core/DateTime.hpp"
#include "core/Identity.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace corkboard {
namespace core {

namespace detail {

inline nlohmann::json optionalToJson(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

inline nlohmann::json optionalToJson(const std::optional<Timestamp>& value) {
    return value ? nlohmann::json(toEpochSeconds(*value)) : nlohmann::json(nullptr);
}

inline std::optional<std::string> optionalString(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<std::string>();
}

inline std::optional<Timestamp> optionalTimestamp(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return fromEpochSeconds(j.at(key).get<int64_t>());
}

} // namespace detail

struct Entry {
    std::string primaryText;            // title, or the description when there is no title
    std::string identity;
    std::optional<std::string> link;
    std::optional<Timestamp> publishedAt;
    bool read;

    Entry() : read(false) {}

    Entry(const std::string& primaryText, const std::optional<std::string>& link,
          const std::optional<Timestamp>& publishedAt = std::nullopt)
        : primaryText(primaryText), link(link), publishedAt(publishedAt), read(false) {
        identity = deriveIdentity(primaryText, link);
    }

    // JSON serialization
    nlohmann::json toJson() const {
        return nlohmann::json{
            {"identity", identity},
            {"primaryText", primaryText},
            {"link", detail::optionalToJson(link)},
            {"publishedAt", detail::optionalToJson(publishedAt)},
            {"read", read}
        };
    }

    // The stored identity is kept as-is, never recomputed
    static Entry fromJson(const nlohmann::json& j) {
        Entry entry;
        entry.identity = j.at("identity").get<std::string>();
        entry.primaryText = j.at("primaryText").get<std::string>();
        entry.link = detail::optionalString(j, "link");
        entry.publishedAt = detail::optionalTimestamp(j, "publishedAt");
        entry.read = j.at("read").get<bool>();
        return entry;
    }

    // Entries are the same entry iff their identities match
    bool operator==(const Entry& other) const {
        return identity == other.identity;
    }
    bool operator!=(const Entry& other) const {
        return !(*this == other);
    }
};

struct Channel {
    std::string title;
    std::string description;
    std::string link;                   // the URL we re-fetch, not the feed's self-declared one
    std::optional<Timestamp> lastBuildDate;
    std::vector<Entry> entries;

    // Entries are persisted separately, keyed by identity
    nlohmann::json toJson() const {
        return nlohmann::json{
            {"title", title},
            {"description", description},
            {"link", link},
            {"lastBuildDate", detail::optionalToJson(lastBuildDate)}
        };
    }

    static Channel fromJson(const nlohmann::json& j) {
        Channel channel;
        channel.title = j.at("title").get<std::string>();
        channel.description = j.value("description", "");
        channel.link = j.at("link").get<std::string>();
        channel.lastBuildDate = detail::optionalTimestamp(j, "lastBuildDate");
        return channel;
    }
};

} // namespace core
} // namespace corkboard

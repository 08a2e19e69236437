#include "core/JsonStore.hpp"
#include "core/Errors.hpp"
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>

namespace corkboard {
namespace core {

namespace {

constexpr int kFormatVersion = 1;

} // namespace

JsonStore::JsonStore(const std::string& storageFile)
    : storageFile_(storageFile) {
    load();
}

std::vector<Channel> JsonStore::listChannels() const {
    return channels_;
}

std::optional<Channel> JsonStore::loadChannel(const std::string& key) const {
    int index = findChannelIndex(key);
    if (index == -1) {
        return std::nullopt;
    }

    Channel channel = channels_[index];
    channel.entries = loadEntries(key);
    return channel;
}

std::vector<Entry> JsonStore::loadEntries(const std::string& key) const {
    std::vector<Entry> entries;
    for (const auto& [identity, stored] : entries_) {
        if (stored.channel == key) {
            entries.push_back(stored.entry);
        }
    }
    return entries;
}

void JsonStore::addChannel(const Channel& channel) {
    if (channel.link.empty()) {
        throw StorageError("Cannot store a channel without a link");
    }
    if (findChannelIndex(channel.link) != -1) {
        throw StorageError("Already subscribed to " + channel.link);
    }

    Channel stored = channel;
    stored.entries.clear();
    channels_.push_back(stored);
}

void JsonStore::setLastBuildDate(const std::string& key, const std::optional<Timestamp>& date) {
    int index = findChannelIndex(key);
    if (index == -1) {
        throw StorageError("Unknown channel " + key);
    }
    channels_[index].lastBuildDate = date;
}

bool JsonStore::deleteChannel(const std::string& key) {
    int index = findChannelIndex(key);
    if (index == -1) {
        return false;
    }

    deleteQuickmarksForChannel(key);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.channel == key) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    channels_.erase(channels_.begin() + index);
    return true;
}

std::vector<Entry> JsonStore::storeEntries(const std::string& key, const std::vector<Entry>& entries) {
    if (findChannelIndex(key) == -1) {
        throw StorageError("Unknown channel " + key);
    }

    std::vector<Entry> inserted;
    for (const auto& entry : entries) {
        if (entries_.emplace(entry.identity, StoredEntry{entry, key}).second) {
            inserted.push_back(entry);
        }
    }
    return inserted;
}

std::vector<Entry> JsonStore::loadUnreadEntries() const {
    std::vector<Entry> unread;
    for (const auto& [identity, stored] : entries_) {
        if (!stored.entry.read) {
            unread.push_back(stored.entry);
        }
    }
    return unread;
}

std::optional<Entry> JsonStore::findEntry(const std::string& identity) const {
    auto it = entries_.find(identity);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.entry;
}

size_t JsonStore::setRead(const std::string& identity, bool read) {
    auto it = entries_.find(identity);
    if (it == entries_.end()) {
        return 0;
    }
    it->second.entry.read = read;
    return 1;
}

void JsonStore::resetQuickmarks(const std::vector<Entry>& unread) {
    quickmarks_.reset(unread);
}

std::vector<QuickmarkedEntry> JsonStore::appendQuickmarks(const std::vector<Entry>& entries) {
    return quickmarks_.append(entries);
}

bool JsonStore::deleteQuickmarkFor(const std::string& identity) {
    return quickmarks_.remove(identity);
}

size_t JsonStore::deleteQuickmarksForChannel(const std::string& key) {
    return quickmarks_.removeAll(identitiesFor(key));
}

std::optional<std::string> JsonStore::lookupQuickmark(int position) const {
    return quickmarks_.lookup(position);
}

void JsonStore::save() {
    nlohmann::json j;
    j["version"] = kFormatVersion;
    j["identityScheme"] = toString(kCurrentIdentityScheme);
    j["channels"] = nlohmann::json::array();
    j["entries"] = nlohmann::json::array();

    for (const auto& channel : channels_) {
        j["channels"].push_back(channel.toJson());
    }
    for (const auto& [identity, stored] : entries_) {
        nlohmann::json entry = stored.entry.toJson();
        entry["channel"] = stored.channel;
        j["entries"].push_back(entry);
    }
    j["quickmarks"] = quickmarks_.toJson();

    // Write beside the target and rename so a crash never leaves half a file
    std::string tempFile = storageFile_ + ".tmp";
    {
        std::ofstream file(tempFile);
        if (!file.is_open()) {
            throw StorageError("Could not open file for writing: " + tempFile);
        }
        file << j.dump(4);
        if (!file) {
            throw StorageError("Could not write " + tempFile);
        }
    }

    if (std::rename(tempFile.c_str(), storageFile_.c_str()) != 0) {
        throw StorageError("Could not replace " + storageFile_);
    }
}

void JsonStore::load() {
    channels_.clear();
    entries_.clear();
    quickmarks_ = QuickmarkOverlay();

    std::ifstream file(storageFile_);
    if (!file.is_open()) {
        // File doesn't exist yet, start with an empty store
        return;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.value("version", kFormatVersion) != kFormatVersion) {
            throw StorageError("unsupported store version " + j["version"].dump());
        }

        if (j.contains("channels")) {
            for (const auto& channelJson : j.at("channels")) {
                Channel channel = Channel::fromJson(channelJson);
                if (findChannelIndex(channel.link) != -1) {
                    throw StorageError("channel " + channel.link + " appears twice");
                }
                channels_.push_back(channel);
            }
        }

        if (j.contains("entries")) {
            for (const auto& entryJson : j.at("entries")) {
                Entry entry = Entry::fromJson(entryJson);
                std::string channel = entryJson.at("channel").get<std::string>();
                if (findChannelIndex(channel) == -1) {
                    throw StorageError("entry " + entry.identity + " belongs to unknown channel " + channel);
                }
                std::string identity = entry.identity;
                if (!entries_.emplace(identity, StoredEntry{std::move(entry), channel}).second) {
                    throw StorageError("identity " + identity + " appears more than once");
                }
            }
        }

        if (j.contains("quickmarks")) {
            quickmarks_ = QuickmarkOverlay::fromJson(j.at("quickmarks"));
        }
    } catch (const nlohmann::json::exception& e) {
        throw StorageError("Error loading " + storageFile_ + ": " + e.what());
    } catch (const StorageError& e) {
        throw StorageError("Error loading " + storageFile_ + ": " + e.what());
    }
}

int JsonStore::findChannelIndex(const std::string& key) const {
    for (size_t i = 0; i < channels_.size(); ++i) {
        if (channels_[i].link == key) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::unordered_set<std::string> JsonStore::identitiesFor(const std::string& key) const {
    std::unordered_set<std::string> identities;
    for (const auto& [identity, stored] : entries_) {
        if (stored.channel == key) {
            identities.insert(identity);
        }
    }
    return identities;
}

} // namespace core
} // namespace corkboard

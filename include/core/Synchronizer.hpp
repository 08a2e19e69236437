#pragma once

#include "core/Channel.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace corkboard {
namespace core {

struct SyncOutcome {
    enum class Status {
        NoChanges,
        NewEntries
    };

    Status status = Status::NoChanges;
    std::vector<Entry> newEntries;

    bool hasChanges() const { return status == Status::NewEntries; }
};

// Diffs a freshly fetched channel against the stored snapshot.
//
// If both sides carry a build date and the stored one is not older, the
// entries are not inspected at all. This trusts the feed's build date to be
// monotonic: a feed that reuses or regresses its stamp will have genuinely
// new entries missed until the stamp moves forward again.
SyncOutcome synchronize(const Channel& stored, const Channel& fetched);

// Result of synchronizing one channel within a batch
struct ChannelReport {
    std::string link;
    std::string title;
    std::optional<SyncOutcome> outcome;         // set on success
    std::optional<Timestamp> fetchedBuildDate;
    std::string error;                          // set on failure

    bool ok() const { return outcome.has_value(); }
};

// Fetches and parses the current document for a channel link
using ChannelSource = std::function<Channel(const std::string& link)>;

// Runs `source` for every stored channel concurrently and diffs each result.
// A channel whose fetch or parse throws is reported as failed; it never
// aborts the rest of the batch. Reports come back in the order of `stored`.
std::vector<ChannelReport> synchronizeBatch(const std::vector<Channel>& stored, const ChannelSource& source);

} // namespace core
} // namespace corkboard

#include "core/Synchronizer.hpp"
#include <future>
#include <unordered_set>

namespace corkboard {
namespace core {

SyncOutcome synchronize(const Channel& stored, const Channel& fetched) {
    SyncOutcome outcome;

    if (stored.lastBuildDate && fetched.lastBuildDate &&
        *stored.lastBuildDate >= *fetched.lastBuildDate) {
        return outcome;
    }

    std::unordered_set<std::string> known;
    for (const auto& entry : stored.entries) {
        known.insert(entry.identity);
    }

    for (const auto& entry : fetched.entries) {
        if (known.insert(entry.identity).second) {
            outcome.newEntries.push_back(entry);
        }
    }

    if (!outcome.newEntries.empty()) {
        outcome.status = SyncOutcome::Status::NewEntries;
    }
    return outcome;
}

std::vector<ChannelReport> synchronizeBatch(const std::vector<Channel>& stored, const ChannelSource& source) {
    std::vector<std::future<Channel>> pending;
    pending.reserve(stored.size());
    for (const auto& channel : stored) {
        pending.push_back(std::async(std::launch::async, source, channel.link));
    }

    std::vector<ChannelReport> reports;
    reports.reserve(stored.size());
    for (size_t i = 0; i < stored.size(); ++i) {
        ChannelReport report;
        report.link = stored[i].link;
        report.title = stored[i].title;

        try {
            Channel fetched = pending[i].get();
            report.fetchedBuildDate = fetched.lastBuildDate;
            report.outcome = synchronize(stored[i], fetched);
        } catch (const std::exception& e) {
            report.error = e.what();
        }

        reports.push_back(std::move(report));
    }
    return reports;
}

} // namespace core
} // namespace corkboard

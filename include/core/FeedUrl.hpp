#pragma once

#include "core/Fetcher.hpp"
#include <optional>
#include <string>
#include <vector>

namespace corkboard {
namespace core {

// Normalized href for an http(s) URL, nullopt for anything else
std::optional<std::string> normalizeUrl(const std::string& url);

// URLs to try for user input, in order: the input itself when it is
// already an http(s) URL, otherwise https:// then http:// in front of it
std::vector<std::string> candidateUrls(const std::string& input);

struct ResolvedFeed {
    std::string url;     // the candidate that answered
    std::string body;
};

// Fetches the first candidate that answers. Throws FetchError listing
// every attempt when none do.
ResolvedFeed resolveAndFetch(const std::string& input, Fetcher& fetcher);

} // namespace core
} // namespace corkboard

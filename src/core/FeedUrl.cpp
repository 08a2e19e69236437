#include "core/FeedUrl.hpp"
#include "core/Errors.hpp"
#include "core/StringUtil.hpp"
#include <algorithm>
#include <ada.h>

namespace corkboard {
namespace core {

std::optional<std::string> normalizeUrl(const std::string& url) {
    std::string cleaned = trim(url);
    if (cleaned.empty()) {
        return std::nullopt;
    }

    auto parsed = ada::parse<ada::url>(cleaned);
    if (!parsed) {
        return std::nullopt;
    }
    if (parsed->get_protocol() != "http:" && parsed->get_protocol() != "https:") {
        return std::nullopt;
    }
    return parsed->get_href();
}

std::vector<std::string> candidateUrls(const std::string& input) {
    std::string cleaned = trim(input);
    std::vector<std::string> candidates;
    auto add = [&candidates](const std::optional<std::string>& url) {
        if (url && std::find(candidates.begin(), candidates.end(), *url) == candidates.end()) {
            candidates.push_back(*url);
        }
    };

    add(normalizeUrl(cleaned));
    // An explicit scheme is taken at its word
    if (cleaned.empty() || cleaned.find("://") != std::string::npos) {
        return candidates;
    }

    add(normalizeUrl("https://" + cleaned));
    add(normalizeUrl("http://" + cleaned));
    return candidates;
}

ResolvedFeed resolveAndFetch(const std::string& input, Fetcher& fetcher) {
    auto candidates = candidateUrls(input);
    if (candidates.empty()) {
        throw FetchError("Not a usable feed URL: " + input);
    }

    std::string failures;
    for (const auto& url : candidates) {
        try {
            return ResolvedFeed{url, fetcher.fetch(url)};
        } catch (const FetchError& e) {
            failures += "\n  " + url + ": " + e.what();
        }
    }
    throw FetchError("Could not fetch " + input + failures);
}

} // namespace core
} // namespace corkboard

#include "core/Fetcher.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <sstream>
#include <cpr/cpr.h>

namespace corkboard {
namespace core {

bool isFeedContentType(const std::string& contentType) {
    std::string type = contentType;
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return type.find("xml") != std::string::npos ||
           type.find("rss") != std::string::npos ||
           type.find("atom") != std::string::npos;
}

HttpFetcher::HttpFetcher(const Config& config)
    : timeoutMs_(config.timeoutMs), userAgent_(config.userAgent) {
}

std::string HttpFetcher::fetch(const std::string& url) {
    if (url.empty()) {
        throw FetchError("Empty URL provided");
    }

    auto response = cpr::Get(
        cpr::Url{url},
        cpr::Header{
            {"User-Agent", userAgent_},
            {"Accept", "application/rss+xml, application/atom+xml, application/xml, text/xml"},
            {"Accept-Encoding", "gzip, deflate"}
        },
        cpr::Timeout{std::chrono::milliseconds(timeoutMs_)},
        cpr::Redirect{50L},
        cpr::VerifySsl{true}
    );

    if (response.error.code != cpr::ErrorCode::OK) {
        throw FetchError("Network request to " + url + " failed: " + response.error.message);
    }

    if (response.status_code != 200) {
        std::stringstream err;
        err << "Failed to fetch feed " << url << ": HTTP " << response.status_code;
        throw FetchError(err.str());
    }

    if (response.text.empty()) {
        throw FetchError("Empty response received from " + url);
    }

    auto contentType = response.header.find("content-type");
    if (contentType != response.header.end() && !isFeedContentType(contentType->second)) {
        std::cerr << "Warning: Unexpected content type from " << url << ": " << contentType->second << "\n";
    }

    return response.text;
}

} // namespace core
} // namespace corkboard

#pragma once

#include "core/Config.hpp"
#include <string>

namespace corkboard {
namespace core {

// Transport collaborator. Implementations must be safe to call from
// several threads at once; update fetches every channel concurrently.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    // Returns the raw document body or throws FetchError
    virtual std::string fetch(const std::string& url) = 0;
};

// True when a Content-Type header value names an XML, RSS or Atom type
bool isFeedContentType(const std::string& contentType);

class HttpFetcher : public Fetcher {
public:
    explicit HttpFetcher(const Config& config = Config());

    std::string fetch(const std::string& url) override;

private:
    long timeoutMs_;
    std::string userAgent_;
};

} // namespace core
} // namespace corkboard

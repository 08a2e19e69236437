#pragma once

#include <string>

namespace corkboard {
namespace core {

struct Config {
    std::string storageFile = "corkdb.json";
    long timeoutMs = 30000;
    std::string userAgent = "corkboard/1.0";

    // Defaults overridden by CORKBOARD_DB and CORKBOARD_TIMEOUT_MS
    static Config fromEnvironment();
};

} // namespace core
} // namespace corkboard

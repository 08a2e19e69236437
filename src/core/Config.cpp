#include "core/Config.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace corkboard {
namespace core {

Config Config::fromEnvironment() {
    Config config;

    if (const char* db = std::getenv("CORKBOARD_DB")) {
        if (*db != '\0') {
            config.storageFile = db;
        }
    }

    if (const char* timeout = std::getenv("CORKBOARD_TIMEOUT_MS")) {
        try {
            size_t consumed = 0;
            long value = std::stol(timeout, &consumed);
            if (consumed != std::string(timeout).size() || value <= 0) {
                throw std::invalid_argument("not a positive integer");
            }
            config.timeoutMs = value;
        } catch (const std::exception& e) {
            std::cerr << "Warning: ignoring CORKBOARD_TIMEOUT_MS=" << timeout
                      << " (" << e.what() << ")\n";
        }
    }

    return config;
}

} // namespace core
} // namespace corkboard

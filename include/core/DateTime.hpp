#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace corkboard {
namespace core {

using Timestamp = std::chrono::system_clock::time_point;

// "Tue, 10 Jun 2003 04:00:00 GMT" style dates used by RSS.
// Returns nullopt for anything that does not parse.
std::optional<Timestamp> parseRfc2822(const std::string& text);

// "2003-12-13T18:30:02Z" style dates used by Atom.
std::optional<Timestamp> parseRfc3339(const std::string& text);

// UTC, "YYYY-MM-DD HH:MM"
std::string formatTimestamp(const Timestamp& timestamp);

int64_t toEpochSeconds(const Timestamp& timestamp);
Timestamp fromEpochSeconds(int64_t seconds);

} // namespace core
} // namespace corkboard

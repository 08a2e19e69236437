#pragma once

#include <string>

namespace corkboard {
namespace core {

// Strips leading and trailing spaces, tabs and line breaks
std::string trim(const std::string& text);

} // namespace core
} // namespace corkboard

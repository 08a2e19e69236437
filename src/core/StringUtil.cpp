#include "core/StringUtil.hpp"

namespace corkboard {
namespace core {

std::string trim(const std::string& text) {
    std::string cleaned = text;
    cleaned.erase(0, cleaned.find_first_not_of(" \t\n\r"));
    cleaned.erase(cleaned.find_last_not_of(" \t\n\r") + 1);
    return cleaned;
}

} // namespace core
} // namespace corkboard

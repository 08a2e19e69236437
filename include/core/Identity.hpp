#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace corkboard {
namespace core {

// Hash schemes are versioned so stored identities stay reproducible
// outside this process. New schemes get a new enumerator, never a
// change to an existing one.
enum class IdentityScheme {
    Sha256V1
};

constexpr IdentityScheme kCurrentIdentityScheme = IdentityScheme::Sha256V1;
constexpr std::size_t kIdentityLength = 64;

const char* toString(IdentityScheme scheme);

// identity = hex(SHA-256(primaryText ++ link)), lowercase, 64 characters
std::string deriveIdentity(const std::string& primaryText,
                           const std::optional<std::string>& link,
                           IdentityScheme scheme = kCurrentIdentityScheme);

// True for strings shaped like a derived identity
bool isIdentity(const std::string& token);

} // namespace core
} // namespace corkboard

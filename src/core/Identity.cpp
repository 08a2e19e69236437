#include "core/Identity.hpp"
#include <memory>
#include <stdexcept>
#include <openssl/evp.h>

namespace corkboard {
namespace core {

namespace {

std::string sha256Hex(const std::string& input) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Could not allocate digest context");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out[i * 2 + 0] = hex[(digest[i] >> 4) & 0xF];
        out[i * 2 + 1] = hex[digest[i] & 0xF];
    }
    return out;
}

} // namespace

const char* toString(IdentityScheme scheme) {
    switch (scheme) {
        case IdentityScheme::Sha256V1: return "sha256-v1";
    }
    return "unknown";
}

std::string deriveIdentity(const std::string& primaryText,
                           const std::optional<std::string>& link,
                           IdentityScheme scheme) {
    switch (scheme) {
        case IdentityScheme::Sha256V1:
            return sha256Hex(link ? primaryText + *link : primaryText);
    }
    throw std::invalid_argument("Unsupported identity scheme");
}

bool isIdentity(const std::string& token) {
    if (token.size() != kIdentityLength) {
        return false;
    }
    for (char c : token) {
        bool digit = c >= '0' && c <= '9';
        bool lowerHex = c >= 'a' && c <= 'f';
        if (!digit && !lowerHex) {
            return false;
        }
    }
    return true;
}

} // namespace core
} // namespace corkboard

#include "core/Channel.hpp"
#include "core/Identity.hpp"
#include <gtest/gtest.h>

using namespace corkboard::core;

TEST(IdentityTest, MatchesPublishedSha256) {
    // FIPS 180-2 test vector, so identities are reproducible by any SHA-256
    EXPECT_EQ(deriveIdentity("abc", std::nullopt),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(IdentityTest, IsDeterministic) {
    EXPECT_EQ(deriveIdentity("azz", std::nullopt), deriveIdentity("azz", std::nullopt));
    EXPECT_EQ(deriveIdentity("azz", std::string("https://a.example/1")),
              deriveIdentity("azz", std::string("https://a.example/1")));
}

TEST(IdentityTest, LinkIsAppendedToPrimaryText) {
    EXPECT_EQ(deriveIdentity("ab", std::string("c")), deriveIdentity("abc", std::nullopt));
    EXPECT_NE(deriveIdentity("azz", std::string("https://a.example/1")),
              deriveIdentity("azz", std::string("https://b.example/1")));
    EXPECT_NE(deriveIdentity("azz", std::string("https://a.example/1")), deriveIdentity("azz", std::nullopt));
}

TEST(IdentityTest, FixedWidthLowercaseHex) {
    std::string identity = deriveIdentity("Some title", std::nullopt);
    EXPECT_EQ(identity.size(), kIdentityLength);
    EXPECT_TRUE(isIdentity(identity));
}

TEST(IdentityTest, RecognizesIdentityTokens) {
    EXPECT_FALSE(isIdentity("12"));
    EXPECT_FALSE(isIdentity(""));
    EXPECT_FALSE(isIdentity(std::string(64, 'g')));
    EXPECT_FALSE(isIdentity(std::string(64, 'A')));
    EXPECT_TRUE(isIdentity(std::string(64, '0')));
}

TEST(IdentityTest, EntryEqualityIsByIdentity) {
    Entry a("Title", std::string("https://x.example/1"));
    Entry b("Title", std::string("https://x.example/1"), fromEpochSeconds(100));
    b.read = true;
    Entry c("Other", std::string("https://x.example/1"));

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_FALSE(a.read);
}

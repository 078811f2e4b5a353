#include <gtest/gtest.h>

#include "adapters/secondary/OpenSslCredentialHasher.hpp"
#include <regex>
#include <set>

using namespace finger::adapters::secondary;

class OpenSslCredentialHasherTest : public ::testing::Test {
protected:
    OpenSslCredentialHasher hasher_;
};

TEST_F(OpenSslCredentialHasherTest, GenerateKey_IsUuidV4) {
    const std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

    for (int i = 0; i < 100; ++i) {
        auto key = hasher_.generateKey();
        EXPECT_TRUE(std::regex_match(key, uuid)) << key;
    }
}

TEST_F(OpenSslCredentialHasherTest, GenerateKey_Unique) {
    std::set<std::string> keys;
    for (int i = 0; i < 1000; ++i) {
        keys.insert(hasher_.generateKey());
    }
    EXPECT_EQ(keys.size(), 1000u);
}

TEST_F(OpenSslCredentialHasherTest, Hash_KnownSha256) {
    EXPECT_EQ(hasher_.hash(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(hasher_.hash("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(OpenSslCredentialHasherTest, Hash_Deterministic) {
    EXPECT_EQ(hasher_.hash("key"), hasher_.hash("key"));
    EXPECT_NE(hasher_.hash("key"), hasher_.hash("Key"));
}

TEST_F(OpenSslCredentialHasherTest, Equals) {
    EXPECT_TRUE(hasher_.equals("letmein", "letmein"));
    EXPECT_FALSE(hasher_.equals("letmein", "letmeout"));
    EXPECT_FALSE(hasher_.equals("letmein", "letmein2"));
    EXPECT_FALSE(hasher_.equals("", "x"));
    EXPECT_TRUE(hasher_.equals("", ""));
}

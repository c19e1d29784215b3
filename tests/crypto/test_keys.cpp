// PrivDAO - Member Key Tests
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include <gtest/gtest.h>
#include "privdao/crypto/keys.h"

using namespace privdao;

// ============================================================================
// RFC 8032 Test Vectors
// ============================================================================

TEST(PrivateKeyTest, Rfc8032TestOne) {
    auto key = PrivateKey::FromHex(
        "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
    ASSERT_TRUE(key.has_value());
    auto id = key->GetIdentity();
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->ToHex(),
              "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
}

TEST(PrivateKeyTest, Rfc8032TestTwo) {
    auto key = PrivateKey::FromHex(
        "4ccd089b28ff96da9db6c346ec114e0f5b8a319f35aba624da8cf6ed4fb8a6fb");
    ASSERT_TRUE(key.has_value());
    auto id = key->GetIdentity();
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->ToHex(),
              "3d4017c3e843895a92b70aa74d1b7ebc9c982ccf2ec4968cc0cd55f12af4660c");
}

// ============================================================================
// Key Handling
// ============================================================================

TEST(PrivateKeyTest, DefaultIsInvalid) {
    PrivateKey key;
    EXPECT_FALSE(key.IsValid());
    EXPECT_FALSE(key.GetIdentity().has_value());
}

TEST(PrivateKeyTest, GenerateProducesDistinctKeys) {
    PrivateKey a = PrivateKey::Generate();
    PrivateKey b = PrivateKey::Generate();
    ASSERT_TRUE(a.IsValid());
    ASSERT_TRUE(b.IsValid());
    EXPECT_NE(a.ToHex(), b.ToHex());

    auto idA = a.GetIdentity();
    auto idB = b.GetIdentity();
    ASSERT_TRUE(idA && idB);
    EXPECT_NE(*idA, *idB);
}

TEST(PrivateKeyTest, HexRoundTrip) {
    PrivateKey key = PrivateKey::Generate();
    auto parsed = PrivateKey::FromHex(key.ToHex());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->GetIdentity(), key.GetIdentity());
}

TEST(PrivateKeyTest, FromHexRejectsBadInput) {
    EXPECT_FALSE(PrivateKey::FromHex("").has_value());
    EXPECT_FALSE(PrivateKey::FromHex("9d61b19d").has_value());
    EXPECT_FALSE(PrivateKey::FromHex(std::string(64, 'q')).has_value());
}

TEST(PrivateKeyTest, IdentityIsDeterministic) {
    PrivateKey key = PrivateKey::Generate();
    EXPECT_EQ(key.GetIdentity(), key.GetIdentity());
}

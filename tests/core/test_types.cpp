// PrivDAO - Core Types Tests
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include <gtest/gtest.h>
#include "privdao/core/types.h"
#include "privdao/core/hex.h"

#include <map>

namespace privdao {
namespace test {

// ============================================================================
// Hash256 Tests
// ============================================================================

TEST(Hash256Test, DefaultConstructorCreatesZeroHash) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
    EXPECT_EQ(h.size(), 32u);
    for (size_t i = 0; i < Hash256::SIZE; ++i) {
        EXPECT_EQ(h[i], 0);
    }
}

TEST(Hash256Test, ConstructFromBytes) {
    std::array<Byte, 32> data;
    for (size_t i = 0; i < 32; ++i) {
        data[i] = static_cast<Byte>(i);
    }

    Hash256 h(data);
    for (size_t i = 0; i < 32; ++i) {
        EXPECT_EQ(h[i], i);
    }
    EXPECT_FALSE(h.IsNull());
}

TEST(Hash256Test, ShortRawInputIsZeroExtended) {
    const Byte raw[3] = {0xAA, 0xBB, 0xCC};
    Hash256 h(raw, sizeof(raw));
    EXPECT_EQ(h[0], 0xAA);
    EXPECT_EQ(h[2], 0xCC);
    EXPECT_EQ(h[3], 0x00);
    EXPECT_EQ(h[31], 0x00);
}

TEST(Hash256Test, OrderingIsLexicographic) {
    std::array<Byte, 32> low, high;
    low.fill(0x00);
    high.fill(0x00);
    low[31] = 0xFF;
    high[0] = 0x01;

    Hash256 a(low), b(high);
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_NE(a, b);

    std::map<Hash256, int> ordered{{b, 2}, {a, 1}};
    EXPECT_EQ(ordered.begin()->second, 1);
}

TEST(Hash256Test, HexRoundTripKeepsByteOrder) {
    const std::string hex =
        "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f";
    Hash256 h = Hash256::FromHex(hex);
    EXPECT_EQ(h[0], 0x00);
    EXPECT_EQ(h[31], 0x1f);
    EXPECT_EQ(h.ToHex(), hex);
}

TEST(Hash256Test, FromHexRejectsBadInput) {
    EXPECT_THROW(Hash256::FromHex("abcd"), std::invalid_argument);
    EXPECT_THROW(Hash256::FromHex(std::string(64, 'z')), std::invalid_argument);
}

TEST(Hash256Test, SetNull) {
    std::array<Byte, 32> data;
    data.fill(0x42);
    Hash256 h(data);
    h.SetNull();
    EXPECT_TRUE(h.IsNull());
}

// ============================================================================
// Identity Tests
// ============================================================================

TEST(IdentityTest, ExplicitFromHash) {
    std::array<Byte, 32> data;
    data.fill(0x07);
    Hash256 h(data);
    Identity id(h);
    EXPECT_EQ(id, h);
    EXPECT_EQ(Identity::FromHex(h.ToHex()), id);
}

TEST(IdentityTest, SaltIsThirtyTwoBytes) {
    EXPECT_EQ(sizeof(Salt), 32u);
    EXPECT_EQ(sizeof(Commitment), 32u);
}

// ============================================================================
// Hex Tests
// ============================================================================

TEST(HexTest, BytesToHexLowercase) {
    std::vector<uint8_t> bytes = {0xDE, 0xAD, 0xBE, 0xEF};
    EXPECT_EQ(BytesToHex(bytes), "deadbeef");
    EXPECT_EQ(BytesToHex(std::vector<uint8_t>()), "");
}

TEST(HexTest, HexToBytesAcceptsUppercase) {
    std::vector<uint8_t> bytes = HexToBytes("DeAdBeEf");
    ASSERT_EQ(bytes.size(), 4u);
    EXPECT_EQ(bytes[0], 0xDE);
    EXPECT_EQ(bytes[3], 0xEF);
}

TEST(HexTest, HexToBytesRejectsMalformed) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("00ff"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("0"));
    EXPECT_FALSE(IsValidHex("0g"));
}

TEST(HexTest, ParseFixedHex) {
    std::array<uint8_t, 4> out{};
    EXPECT_TRUE(ParseFixedHex("01020304", out));
    EXPECT_EQ(out[3], 4);
    EXPECT_FALSE(ParseFixedHex("010203", out));
    EXPECT_FALSE(ParseFixedHex("0102030405", out));
    EXPECT_FALSE(ParseFixedHex("0102030x", out));
}

} // namespace test
} // namespace privdao

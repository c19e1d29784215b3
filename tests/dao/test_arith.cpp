// PrivDAO - Checked Arithmetic Tests
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include <gtest/gtest.h>
#include "privdao/dao/arith.h"

#include <limits>
#include <random>

using namespace privdao;
using namespace privdao::dao;

class ArithTest : public ::testing::Test {
protected:
    static void ExpectFloorRoot(uint64_t n) {
        uint64_t r = IntegerSqrt(n);
        UInt128 square = WideMul(r, r);
        UInt128 next = WideMul(r + 1, r + 1);
        UInt128 value{0, n};
        EXPECT_FALSE(value < square) << "isqrt(" << n << ")^2 exceeds n";
        EXPECT_TRUE(value < next) << "isqrt(" << n << ") is not the floor root";
    }
};

// ============================================================================
// Integer Square Root
// ============================================================================

TEST_F(ArithTest, SqrtOfZeroAndOne) {
    EXPECT_EQ(IntegerSqrt(0), 0u);
    EXPECT_EQ(IntegerSqrt(1), 1u);
}

TEST_F(ArithTest, SqrtSmallValues) {
    EXPECT_EQ(IntegerSqrt(2), 1u);
    EXPECT_EQ(IntegerSqrt(3), 1u);
    EXPECT_EQ(IntegerSqrt(4), 2u);
    EXPECT_EQ(IntegerSqrt(15), 3u);
    EXPECT_EQ(IntegerSqrt(16), 4u);
    EXPECT_EQ(IntegerSqrt(1000000), 1000u);
    EXPECT_EQ(IntegerSqrt(999999), 999u);
}

TEST_F(ArithTest, SqrtNearPerfectSquares) {
    for (uint64_t k = 1; k < 5000; ++k) {
        ExpectFloorRoot(k * k - 1);
        ExpectFloorRoot(k * k);
        ExpectFloorRoot(k * k + 1);
    }
}

TEST_F(ArithTest, SqrtOfMaximum) {
    uint64_t max = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(IntegerSqrt(max), 4294967295u);
    ExpectFloorRoot(max);
    ExpectFloorRoot(max - 1);
}

TEST_F(ArithTest, SqrtFloorPropertyRandom) {
    std::mt19937_64 rng(20240601);
    for (int i = 0; i < 20000; ++i) {
        ExpectFloorRoot(rng());
        ExpectFloorRoot(rng() >> (i % 64));
    }
}

// ============================================================================
// Checked Operations
// ============================================================================

TEST_F(ArithTest, CheckedAddUnsigned) {
    uint64_t out = 0;
    EXPECT_TRUE(CheckedAdd(uint64_t(2), uint64_t(3), out));
    EXPECT_EQ(out, 5u);

    uint64_t max = std::numeric_limits<uint64_t>::max();
    EXPECT_TRUE(CheckedAdd(max - 1, uint64_t(1), out));
    EXPECT_EQ(out, max);
    EXPECT_FALSE(CheckedAdd(max, uint64_t(1), out));
}

TEST_F(ArithTest, CheckedAddSigned) {
    int64_t out = 0;
    EXPECT_TRUE(CheckedAdd(int64_t(-5), int64_t(3), out));
    EXPECT_EQ(out, -2);

    int64_t max = std::numeric_limits<int64_t>::max();
    int64_t min = std::numeric_limits<int64_t>::min();
    EXPECT_FALSE(CheckedAdd(max, int64_t(1), out));
    EXPECT_FALSE(CheckedAdd(min, int64_t(-1), out));
    EXPECT_TRUE(CheckedAdd(max, int64_t(-1), out));
    EXPECT_EQ(out, max - 1);
}

TEST_F(ArithTest, CheckedMul) {
    uint64_t out = 0;
    EXPECT_TRUE(CheckedMul(uint64_t(0), std::numeric_limits<uint64_t>::max(), out));
    EXPECT_EQ(out, 0u);
    EXPECT_TRUE(CheckedMul(uint64_t(1) << 31, uint64_t(1) << 32, out));
    EXPECT_EQ(out, uint64_t(1) << 63);
    EXPECT_FALSE(CheckedMul(uint64_t(1) << 32, uint64_t(1) << 32, out));
}

TEST_F(ArithTest, WideMulCarriesIntoHighWord) {
    uint64_t max = std::numeric_limits<uint64_t>::max();
    UInt128 product = WideMul(max, max);
    // (2^64 - 1)^2 = 2^128 - 2^65 + 1
    EXPECT_EQ(product.hi, max - 1);
    EXPECT_EQ(product.lo, 1u);

    UInt128 small = WideMul(6, 7);
    EXPECT_EQ(small.hi, 0u);
    EXPECT_EQ(small.lo, 42u);
}

TEST_F(ArithTest, ProductAtLeastQuorumBoundary) {
    // reveals * 100 >= commits * quorum
    EXPECT_FALSE(ProductAtLeast(4, 100, 10, 50));
    EXPECT_TRUE(ProductAtLeast(5, 100, 10, 50));

    uint64_t max = std::numeric_limits<uint64_t>::max();
    EXPECT_TRUE(ProductAtLeast(max, 100, max, 100));
    EXPECT_FALSE(ProductAtLeast(max - 1, 100, max, 100));
    EXPECT_TRUE(ProductAtLeast(max, 100, max, 99));
}

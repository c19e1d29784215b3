// PrivDAO - Checked Arithmetic
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/dao/arith.h"

#include <limits>

namespace privdao {
namespace dao {

uint64_t IntegerSqrt(uint64_t n) {
    if (n == 0) {
        return 0;
    }
    // Newton iteration from ceil(n/2), decreasing until it stops improving
    uint64_t x = n;
    uint64_t y = x / 2 + (x & 1);
    while (y < x) {
        x = y;
        y = (x + n / x) / 2;
    }
    return x;
}

bool CheckedAdd(uint64_t a, uint64_t b, uint64_t& out) {
    if (a > std::numeric_limits<uint64_t>::max() - b) {
        return false;
    }
    out = a + b;
    return true;
}

bool CheckedAdd(int64_t a, int64_t b, int64_t& out) {
    if (b > 0 && a > std::numeric_limits<int64_t>::max() - b) {
        return false;
    }
    if (b < 0 && a < std::numeric_limits<int64_t>::min() - b) {
        return false;
    }
    out = a + b;
    return true;
}

bool CheckedMul(uint64_t a, uint64_t b, uint64_t& out) {
    if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) {
        return false;
    }
    out = a * b;
    return true;
}

UInt128 WideMul(uint64_t a, uint64_t b) {
    const uint64_t mask = 0xFFFFFFFFULL;
    uint64_t aLo = a & mask, aHi = a >> 32;
    uint64_t bLo = b & mask, bHi = b >> 32;

    uint64_t ll = aLo * bLo;
    uint64_t lh = aLo * bHi;
    uint64_t hl = aHi * bLo;
    uint64_t hh = aHi * bHi;

    // Middle column, each term < 2^32 so the sum cannot overflow
    uint64_t mid = (ll >> 32) + (lh & mask) + (hl & mask);

    UInt128 r;
    r.lo = (mid << 32) | (ll & mask);
    r.hi = hh + (lh >> 32) + (hl >> 32) + (mid >> 32);
    return r;
}

} // namespace dao
} // namespace privdao

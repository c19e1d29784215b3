// PrivDAO - Checked Arithmetic
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Overflow-checked integer helpers and the quadratic weight function.

#ifndef PRIVDAO_DAO_ARITH_H
#define PRIVDAO_DAO_ARITH_H

#include <cstdint>

namespace privdao {
namespace dao {

/// Integer floor square root: r*r <= n < (r+1)*(r+1)
uint64_t IntegerSqrt(uint64_t n);

/// a + b into out; false (out untouched) on overflow
bool CheckedAdd(uint64_t a, uint64_t b, uint64_t& out);

/// a + b into out; false (out untouched) on signed overflow
bool CheckedAdd(int64_t a, int64_t b, int64_t& out);

/// a * b into out; false (out untouched) on overflow
bool CheckedMul(uint64_t a, uint64_t b, uint64_t& out);

/// Full 128-bit product of two 64-bit values
struct UInt128 {
    uint64_t hi{0};
    uint64_t lo{0};

    bool operator<(const UInt128& o) const {
        return hi < o.hi || (hi == o.hi && lo < o.lo);
    }
    bool operator>=(const UInt128& o) const { return !(*this < o); }
    bool operator==(const UInt128& o) const { return hi == o.hi && lo == o.lo; }
};

UInt128 WideMul(uint64_t a, uint64_t b);

/// a*b >= c*d, exact for every 64-bit input
inline bool ProductAtLeast(uint64_t a, uint64_t b, uint64_t c, uint64_t d) {
    return WideMul(a, b) >= WideMul(c, d);
}

} // namespace dao
} // namespace privdao

#endif // PRIVDAO_DAO_ARITH_H

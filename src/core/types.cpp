// PrivDAO - Core Types Implementation
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/core/types.h"
#include "privdao/core/hex.h"

namespace privdao {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }
    std::vector<Byte> bytes = HexToBytes(hex);
    return BaseHash(bytes.data(), bytes.size());
}

template class BaseHash<256>;

} // namespace privdao

// PrivDAO - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#ifndef PRIVDAO_CORE_HEX_H
#define PRIVDAO_CORE_HEX_H

#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

namespace privdao {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

template<size_t N>
std::string BytesToHex(const std::array<uint8_t, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes
/// @throws std::invalid_argument on odd length or non-hex characters
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

/// Parse exactly N bytes of hex into a fixed array
/// @return false if the string is not 2*N hex characters
template<size_t N>
bool ParseFixedHex(const std::string& hex, std::array<uint8_t, N>& out) {
    if (hex.size() != N * 2 || !IsValidHex(hex)) {
        return false;
    }
    std::vector<uint8_t> bytes = HexToBytes(hex);
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return true;
}

} // namespace privdao

#endif // PRIVDAO_CORE_HEX_H

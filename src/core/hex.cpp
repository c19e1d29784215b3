// PrivDAO - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/core/hex.h"

#include <algorithm>

namespace privdao {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";

    int HexDigitValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string result(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        result[2 * i] = HEX_CHARS[data[i] >> 4];
        result[2 * i + 1] = HEX_CHARS[data[i] & 0x0F];
    }
    return result;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    std::vector<uint8_t> result(hex.length() / 2);
    for (size_t i = 0; i < result.size(); ++i) {
        int high = HexDigitValue(hex[2 * i]);
        int low = HexDigitValue(hex[2 * i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        result[i] = static_cast<uint8_t>((high << 4) | low);
    }
    return result;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || str.length() % 2 != 0) {
        return false;
    }
    return std::all_of(str.begin(), str.end(),
                       [](char c) { return HexDigitValue(c) >= 0; });
}

} // namespace privdao

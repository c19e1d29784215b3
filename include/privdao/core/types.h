// PrivDAO - Core Types Header
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// This file defines fundamental types used throughout PrivDAO.

#ifndef PRIVDAO_CORE_TYPES_H
#define PRIVDAO_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <chrono>
#include <cstring>

namespace privdao {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in smallest ledger units
using Amount = uint64_t;

/// Timestamp (Unix epoch seconds, supplied by the host per request)
using Timestamp = int64_t;

/// Host time unit used by external voting-weight consumers
using Slot = uint64_t;

// ============================================================================
// Time Functions
// ============================================================================

/// Get current Unix timestamp
inline Timestamp GetTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-width byte string used for digests and identities
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero-extended)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    /// Check if all bytes are zero
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    /// Lexicographic byte order, matching the key order of the store
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Hex string in storage byte order
    std::string ToHex() const;

    /// Parse hex string in storage byte order
    /// @throws std::invalid_argument on bad length or characters
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 32-byte participant identity (an Ed25519 public key, a DAO key,
/// a governance token reference or a treasury account)
class Identity : public Hash256 {
public:
    using Hash256::Hash256;
    Identity() = default;
    explicit Identity(const Hash256& h) : Hash256(h) {}

    static Identity FromHex(const std::string& hex) {
        return Identity(Hash256::FromHex(hex));
    }
};

/// 32-byte vote commitment
using Commitment = Hash256;

/// 32-byte reveal salt
using Salt = std::array<Byte, 32>;

} // namespace privdao

#endif // PRIVDAO_CORE_TYPES_H

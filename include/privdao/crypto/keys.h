// PrivDAO - Member Keys
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Ed25519 member keys. A member's Identity is the 32-byte raw Ed25519
// public key derived from the private seed.

#ifndef PRIVDAO_CRYPTO_KEYS_H
#define PRIVDAO_CRYPTO_KEYS_H

#include "privdao/core/types.h"
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace privdao {

// ============================================================================
// Private Key
// ============================================================================

/**
 * Ed25519 private key (32-byte seed).
 */
class PrivateKey {
public:
    /// Seed size in bytes
    static constexpr size_t SIZE = 32;

    /// Default constructor - invalid key
    PrivateKey() : valid_(false) { data_.fill(0); }

    /// Construct from a 32-byte seed
    explicit PrivateKey(const std::array<uint8_t, SIZE>& seed)
        : data_(seed), valid_(true) {}

    /// Destructor - securely clear memory
    ~PrivateKey();

    PrivateKey(const PrivateKey& other) = default;
    PrivateKey& operator=(const PrivateKey& other) = default;

    /// Generate a new random private key
    static PrivateKey Generate();

    bool IsValid() const { return valid_; }

    const uint8_t* data() const { return data_.data(); }

    /// Derive the member identity (raw Ed25519 public key)
    /// @return nullopt if the key is invalid or OpenSSL rejects it
    std::optional<Identity> GetIdentity() const;

    /// Convert to hex (use with caution!)
    std::string ToHex() const;

    /// Parse from hex
    static std::optional<PrivateKey> FromHex(const std::string& hex);

private:
    std::array<uint8_t, SIZE> data_;
    bool valid_;
};

} // namespace privdao

#endif // PRIVDAO_CRYPTO_KEYS_H

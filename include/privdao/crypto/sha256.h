// PrivDAO - SHA256 Hash Function
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Incremental SHA-256 backed by the OpenSSL EVP digest interface.
// Used for vote commitments, record keys and record discriminators.

#ifndef PRIVDAO_CRYPTO_SHA256_H
#define PRIVDAO_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "privdao/core/types.h"

struct evp_md_ctx_st;

namespace privdao {

/// SHA-256 hasher class
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// @throws std::runtime_error if the digest context cannot be created
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);

    SHA256& Write(const std::string& data) {
        return Write(reinterpret_cast<const Byte*>(data.data()), data.size());
    }

    template<size_t BITS>
    SHA256& Write(const BaseHash<BITS>& hash) {
        return Write(hash.data(), hash.size());
    }

    /// Finalize the hash and write OUTPUT_SIZE bytes to output.
    /// The hasher is reset afterwards.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Finalize into a Hash256
    Hash256 Finalize();

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    evp_md_ctx_st* ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace privdao

#endif // PRIVDAO_CRYPTO_SHA256_H

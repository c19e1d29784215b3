// PrivDAO - Member Keys Implementation
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/crypto/keys.h"
#include "privdao/core/hex.h"
#include "privdao/core/random.h"

#include <openssl/evp.h>

namespace privdao {

namespace {

// Secure memory clear
inline void SecureClear(void* ptr, size_t len) {
    volatile uint8_t* p = static_cast<volatile uint8_t*>(ptr);
    while (len--) *p++ = 0;
}

} // namespace

PrivateKey::~PrivateKey() {
    SecureClear(data_.data(), data_.size());
}

PrivateKey PrivateKey::Generate() {
    std::array<uint8_t, SIZE> seed;
    GetRandBytes(seed.data(), seed.size());
    PrivateKey key(seed);
    SecureClear(seed.data(), seed.size());
    return key;
}

std::optional<Identity> PrivateKey::GetIdentity() const {
    if (!valid_) {
        return std::nullopt;
    }

    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                  data_.data(), data_.size());
    if (!pkey) {
        return std::nullopt;
    }

    Identity identity;
    size_t len = identity.size();
    int ok = EVP_PKEY_get_raw_public_key(pkey, identity.data(), &len);
    EVP_PKEY_free(pkey);

    if (ok != 1 || len != identity.size()) {
        return std::nullopt;
    }
    return identity;
}

std::string PrivateKey::ToHex() const {
    return BytesToHex(data_.data(), data_.size());
}

std::optional<PrivateKey> PrivateKey::FromHex(const std::string& hex) {
    std::array<uint8_t, SIZE> seed;
    if (!ParseFixedHex(hex, seed)) {
        return std::nullopt;
    }
    PrivateKey key(seed);
    SecureClear(seed.data(), seed.size());
    return key;
}

} // namespace privdao

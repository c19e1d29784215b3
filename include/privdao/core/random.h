// PrivDAO - Secure Random Number Generation Header
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Cryptographically secure random bytes from the OS entropy source,
// used for reveal salts.

#ifndef PRIVDAO_CORE_RANDOM_H
#define PRIVDAO_CORE_RANDOM_H

#include "privdao/core/types.h"
#include <cstdint>
#include <cstddef>

namespace privdao {

/// Fill buffer with cryptographically secure random bytes
/// @throws std::runtime_error if the OS entropy source fails
void GetRandBytes(uint8_t* buf, size_t len);

/// Generate a fresh 32-byte reveal salt
Salt GetRandSalt();

} // namespace privdao

#endif // PRIVDAO_CORE_RANDOM_H

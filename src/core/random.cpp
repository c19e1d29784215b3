// PrivDAO - Secure Random Number Generation Implementation
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/core/random.h"

#include <cerrno>
#include <stdexcept>
#include <sys/random.h>

namespace privdao {

void GetRandBytes(uint8_t* buf, size_t len) {
    size_t filled = 0;
    while (filled < len) {
        ssize_t ret = getrandom(buf + filled, len - filled, 0);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("Failed to get random bytes from OS");
        }
        filled += static_cast<size_t>(ret);
    }
}

Salt GetRandSalt() {
    Salt salt;
    GetRandBytes(salt.data(), salt.size());
    return salt;
}

} // namespace privdao

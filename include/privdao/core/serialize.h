// PrivDAO - Serialization Header
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Little-endian serialization primitives for PrivDAO records.
// Persisted records use fixed offsets: bounded strings and optional
// fields always occupy their maximum width so that every record of a
// type has the same encoded length.

#ifndef PRIVDAO_CORE_SERIALIZE_H
#define PRIVDAO_CORE_SERIALIZE_H

#include "privdao/core/types.h"
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>
#include <string>
#include <array>
#include <optional>
#include <stdexcept>
#include <ios>
#include <type_traits>

namespace privdao {

// ============================================================================
// Constants
// ============================================================================

/// Maximum size for a length-prefixed field to prevent memory exhaustion
static constexpr uint64_t MAX_SIZE = 0x02000000;  // 32 MB

// ============================================================================
// Endianness Helpers (Always Little-Endian for serialization)
// ============================================================================

namespace detail {

inline uint16_t HostToLE16(uint16_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap16(host);
#else
    return host;
#endif
}

inline uint32_t HostToLE32(uint32_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap32(host);
#else
    return host;
#endif
}

inline uint64_t HostToLE64(uint64_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap64(host);
#else
    return host;
#endif
}

inline uint16_t LEToHost16(uint16_t little) { return HostToLE16(little); }
inline uint32_t LEToHost32(uint32_t little) { return HostToLE32(little); }
inline uint64_t LEToHost64(uint64_t little) { return HostToLE64(little); }

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    using size_type = std::size_t;

private:
    std::vector<uint8_t> data_;
    size_type read_pos_ = 0;

public:
    DataStream() = default;

    explicit DataStream(const std::vector<uint8_t>& data) : data_(data) {}

    explicit DataStream(std::vector<uint8_t>&& data) : data_(std::move(data)) {}

    DataStream(const uint8_t* data, size_type len) : data_(data, data + len) {}

    explicit DataStream(const std::string& data)
        : data_(data.begin(), data.end()) {}

    /// Unread bytes remaining
    size_type size() const noexcept { return data_.size() - read_pos_; }

    /// Total buffer size (including read bytes)
    size_type TotalSize() const noexcept { return data_.size(); }

    bool empty() const noexcept { return size() == 0; }

    void reserve(size_type n) { data_.reserve(n + read_pos_); }

    void clear() {
        data_.clear();
        read_pos_ = 0;
    }

    /// Pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + read_pos_; }

    /// Whole buffer
    const std::vector<uint8_t>& Data() const noexcept { return data_; }

    /// Whole buffer as a byte string (database value form)
    std::string Str() const { return std::string(data_.begin(), data_.end()); }

    void Write(const uint8_t* src, size_type len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_type len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    void Read(uint8_t* dst, size_type len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + read_pos_, len);
        read_pos_ += len;
    }

    void Read(char* dst, size_type len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    /// Skip n bytes
    void Ignore(size_type n) {
        if (n > size()) {
            throw std::ios_base::failure("DataStream::Ignore(): end of data");
        }
        read_pos_ += n;
    }

    /// Append n zero bytes
    void Pad(size_type n) {
        data_.insert(data_.end(), n, 0);
    }

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);
};

// ============================================================================
// Low-Level Serialization Functions
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj) {
    s.Write(&obj, 1);
}

template<typename Stream>
inline void ser_writedata16(Stream& s, uint16_t obj) {
    obj = detail::HostToLE16(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 2);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj) {
    obj = detail::HostToLE32(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    obj = detail::HostToLE64(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint16_t ser_readdata16(Stream& s) {
    uint16_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 2);
    return detail::LEToHost16(obj);
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint32_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 4);
    return detail::LEToHost32(obj);
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint64_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 8);
    return detail::LEToHost64(obj);
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFF     -- 3 bytes (0xFD + 2 bytes little-endian)
//   size <= 0xFFFFFFFF -- 5 bytes (0xFE + 4 bytes little-endian)
//   size >  0xFFFFFFFF -- 9 bytes (0xFF + 8 bytes little-endian)

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        ser_writedata8(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        ser_writedata8(s, 0xFD);
        ser_writedata16(s, static_cast<uint16_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        ser_writedata8(s, 0xFE);
        ser_writedata32(s, static_cast<uint32_t>(size));
    } else {
        ser_writedata8(s, 0xFF);
        ser_writedata64(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ser_readdata8(s);
    uint64_t size = 0;

    if (marker < 253) {
        size = marker;
    } else if (marker == 253) {
        size = ser_readdata16(s);
        if (size < 253) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else if (marker == 254) {
        size = ser_readdata32(s);
        if (size < 0x10000) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else {
        size = ser_readdata64(s);
        if (size < 0x100000000ULL) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    }

    if (size > MAX_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return size;
}

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { ser_writedata8(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ser_readdata8(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { ser_writedata64(s, static_cast<uint64_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ser_readdata64(s)); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { ser_writedata8(s, a ? 1 : 0); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) { a = (ser_readdata8(s) != 0); }

// ============================================================================
// Serialize/Unserialize for Strings (CompactSize length prefix)
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

// ============================================================================
// Serialize/Unserialize for Fixed-Size Byte Arrays and Hashes
// ============================================================================

template<typename Stream, size_t N>
void Serialize(Stream& s, const std::array<uint8_t, N>& arr) {
    s.Write(arr.data(), N);
}

template<typename Stream, size_t N>
void Unserialize(Stream& s, std::array<uint8_t, N>& arr) {
    s.Read(arr.data(), N);
}

template<typename Stream, size_t BITS>
void Serialize(Stream& s, const BaseHash<BITS>& hash) {
    s.Write(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream, size_t BITS>
void Unserialize(Stream& s, BaseHash<BITS>& hash) {
    s.Read(hash.data(), BaseHash<BITS>::SIZE);
}

// ============================================================================
// Fixed-Width Fields
// ============================================================================

/// Write a 4-byte length followed by the string bytes, zero padded to maxLen
template<typename Stream>
void WriteBoundedString(Stream& s, const std::string& str, size_t maxLen) {
    if (str.size() > maxLen) {
        throw std::ios_base::failure("WriteBoundedString(): string exceeds bound");
    }
    ser_writedata32(s, static_cast<uint32_t>(str.size()));
    s.Write(str.data(), str.size());
    for (size_t i = str.size(); i < maxLen; ++i) {
        ser_writedata8(s, 0);
    }
}

template<typename Stream>
std::string ReadBoundedString(Stream& s, size_t maxLen) {
    uint32_t len = ser_readdata32(s);
    if (len > maxLen) {
        throw std::ios_base::failure("ReadBoundedString(): length exceeds bound");
    }
    std::string str(len, '\0');
    if (len > 0) {
        s.Read(&str[0], len);
    }
    s.Ignore(maxLen - len);
    return str;
}

/// Write a presence byte followed by the value; an absent value still
/// occupies its full width as zero bytes
template<typename Stream, typename T>
void WriteFixedOptional(Stream& s, const std::optional<T>& value, size_t width) {
    if (value) {
        ser_writedata8(s, 1);
        Serialize(s, *value);
    } else {
        ser_writedata8(s, 0);
        for (size_t i = 0; i < width; ++i) {
            ser_writedata8(s, 0);
        }
    }
}

template<typename T, typename Stream>
std::optional<T> ReadFixedOptional(Stream& s, size_t width) {
    uint8_t present = ser_readdata8(s);
    if (present > 1) {
        throw std::ios_base::failure("ReadFixedOptional(): bad presence byte");
    }
    if (present == 0) {
        s.Ignore(width);
        return std::nullopt;
    }
    T value;
    Unserialize(s, value);
    return value;
}

// ============================================================================
// DataStream Stream Operators Implementation
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace privdao

#endif // PRIVDAO_CORE_SERIALIZE_H

// BALLOT - Serialization Header
// Copyright (c) 2024 BALLOT Developers
// MIT License
//
// Serialization primitives used for the storage layout.
// Integers are little-endian, lengths use CompactSize encoding.

#ifndef BALLOT_CORE_SERIALIZE_H
#define BALLOT_CORE_SERIALIZE_H

#include "ballot/core/types.h"
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>
#include <string>
#include <array>
#include <optional>
#include <stdexcept>
#include <ios>

namespace ballot {

/// Maximum size for serialized objects to prevent memory exhaustion
static constexpr uint64_t MAX_SIZE = 0x02000000;  // 32 MB

// ============================================================================
// Endianness Helpers (Always Little-Endian for serialization)
// ============================================================================

namespace detail {

inline uint32_t ToLittleEndian32(uint32_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap32(host);
#else
    return host;
#endif
}

inline uint64_t ToLittleEndian64(uint64_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap64(host);
#else
    return host;
#endif
}

inline uint32_t FromLittleEndian32(uint32_t little) { return ToLittleEndian32(little); }
inline uint64_t FromLittleEndian64(uint64_t little) { return ToLittleEndian64(little); }

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
private:
    std::vector<uint8_t> data_;
    size_t read_pos_ = 0;

public:
    DataStream() = default;

    DataStream(const uint8_t* data, size_t len) : data_(data, data + len), read_pos_(0) {}

    /// Returns unread bytes remaining
    size_t size() const noexcept { return data_.size() - read_pos_; }

    bool empty() const noexcept { return size() == 0; }

    /// Get pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + read_pos_; }

    void Write(const uint8_t* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_t len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    void Read(uint8_t* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + read_pos_, len);
        read_pos_ += len;
    }

    void Read(char* dst, size_t len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
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
inline void ser_writedata32(Stream& s, uint32_t obj) {
    obj = detail::ToLittleEndian32(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    obj = detail::ToLittleEndian64(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint32_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 4);
    return detail::FromLittleEndian32(obj);
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint64_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 8);
    return detail::FromLittleEndian64(obj);
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFFFFFF -- 5 bytes (0xFE + 4 bytes little-endian)
//   size >  0xFFFFFFFF -- 9 bytes (0xFF + 8 bytes little-endian)
// The 0xFD two-byte form is not produced and rejected on read.

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        ser_writedata8(s, static_cast<uint8_t>(size));
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
    } else if (marker == 254) {
        size = ser_readdata32(s);
        if (size < 253) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else if (marker == 255) {
        size = ser_readdata64(s);
        if (size <= 0xFFFFFFFFULL) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else {
        throw std::ios_base::failure("unsupported ReadCompactSize() marker");
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
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { ser_writedata8(s, a ? 1 : 0); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) {
    uint8_t v = ser_readdata8(s);
    if (v > 1) {
        throw std::ios_base::failure("invalid boolean encoding");
    }
    a = (v != 0);
}

// ============================================================================
// Serialize/Unserialize for Strings
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
// Serialize/Unserialize for Fixed-Size Byte Arrays and Hash Types
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
// Serialize/Unserialize for Optional Values (1-byte presence flag)
// ============================================================================

template<typename Stream, typename T>
void Serialize(Stream& s, const std::optional<T>& opt) {
    Serialize(s, opt.has_value());
    if (opt) {
        Serialize(s, *opt);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::optional<T>& opt) {
    bool present = false;
    Unserialize(s, present);
    if (present) {
        T value;
        Unserialize(s, value);
        opt = std::move(value);
    } else {
        opt.reset();
    }
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

} // namespace ballot

#endif // BALLOT_CORE_SERIALIZE_H

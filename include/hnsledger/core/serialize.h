// HNSLEDGER - Serialization Header
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// Stream serialization primitives. Handshake consensus structures are
// little-endian with compact-size length prefixes; the device command
// payloads mix in big-endian fields (path indices, frame headers), so both
// byte orders are provided.

#ifndef HNSLEDGER_CORE_SERIALIZE_H
#define HNSLEDGER_CORE_SERIALIZE_H

#include "hnsledger/core/types.h"
#include "hnsledger/core/hex.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <string>
#include <vector>

namespace hnsledger {

// ============================================================================
// Constants
// ============================================================================

/// Upper bound for any compact-size prefixed length
static constexpr uint64_t MAX_SIZE = 0x02000000;  // 32 MB

// ============================================================================
// Endianness Helpers
// ============================================================================

// glibc's <endian.h> (pulled in by the standard headers) defines these
// names as macros, which would clash with the helpers below.
#undef htole16
#undef htole32
#undef htole64
#undef htobe16
#undef htobe32
#undef le16toh
#undef le32toh
#undef le64toh
#undef be16toh
#undef be32toh

namespace detail {

#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
inline uint16_t htole16(uint16_t v) { return __builtin_bswap16(v); }
inline uint32_t htole32(uint32_t v) { return __builtin_bswap32(v); }
inline uint64_t htole64(uint64_t v) { return __builtin_bswap64(v); }
inline uint16_t htobe16(uint16_t v) { return v; }
inline uint32_t htobe32(uint32_t v) { return v; }
#else
inline uint16_t htole16(uint16_t v) { return v; }
inline uint32_t htole32(uint32_t v) { return v; }
inline uint64_t htole64(uint64_t v) { return v; }
inline uint16_t htobe16(uint16_t v) { return __builtin_bswap16(v); }
inline uint32_t htobe32(uint32_t v) { return __builtin_bswap32(v); }
#endif

// Conversions are involutions
inline uint16_t le16toh(uint16_t v) { return htole16(v); }
inline uint32_t le32toh(uint32_t v) { return htole32(v); }
inline uint64_t le64toh(uint64_t v) { return htole64(v); }
inline uint16_t be16toh(uint16_t v) { return htobe16(v); }
inline uint32_t be32toh(uint32_t v) { return htobe32(v); }

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    using size_type = std::size_t;

    DataStream() = default;
    explicit DataStream(const std::vector<uint8_t>& data) : data_(data) {}
    explicit DataStream(std::vector<uint8_t>&& data) : data_(std::move(data)) {}
    DataStream(const uint8_t* data, size_type len) : data_(data, data + len) {}

    /// Unread bytes remaining
    size_type size() const noexcept { return data_.size() - read_pos_; }
    bool empty() const noexcept { return size() == 0; }

    /// Bytes consumed so far
    size_type ReadPos() const noexcept { return read_pos_; }

    void reserve(size_type n) { data_.reserve(read_pos_ + n); }

    void clear() {
        data_.clear();
        read_pos_ = 0;
    }

    /// Pointer to the unread tail
    const uint8_t* data() const noexcept { return data_.data() + read_pos_; }

    /// Whole buffer, including bytes already read
    const std::vector<uint8_t>& Data() const noexcept { return data_; }

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
        if (len > 0) {
            std::memcpy(dst, data_.data() + read_pos_, len);
        }
        read_pos_ += len;
    }

    void Read(char* dst, size_type len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    /// Read len bytes into a fresh buffer
    std::vector<uint8_t> ReadBytes(size_type len) {
        std::vector<uint8_t> out(len);
        Read(out.data(), len);
        return out;
    }

    void Ignore(size_type n) {
        if (n > size()) {
            throw std::ios_base::failure("DataStream::Ignore(): end of data");
        }
        read_pos_ += n;
    }

    void Rewind() { read_pos_ = 0; }

    std::string ToHex() const { return BytesToHex(data(), size()); }

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> data_;
    size_type read_pos_ = 0;
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
    obj = detail::htole16(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 2);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj) {
    obj = detail::htole32(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    obj = detail::htole64(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 8);
}

template<typename Stream>
inline void ser_writedata16be(Stream& s, uint16_t obj) {
    obj = detail::htobe16(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 2);
}

template<typename Stream>
inline void ser_writedata32be(Stream& s, uint32_t obj) {
    obj = detail::htobe32(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 4);
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
    return detail::le16toh(obj);
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint32_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 4);
    return detail::le32toh(obj);
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint64_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 8);
    return detail::le64toh(obj);
}

template<typename Stream>
inline uint16_t ser_readdata16be(Stream& s) {
    uint16_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 2);
    return detail::be16toh(obj);
}

template<typename Stream>
inline uint32_t ser_readdata32be(Stream& s) {
    uint32_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 4);
    return detail::be32toh(obj);
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFF     -- 0xFD + 2 bytes LE
//   size <= 0xFFFFFFFF -- 0xFE + 4 bytes LE
//   otherwise          -- 0xFF + 8 bytes LE

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
uint64_t ReadCompactSize(Stream& s, bool range_check = true) {
    uint8_t marker = ser_readdata8(s);
    uint64_t size = marker;
    uint64_t floor = 0;

    switch (marker) {
        case 0xFD: size = ser_readdata16(s); floor = 253; break;
        case 0xFE: size = ser_readdata32(s); floor = 0x10000; break;
        case 0xFF: size = ser_readdata64(s); floor = 0x100000000ULL; break;
        default: break;
    }

    if (size < floor) {
        throw std::ios_base::failure("non-canonical ReadCompactSize()");
    }
    if (range_check && size > MAX_SIZE) {
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
inline void Serialize(Stream& s, uint16_t a) { ser_writedata16(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint16_t& a) { a = ser_readdata16(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { ser_writedata64(s, static_cast<uint64_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ser_readdata64(s)); }

// Byte vectors are var-bytes: compact size then raw data
template<typename Stream>
void Serialize(Stream& s, const std::vector<uint8_t>& v) {
    WriteCompactSize(s, v.size());
    if (!v.empty()) {
        s.Write(v.data(), v.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::vector<uint8_t>& v) {
    uint64_t size = ReadCompactSize(s);
    v.resize(size);
    if (size > 0) {
        s.Read(v.data(), size);
    }
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
// GetSerializeSize
// ============================================================================

/// Stream that only counts bytes
class SizeComputer {
public:
    void Write(const uint8_t*, size_t len) { size_ += len; }
    void Write(const char*, size_t len) { size_ += len; }
    size_t size() const noexcept { return size_; }

private:
    size_t size_ = 0;
};

template<typename T>
size_t GetSerializeSize(const T& obj) {
    SizeComputer sc;
    Serialize(sc, obj);
    return sc.size();
}

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

} // namespace hnsledger

#endif // HNSLEDGER_CORE_SERIALIZE_H

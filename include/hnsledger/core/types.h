// HNSLEDGER - Core Types Header
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// Fundamental value types shared by the codec, the signing input model and
// the device protocol engine.

#ifndef HNSLEDGER_CORE_TYPES_H
#define HNSLEDGER_CORE_TYPES_H

#include "hnsledger/core/hex.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace hnsledger {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Owned byte buffer
using Bytes = std::vector<uint8_t>;

/// Amount in dollarydoos
using Amount = int64_t;

/// 1 HNS = 1,000,000 dollarydoos
constexpr Amount COIN = 1000000LL;

/// Hard supply cap used to sanity check coin values
constexpr Amount MAX_MONEY = 2040000000LL * COIN;

inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size hash. Handshake prints hashes in storage order, so hex
/// conversion never reverses bytes.
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    BaseHash() noexcept { data_.fill(0); }

    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Copies at most SIZE bytes, zero-filling the tail
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

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

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    Bytes ToBytes() const { return Bytes(data_.begin(), data_.end()); }

    std::string ToHex() const { return BytesToHex(data_.data(), SIZE); }

    /// Parse from hex. Throws std::invalid_argument on bad input or length.
    static BaseHash FromHex(const std::string& hex) {
        Bytes raw = HexToBytes(hex);
        if (raw.size() != SIZE) {
            throw std::invalid_argument("Hash hex has wrong length");
        }
        return BaseHash(raw.data(), raw.size());
    }

private:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (transaction ids, script hashes)
using Hash256 = BaseHash<256>;

/// 160-bit hash (public key hashes)
using Hash160 = BaseHash<160>;

/// Transaction id
using TxHash = Hash256;

// ============================================================================
// Utility Functions
// ============================================================================

/// Number of bytes WriteCompactSize emits for a value
inline size_t GetCompactSizeSize(uint64_t size) {
    if (size < 253) return 1;
    if (size <= 0xFFFF) return 3;
    if (size <= 0xFFFFFFFF) return 5;
    return 9;
}

} // namespace hnsledger

#endif // HNSLEDGER_CORE_TYPES_H

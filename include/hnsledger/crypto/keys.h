// HNSLEDGER - secp256k1 Public Keys
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// Public keys returned by the device. Point validation and compression go
// through OpenSSL's EC implementation; no private key ever exists host side.

#ifndef HNSLEDGER_CRYPTO_KEYS_H
#define HNSLEDGER_CRYPTO_KEYS_H

#include "hnsledger/core/types.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hnsledger {

namespace secp256k1 {
    /// 0x02/0x03 + X
    constexpr size_t COMPRESSED_PUBKEY_SIZE = 33;

    /// 0x04 + X + Y
    constexpr size_t UNCOMPRESSED_PUBKEY_SIZE = 65;
}

/**
 * A secp256k1 public key in SEC1 encoding.
 *
 * Construction only checks the length and prefix byte; IsValid() checks
 * that the point is actually on the curve.
 */
class PublicKey {
public:
    static constexpr size_t COMPRESSED_SIZE = secp256k1::COMPRESSED_PUBKEY_SIZE;
    static constexpr size_t MAX_SIZE = secp256k1::UNCOMPRESSED_PUBKEY_SIZE;

    PublicKey() : size_(0) { data_.fill(0); }

    explicit PublicKey(const uint8_t* data, size_t len);

    explicit PublicKey(const std::vector<uint8_t>& data)
        : PublicKey(data.data(), data.size()) {}

    /// Prefix and length are consistent
    bool IsFullyFormed() const { return size_ != 0; }

    /// On-curve check through OpenSSL
    bool IsValid() const;

    bool IsCompressed() const { return size_ == COMPRESSED_SIZE; }

    size_t size() const { return size_; }
    const uint8_t* data() const { return data_.data(); }

    std::vector<uint8_t> ToVector() const {
        return std::vector<uint8_t>(data_.begin(), data_.begin() + size_);
    }

    std::string ToHex() const;

    /// Compressed form of this key. Throws std::invalid_argument for a key
    /// that is not on the curve.
    PublicKey GetCompressed() const;

    /// BLAKE2b-160 of the compressed key
    Hash160 GetKeyHash() const;

    bool operator==(const PublicKey& other) const {
        return size_ == other.size_ &&
               std::equal(data_.begin(), data_.begin() + size_, other.data_.begin());
    }
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

private:
    std::array<uint8_t, MAX_SIZE> data_;
    size_t size_;
};

} // namespace hnsledger

#endif // HNSLEDGER_CRYPTO_KEYS_H

// HNSLEDGER - BLAKE2b Hash Function
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// BLAKE2b following RFC 7693, unkeyed, with a selectable digest length.
// Handshake hashes public keys with BLAKE2b-160.

#ifndef HNSLEDGER_CRYPTO_BLAKE2B_H
#define HNSLEDGER_CRYPTO_BLAKE2B_H

#include "hnsledger/core/types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hnsledger {

class Blake2b {
public:
    /// Largest digest in bytes
    static constexpr size_t OUTPUT_SIZE = 64;

    static constexpr size_t BLOCK_SIZE = 128;

    /// Throws std::invalid_argument unless 1 <= outlen <= 64
    explicit Blake2b(size_t outlen = OUTPUT_SIZE);

    Blake2b& Write(const Byte* data, size_t len);

    /// Writes GetOutputLength() bytes to out
    void Finalize(Byte* out);

    Blake2b& Reset();

    size_t GetOutputLength() const { return outlen_; }

private:
    uint64_t h_[8];
    uint64_t t_[2];
    Byte buffer_[BLOCK_SIZE];
    size_t buflen_;
    size_t outlen_;

    void Compress(const Byte block[BLOCK_SIZE], bool last);
};

Hash160 Blake2b160(const Byte* data, size_t len);

inline Hash160 Blake2b160(const std::vector<Byte>& data) {
    return Blake2b160(data.data(), data.size());
}

Hash256 Blake2b256(const Byte* data, size_t len);

inline Hash256 Blake2b256(const std::vector<Byte>& data) {
    return Blake2b256(data.data(), data.size());
}

} // namespace hnsledger

#endif // HNSLEDGER_CRYPTO_BLAKE2B_H

// HNSLEDGER - BLAKE2b Implementation
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/crypto/blake2b.h"

#include <cstring>
#include <stdexcept>

namespace hnsledger {

namespace {

constexpr uint64_t IV[8] = {
    0x6a09e667f3bcc908ULL, 0xbb67ae8584caa73bULL,
    0x3c6ef372fe94f82bULL, 0xa54ff53a5f1d36f1ULL,
    0x510e527fade682d1ULL, 0x9b05688c2b3e6c1fULL,
    0x1f83d9abfb41bd6bULL, 0x5be0cd19137e2179ULL,
};

constexpr uint8_t SIGMA[12][16] = {
    { 0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14, 15},
    {14, 10,  4,  8,  9, 15, 13,  6,  1, 12,  0,  2, 11,  7,  5,  3},
    {11,  8, 12,  0,  5,  2, 15, 13, 10, 14,  3,  6,  7,  1,  9,  4},
    { 7,  9,  3,  1, 13, 12, 11, 14,  2,  6,  5, 10,  4,  0, 15,  8},
    { 9,  0,  5,  7,  2,  4, 10, 15, 14,  1, 11, 12,  6,  8,  3, 13},
    { 2, 12,  6, 10,  0, 11,  8,  3,  4, 13,  7,  5, 15, 14,  1,  9},
    {12,  5,  1, 15, 14, 13,  4, 10,  0,  7,  6,  3,  9,  2,  8, 11},
    {13, 11,  7, 14, 12,  1,  3,  9,  5,  0, 15,  4,  8,  6,  2, 10},
    { 6, 15, 14,  9, 11,  3,  0,  8, 12,  2, 13,  7,  1,  4, 10,  5},
    {10,  2,  8,  4,  7,  6,  1,  5, 15, 11,  9, 14,  3, 12, 13,  0},
    { 0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14, 15},
    {14, 10,  4,  8,  9, 15, 13,  6,  1, 12,  0,  2, 11,  7,  5,  3},
};

inline uint64_t Rotr64(uint64_t x, int n) {
    return (x >> n) | (x << (64 - n));
}

inline uint64_t ReadLE64(const Byte* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

inline void G(uint64_t* v, int a, int b, int c, int d, uint64_t x, uint64_t y) {
    v[a] = v[a] + v[b] + x;
    v[d] = Rotr64(v[d] ^ v[a], 32);
    v[c] = v[c] + v[d];
    v[b] = Rotr64(v[b] ^ v[c], 24);
    v[a] = v[a] + v[b] + y;
    v[d] = Rotr64(v[d] ^ v[a], 16);
    v[c] = v[c] + v[d];
    v[b] = Rotr64(v[b] ^ v[c], 63);
}

} // namespace

Blake2b::Blake2b(size_t outlen) : outlen_(outlen) {
    if (outlen == 0 || outlen > OUTPUT_SIZE) {
        throw std::invalid_argument("Blake2b: digest length must be 1-64 bytes");
    }
    Reset();
}

Blake2b& Blake2b::Reset() {
    std::memcpy(h_, IV, sizeof(h_));
    // Parameter block: digest length, no key, fanout 1, depth 1
    h_[0] ^= 0x01010000ULL ^ static_cast<uint64_t>(outlen_);
    t_[0] = t_[1] = 0;
    buflen_ = 0;
    std::memset(buffer_, 0, sizeof(buffer_));
    return *this;
}

void Blake2b::Compress(const Byte block[BLOCK_SIZE], bool last) {
    uint64_t m[16];
    uint64_t v[16];

    for (int i = 0; i < 16; ++i) {
        m[i] = ReadLE64(block + 8 * i);
    }
    for (int i = 0; i < 8; ++i) {
        v[i] = h_[i];
        v[i + 8] = IV[i];
    }
    v[12] ^= t_[0];
    v[13] ^= t_[1];
    if (last) {
        v[14] = ~v[14];
    }

    for (int r = 0; r < 12; ++r) {
        const uint8_t* s = SIGMA[r];
        G(v, 0, 4,  8, 12, m[s[0]],  m[s[1]]);
        G(v, 1, 5,  9, 13, m[s[2]],  m[s[3]]);
        G(v, 2, 6, 10, 14, m[s[4]],  m[s[5]]);
        G(v, 3, 7, 11, 15, m[s[6]],  m[s[7]]);
        G(v, 0, 5, 10, 15, m[s[8]],  m[s[9]]);
        G(v, 1, 6, 11, 12, m[s[10]], m[s[11]]);
        G(v, 2, 7,  8, 13, m[s[12]], m[s[13]]);
        G(v, 3, 4,  9, 14, m[s[14]], m[s[15]]);
    }

    for (int i = 0; i < 8; ++i) {
        h_[i] ^= v[i] ^ v[i + 8];
    }
}

Blake2b& Blake2b::Write(const Byte* data, size_t len) {
    while (len > 0) {
        // The final block is only compressed by Finalize()
        if (buflen_ == BLOCK_SIZE) {
            t_[0] += BLOCK_SIZE;
            if (t_[0] < BLOCK_SIZE) {
                ++t_[1];
            }
            Compress(buffer_, false);
            buflen_ = 0;
        }

        size_t take = BLOCK_SIZE - buflen_;
        if (take > len) {
            take = len;
        }
        std::memcpy(buffer_ + buflen_, data, take);
        buflen_ += take;
        data += take;
        len -= take;
    }
    return *this;
}

void Blake2b::Finalize(Byte* out) {
    t_[0] += buflen_;
    if (t_[0] < buflen_) {
        ++t_[1];
    }
    std::memset(buffer_ + buflen_, 0, BLOCK_SIZE - buflen_);
    Compress(buffer_, true);

    for (size_t i = 0; i < outlen_; ++i) {
        out[i] = static_cast<Byte>(h_[i / 8] >> (8 * (i % 8)));
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash160 Blake2b160(const Byte* data, size_t len) {
    Byte out[Hash160::SIZE];
    Blake2b(Hash160::SIZE).Write(data, len).Finalize(out);
    return Hash160(out, sizeof(out));
}

Hash256 Blake2b256(const Byte* data, size_t len) {
    Byte out[Hash256::SIZE];
    Blake2b(Hash256::SIZE).Write(data, len).Finalize(out);
    return Hash256(out, sizeof(out));
}

} // namespace hnsledger

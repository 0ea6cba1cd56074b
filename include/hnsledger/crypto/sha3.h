// HNSLEDGER - SHA3-256
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// FIPS 202 SHA3-256 backed by OpenSSL EVP. Used for script-hash addresses.

#ifndef HNSLEDGER_CRYPTO_SHA3_H
#define HNSLEDGER_CRYPTO_SHA3_H

#include "hnsledger/core/types.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace hnsledger {

class SHA3_256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Throws std::runtime_error if the digest cannot be initialized
    SHA3_256();
    ~SHA3_256();

    SHA3_256(const SHA3_256&) = delete;
    SHA3_256& operator=(const SHA3_256&) = delete;

    SHA3_256& Write(const Byte* data, size_t len);

    void Finalize(Byte hash[OUTPUT_SIZE]);

    SHA3_256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

Hash256 SHA3_256Hash(const Byte* data, size_t len);

inline Hash256 SHA3_256Hash(const std::vector<Byte>& data) {
    return SHA3_256Hash(data.data(), data.size());
}

} // namespace hnsledger

#endif // HNSLEDGER_CRYPTO_SHA3_H

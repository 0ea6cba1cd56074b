// HNSLEDGER - SHA3-256 Implementation
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/crypto/sha3.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace hnsledger {

struct SHA3_256::Impl {
    EVP_MD_CTX* ctx{nullptr};

    Impl() : ctx(EVP_MD_CTX_new()) {}
    ~Impl() { EVP_MD_CTX_free(ctx); }
};

SHA3_256::SHA3_256() : impl_(std::make_unique<Impl>()) {
    if (!impl_->ctx) {
        throw std::runtime_error("SHA3_256: cannot allocate digest context");
    }
    Reset();
}

SHA3_256::~SHA3_256() = default;

SHA3_256& SHA3_256::Reset() {
    if (EVP_DigestInit_ex(impl_->ctx, EVP_sha3_256(), nullptr) != 1) {
        throw std::runtime_error("SHA3_256: EVP_DigestInit_ex failed");
    }
    return *this;
}

SHA3_256& SHA3_256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("SHA3_256: EVP_DigestUpdate failed");
    }
    return *this;
}

void SHA3_256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int outlen = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, hash, &outlen) != 1 || outlen != OUTPUT_SIZE) {
        throw std::runtime_error("SHA3_256: EVP_DigestFinal_ex failed");
    }
}

Hash256 SHA3_256Hash(const Byte* data, size_t len) {
    Byte out[SHA3_256::OUTPUT_SIZE];
    SHA3_256().Write(data, len).Finalize(out);
    return Hash256(out, sizeof(out));
}

} // namespace hnsledger

// HNSLEDGER - secp256k1 Public Key Implementation
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/crypto/keys.h"
#include "hnsledger/crypto/blake2b.h"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <stdexcept>

namespace hnsledger {

namespace {

struct GroupDeleter {
    void operator()(EC_GROUP* g) const { EC_GROUP_free(g); }
};
struct PointDeleter {
    void operator()(EC_POINT* p) const { EC_POINT_free(p); }
};
struct CtxDeleter {
    void operator()(BN_CTX* c) const { BN_CTX_free(c); }
};

using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
using CtxPtr = std::unique_ptr<BN_CTX, CtxDeleter>;

/// Parsed point plus the objects it depends on
struct ParsedPoint {
    GroupPtr group;
    CtxPtr ctx;
    PointPtr point;
};

bool ParsePoint(const uint8_t* data, size_t len, ParsedPoint& out) {
    out.group.reset(EC_GROUP_new_by_curve_name(NID_secp256k1));
    out.ctx.reset(BN_CTX_new());
    if (!out.group || !out.ctx) {
        throw std::runtime_error("secp256k1: OpenSSL allocation failed");
    }
    out.point.reset(EC_POINT_new(out.group.get()));
    if (!out.point) {
        throw std::runtime_error("secp256k1: OpenSSL allocation failed");
    }

    if (EC_POINT_oct2point(out.group.get(), out.point.get(), data, len,
                           out.ctx.get()) != 1) {
        return false;
    }
    return EC_POINT_is_on_curve(out.group.get(), out.point.get(), out.ctx.get()) == 1 &&
           EC_POINT_is_at_infinity(out.group.get(), out.point.get()) == 0;
}

} // namespace

PublicKey::PublicKey(const uint8_t* data, size_t len) : size_(0) {
    data_.fill(0);
    if (!data || len == 0) {
        return;
    }

    bool shape = (len == COMPRESSED_SIZE && (data[0] == 0x02 || data[0] == 0x03)) ||
                 (len == MAX_SIZE && data[0] == 0x04);
    if (shape) {
        std::memcpy(data_.data(), data, len);
        size_ = len;
    }
}

bool PublicKey::IsValid() const {
    if (!IsFullyFormed()) {
        return false;
    }
    ParsedPoint parsed;
    return ParsePoint(data_.data(), size_, parsed);
}

std::string PublicKey::ToHex() const {
    return BytesToHex(data_.data(), size_);
}

PublicKey PublicKey::GetCompressed() const {
    if (IsCompressed()) {
        return *this;
    }

    ParsedPoint parsed;
    if (!IsFullyFormed() || !ParsePoint(data_.data(), size_, parsed)) {
        throw std::invalid_argument("Public key is not a valid secp256k1 point");
    }

    uint8_t out[COMPRESSED_SIZE];
    size_t written = EC_POINT_point2oct(parsed.group.get(), parsed.point.get(),
                                        POINT_CONVERSION_COMPRESSED,
                                        out, sizeof(out), parsed.ctx.get());
    if (written != COMPRESSED_SIZE) {
        throw std::runtime_error("secp256k1: point compression failed");
    }
    return PublicKey(out, written);
}

Hash160 PublicKey::GetKeyHash() const {
    PublicKey compressed = GetCompressed();
    return Blake2b160(compressed.data(), compressed.size());
}

} // namespace hnsledger

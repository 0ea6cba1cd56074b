// HNSLEDGER - Signing Input
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/ledger/input.h"

#include "hnsledger/ledger/apdu.h"
#include "hnsledger/ledger/error.h"

namespace hnsledger {
namespace ledger {

namespace {

void RequireWellFormed(const PublicKey& publicKey) {
    if (!publicKey.IsFullyFormed()) {
        throw UsageError("Public key is malformed");
    }
}

} // namespace

LedgerInput::LedgerInput(Options options)
    : path_(std::move(options.path)),
      coin_(std::move(options.coin)),
      redeem_(std::move(options.redeem)),
      script_(std::move(options.script)),
      publicKey_(std::move(options.publicKey)),
      sighashType_(options.sighashType),
      network_(options.network) {
    CheckPathDepth(path_);

    if (sighashType_ != SIGHASH_ALL) {
        throw UsageError("Device only supports SIGHASH_ALL");
    }

    if (coin_.address.IsScriptHash() && !redeem_) {
        throw UsageError("Cannot sign a script-hash coin without a redeem script");
    }

    if (publicKey_) {
        RequireWellFormed(*publicKey_);
    }
}

void LedgerInput::SetPublicKey(const PublicKey& publicKey) {
    RequireWellFormed(publicKey);
    publicKey_ = publicKey;
}

const KeyRing& LedgerInput::GetRing() const {
    if (!publicKey_) {
        throw UsageError("Cannot return ring without public key");
    }

    if (!cache_.ring) {
        try {
            cache_.ring.emplace(*publicKey_, network_);
        } catch (const std::invalid_argument& e) {
            throw UsageError(std::string("Invalid public key: ") + e.what());
        }
        if (redeem_) {
            cache_.ring->SetScript(*redeem_);
        }
    }
    return *cache_.ring;
}

const Script& LedgerInput::GetPrev() const {
    if (!cache_.prev) {
        if (script_) {
            cache_.prev = *script_;
        } else {
            cache_.prev = GetRing().GetPayToPubkeyHash();
        }
    }
    return *cache_.prev;
}

const Script& LedgerInput::GetPrevRedeem() const {
    if (!cache_.prevRedeem) {
        if (coin_.address.IsScriptHash()) {
            cache_.prevRedeem = *redeem_;
        } else {
            cache_.prevRedeem = GetPrev();
        }
    }
    return *cache_.prevRedeem;
}

const Outpoint& LedgerInput::GetOutpoint() const {
    if (!cache_.outpoint) {
        cache_.outpoint = coin_.GetOutpoint();
    }
    return *cache_.outpoint;
}

const std::string& LedgerInput::ToKey() const {
    if (!cache_.key) {
        cache_.key = GetOutpoint().ToKey();
    }
    return *cache_.key;
}

void LedgerInput::Refresh() {
    cache_ = DerivedCache();
}

} // namespace ledger
} // namespace hnsledger

// HNSLEDGER - Key Ring Implementation
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/wallet/keyring.h"
#include "hnsledger/crypto/sha3.h"

#include <stdexcept>

namespace hnsledger {

namespace {

const PublicKey& RequireValid(const PublicKey& key) {
    if (!key.IsValid()) {
        throw std::invalid_argument("KeyRing: public key is not a valid secp256k1 point");
    }
    return key;
}

} // namespace

KeyRing::KeyRing(const PublicKey& publicKey, NetworkType network)
    : publicKey_(RequireValid(publicKey).GetCompressed())
    , network_(network)
    , keyHash_(publicKey_.GetKeyHash()) {}

Hash256 KeyRing::GetScriptHash() const {
    if (!HasScript()) {
        throw std::logic_error("KeyRing has no redeem script");
    }
    return SHA3_256Hash(script_.data(), script_.size());
}

Address KeyRing::GetAddress() const {
    if (HasScript()) {
        return Address::FromScriptHash(GetScriptHash());
    }
    return Address::FromPubkeyHash(keyHash_);
}

Script KeyRing::GetPayToPubkeyHash() const {
    return Script::CreatePayToPubkeyHash(keyHash_);
}

int KeyRing::GetMultisigIndex() const {
    MultisigInfo info;
    if (!script_.ExtractMultisig(info)) {
        return -1;
    }
    const std::vector<uint8_t> key = publicKey_.ToVector();
    for (size_t i = 0; i < info.keys.size(); ++i) {
        if (info.keys[i] == key) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace hnsledger

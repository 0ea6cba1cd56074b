// HNSLEDGER - Key Ring
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// A public key plus an optional redeem script, the minimum needed to derive
// the previous output script and the address a signing input spends from.

#ifndef HNSLEDGER_WALLET_KEYRING_H
#define HNSLEDGER_WALLET_KEYRING_H

#include "hnsledger/core/address.h"
#include "hnsledger/core/script.h"
#include "hnsledger/crypto/keys.h"

namespace hnsledger {

class KeyRing {
public:
    /// Throws std::invalid_argument for a key that is not on the curve
    explicit KeyRing(const PublicKey& publicKey,
                     NetworkType network = NetworkType::Main);

    const PublicKey& GetPublicKey() const { return publicKey_; }
    NetworkType GetNetwork() const { return network_; }

    /// Attach a redeem script; an empty script detaches it
    void SetScript(const Script& script) { script_ = script; }
    const Script& GetScript() const { return script_; }
    bool HasScript() const { return !script_.empty(); }

    /// BLAKE2b-160 of the compressed public key
    const Hash160& GetKeyHash() const { return keyHash_; }

    /// SHA3-256 of the redeem script. Throws std::logic_error without one.
    Hash256 GetScriptHash() const;

    /// Script-hash address when a redeem script is set, else pubkey-hash
    Address GetAddress() const;

    /// Pay-to-pubkey-hash script for the key hash
    Script GetPayToPubkeyHash() const;

    /// Slot of this key in a multisig redeem script, or -1
    int GetMultisigIndex() const;

private:
    PublicKey publicKey_;
    NetworkType network_;
    Hash160 keyHash_;
    Script script_;
};

} // namespace hnsledger

#endif // HNSLEDGER_WALLET_KEYRING_H

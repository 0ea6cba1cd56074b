// HNSLEDGER - Signing Input
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#ifndef HNSLEDGER_LEDGER_INPUT_H
#define HNSLEDGER_LEDGER_INPUT_H

#include "hnsledger/core/script.h"
#include "hnsledger/core/transaction.h"
#include "hnsledger/crypto/keys.h"
#include "hnsledger/wallet/keyring.h"
#include "hnsledger/wallet/path.h"

#include <optional>
#include <string>

namespace hnsledger {
namespace ledger {

/**
 * Everything the device needs to sign one transaction input: the derivation
 * path of the signing key, the coin being spent and, for script-hash coins,
 * the redeem script.
 *
 * Derived values (key ring, previous script, outpoint) are computed on first
 * use and kept until Refresh(). Setters never clear them.
 */
class LedgerInput {
public:
    struct Options {
        DerivationPath path;
        Coin coin;
        /// Required when the coin pays to a script hash
        std::optional<Script> redeem;
        /// Previous output script; defaults to pay-to-pubkey-hash of the key
        std::optional<Script> script;
        std::optional<PublicKey> publicKey;
        uint32_t sighashType{SIGHASH_ALL};
        NetworkType network{NetworkType::Main};
    };

    /**
     * @throws UsageError if the path is too deep, the sighash type is not
     *         ALL, a script-hash coin has no redeem script, or the public
     *         key is malformed
     */
    explicit LedgerInput(Options options);

    const DerivationPath& GetPath() const { return path_; }
    const Coin& GetCoin() const { return coin_; }
    const std::optional<Script>& GetRedeem() const { return redeem_; }
    const std::optional<Script>& GetScript() const { return script_; }
    const std::optional<PublicKey>& GetPublicKey() const { return publicKey_; }
    uint32_t GetSighashType() const { return sighashType_; }
    NetworkType GetNetwork() const { return network_; }

    bool HasPublicKey() const { return publicKey_.has_value(); }

    void SetPublicKey(const PublicKey& publicKey);
    void SetRedeem(const Script& redeem) { redeem_ = redeem; }
    void SetScript(const Script& script) { script_ = script; }

    /// Throws UsageError without a public key
    const KeyRing& GetRing() const;

    /// Script of the output being spent
    const Script& GetPrev() const;

    /// Script the device hashes: the redeem script for script-hash coins
    const Script& GetPrevRedeem() const;

    const Outpoint& GetOutpoint() const;

    /// Outpoint key of the coin
    const std::string& ToKey() const;

    /// Drop every derived value
    void Refresh();

private:
    struct DerivedCache {
        std::optional<KeyRing> ring;
        std::optional<Script> prev;
        std::optional<Script> prevRedeem;
        std::optional<Outpoint> outpoint;
        std::optional<std::string> key;
    };

    DerivationPath path_;
    Coin coin_;
    std::optional<Script> redeem_;
    std::optional<Script> script_;
    std::optional<PublicKey> publicKey_;
    uint32_t sighashType_;
    NetworkType network_;

    mutable DerivedCache cache_;
};

} // namespace ledger
} // namespace hnsledger

#endif // HNSLEDGER_LEDGER_INPUT_H

// HNSLEDGER - Hardware Signer
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// Caller-facing signer: queries the device, checks its app version against
// the wire contract, and fills in input witnesses from device signatures.

#ifndef HNSLEDGER_LEDGER_LEDGER_H
#define HNSLEDGER_LEDGER_LEDGER_H

#include "hnsledger/core/transaction.h"
#include "hnsledger/ledger/client.h"
#include "hnsledger/ledger/input.h"
#include "hnsledger/ledger/transport.h"

#include <optional>
#include <string>
#include <vector>

namespace hnsledger {
namespace ledger {

class LedgerHSD {
public:
    explicit LedgerHSD(Transport& transport, NetworkType network = NetworkType::Main);

    std::string GetAppVersion();

    PublicKeyResult GetPublicKey(const DerivationPath& path,
                                 PublicKeyOptions options = PublicKeyOptions());

    /**
     * Bech32 address for a path as derived by the device.
     *
     * @param confirm Show the address on screen and wait for approval
     */
    std::string GetAddress(const DerivationPath& path, bool confirm = false);

    /**
     * Sign every input in `inputs` and write the witnesses into `mtx`.
     *
     * Each signing input must spend exactly one input of the transaction.
     * All local checks run before the first exchange.
     *
     * @throws UsageError on a mismatched input, a missing public key or an
     *         app version the wire contract does not cover
     */
    void SignTransaction(MutableTransaction& mtx, const std::vector<LedgerInput>& inputs);

    /// Place one signature in an input witness according to the coin type
    static void ApplySignature(Input& input, const LedgerInput& signer,
                               const std::vector<uint8_t>& signature);

    /// Version reported by the last version query
    const std::optional<AppVersion>& GetCachedVersion() const { return version_; }

    LedgerClient& GetClient() { return client_; }

private:
    /// Local checks for one signing input; returns its transaction input index
    static size_t ValidateInput(const MutableTransaction& mtx, const LedgerInput& input);

    /// Query the version and select the wire contract
    const WireContract& NegotiateContract();

    LedgerClient client_;
    std::optional<AppVersion> version_;
};

} // namespace ledger
} // namespace hnsledger

#endif // HNSLEDGER_LEDGER_LEDGER_H

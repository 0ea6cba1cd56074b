// HNSLEDGER - Hardware Signer
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/ledger/ledger.h"

#include "hnsledger/ledger/error.h"
#include "hnsledger/util/logging.h"

#include <map>

namespace hnsledger {
namespace ledger {

LedgerHSD::LedgerHSD(Transport& transport, NetworkType network)
    : client_(transport, network) {}

std::string LedgerHSD::GetAppVersion() {
    std::string version = client_.GetAppVersion();
    version_ = AppVersion::FromString(version);
    return version;
}

PublicKeyResult LedgerHSD::GetPublicKey(const DerivationPath& path,
                                        PublicKeyOptions options) {
    return client_.GetPublicKey(path, options);
}

std::string LedgerHSD::GetAddress(const DerivationPath& path, bool confirm) {
    PublicKeyOptions options;
    options.confirm = confirm;
    options.address = true;

    PublicKeyResult result = client_.GetPublicKey(path, options);
    if (!result.address) {
        throw ProtocolError("Device did not return an address");
    }
    return *result.address;
}

const WireContract& LedgerHSD::NegotiateContract() {
    GetAppVersion();
    const WireContract& contract = WireContract::ForVersion(*version_);
    client_.SetContract(contract);
    return contract;
}

// ============================================================================
// Transaction Signing
// ============================================================================

size_t LedgerHSD::ValidateInput(const MutableTransaction& mtx, const LedgerInput& input) {
    const Outpoint& prevout = input.GetOutpoint();

    int index = -1;
    for (size_t i = 0; i < mtx.inputs.size(); ++i) {
        if (mtx.inputs[i].prevout != prevout) {
            continue;
        }
        if (index >= 0) {
            throw UsageError("Coin " + prevout.ToString() +
                             " is spent by more than one transaction input");
        }
        index = static_cast<int>(i);
    }
    if (index < 0) {
        throw UsageError("Coin " + prevout.ToString() +
                         " is not spent by the transaction");
    }

    // Resolves the script the device hashes; throws without a public key
    // unless an explicit script was given.
    input.GetPrevRedeem();

    const Address& address = input.GetCoin().address;
    if (address.IsPubkeyHash()) {
        if (!input.HasPublicKey()) {
            throw UsageError("Signing a pubkey-hash coin requires the public key");
        }
    } else if (address.IsScriptHash() && input.GetRedeem()->IsMultisig()) {
        if (!input.HasPublicKey()) {
            throw UsageError("Signing a multisig coin requires the public key");
        }
        if (input.GetRing().GetMultisigIndex() < 0) {
            throw UsageError("Public key is not part of the multisig redeem script");
        }
    }

    return static_cast<size_t>(index);
}

void LedgerHSD::SignTransaction(MutableTransaction& mtx,
                                const std::vector<LedgerInput>& inputs) {
    if (inputs.empty()) {
        throw UsageError("No inputs to sign");
    }

    std::map<size_t, const LedgerInput*> byIndex;
    for (const auto& input : inputs) {
        size_t index = ValidateInput(mtx, input);
        if (!byIndex.emplace(index, &input).second) {
            throw UsageError("Coin " + input.GetOutpoint().ToString() +
                             " is listed more than once");
        }
    }

    const WireContract& contract = NegotiateContract();
    for (const auto& input : inputs) {
        if (!contract.AllowsSighash(input.GetSighashType())) {
            throw UsageError("Device app " + version_->ToString() +
                             " does not support sighash type " +
                             std::to_string(input.GetSighashType()));
        }
    }

    LOG_INFO(util::LogCategory::LEDGER)
        << "Signing " << byIndex.size() << " of " << mtx.inputs.size()
        << " input(s) with app " << version_->ToString();

    client_.StreamTransaction(mtx);

    for (const auto& entry : byIndex) {
        Input& txInput = mtx.inputs[entry.first];
        std::vector<uint8_t> signature = client_.GetInputSignature(*entry.second, txInput);
        ApplySignature(txInput, *entry.second, signature);
    }
}

void LedgerHSD::ApplySignature(Input& input, const LedgerInput& signer,
                               const std::vector<uint8_t>& signature) {
    const Address& address = signer.GetCoin().address;

    if (address.IsPubkeyHash()) {
        input.witness = {signature, signer.GetRing().GetPublicKey().ToVector()};
        return;
    }

    if (!address.IsScriptHash()) {
        throw UsageError("Cannot build a witness for address version " +
                         std::to_string(address.GetVersion()));
    }

    const Script& redeem = *signer.GetRedeem();
    std::vector<uint8_t> redeemBytes(redeem.begin(), redeem.end());

    MultisigInfo info;
    if (!redeem.ExtractMultisig(info)) {
        input.witness = {signature, redeemBytes};
        return;
    }

    int slot = signer.GetRing().GetMultisigIndex();
    if (slot < 0) {
        throw UsageError("Public key is not part of the multisig redeem script");
    }

    // [empty, one slot per key, redeem]; keep signatures already present.
    size_t stackSize = info.keys.size() + 2;
    bool reuse = input.witness.size() == stackSize && input.witness.back() == redeemBytes;
    if (!reuse) {
        input.witness.assign(stackSize, std::vector<uint8_t>());
        input.witness.back() = redeemBytes;
    }
    input.witness[1 + static_cast<size_t>(slot)] = signature;
}

} // namespace ledger
} // namespace hnsledger

// HNSLEDGER - BIP32 Derivation Paths
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#ifndef HNSLEDGER_WALLET_PATH_H
#define HNSLEDGER_WALLET_PATH_H

#include "hnsledger/core/address.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hnsledger {

/// Hardened derivation flag
constexpr uint32_t HARDENED_FLAG = 0x80000000;

/// BIP44 purpose
constexpr uint32_t BIP44_PURPOSE = 44;

/**
 * An ordered list of BIP32 child indices, hardened indices carrying
 * HARDENED_FLAG.
 *
 * Example paths:
 * - m/44'/5353'/0'/0/0  (first receiving address, mainnet)
 * - m/44'/5355'/0'/1/3  (fourth change address, regtest)
 */
class DerivationPath {
public:
    DerivationPath() = default;

    explicit DerivationPath(std::vector<uint32_t> indices)
        : indices_(std::move(indices)) {}

    /// Parse "m/44'/5353'/0'/0/0". Hardened markers are ' or h.
    static std::optional<DerivationPath> FromString(const std::string& path);

    /// m/44'/coin'/account'/change/index
    static DerivationPath BIP44(NetworkType network, uint32_t account,
                                uint32_t change, uint32_t index);

    /// m/44'/coin'/account'
    static DerivationPath BIP44Account(NetworkType network, uint32_t account);

    const std::vector<uint32_t>& GetIndices() const { return indices_; }

    size_t Depth() const { return indices_.size(); }

    bool IsEmpty() const { return indices_.empty(); }

    DerivationPath Child(uint32_t index, bool hardened = false) const;

    std::string ToString() const;

    bool operator==(const DerivationPath& other) const { return indices_ == other.indices_; }
    bool operator!=(const DerivationPath& other) const { return !(*this == other); }

private:
    std::vector<uint32_t> indices_;
};

} // namespace hnsledger

#endif // HNSLEDGER_WALLET_PATH_H

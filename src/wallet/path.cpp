// HNSLEDGER - BIP32 Derivation Path Implementation
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/wallet/path.h"

#include <cctype>
#include <sstream>

namespace hnsledger {

namespace {

std::optional<uint32_t> ParseComponent(std::string token) {
    bool hardened = false;
    if (!token.empty() && (token.back() == '\'' || token.back() == 'h' ||
                           token.back() == 'H')) {
        hardened = true;
        token.pop_back();
    }
    if (token.empty() || token.size() > 10) {
        return std::nullopt;
    }

    uint64_t value = 0;
    for (char c : token) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value >= HARDENED_FLAG) {
        return std::nullopt;
    }

    uint32_t index = static_cast<uint32_t>(value);
    return hardened ? (index | HARDENED_FLAG) : index;
}

} // namespace

std::optional<DerivationPath> DerivationPath::FromString(const std::string& path) {
    std::string p = path;
    if (p.empty() || (p[0] != 'm' && p[0] != 'M')) {
        return std::nullopt;
    }
    p.erase(0, 1);

    std::vector<uint32_t> indices;
    if (p.empty()) {
        return DerivationPath();
    }
    if (p[0] != '/') {
        return std::nullopt;
    }

    std::istringstream stream(p.substr(1));
    std::string token;
    while (std::getline(stream, token, '/')) {
        auto index = ParseComponent(token);
        if (!index) {
            return std::nullopt;
        }
        indices.push_back(*index);
    }
    // A trailing slash leaves an empty last component
    if (!p.empty() && p.back() == '/') {
        return std::nullopt;
    }

    return DerivationPath(std::move(indices));
}

DerivationPath DerivationPath::BIP44(NetworkType network, uint32_t account,
                                     uint32_t change, uint32_t index) {
    return BIP44Account(network, account).Child(change).Child(index);
}

DerivationPath DerivationPath::BIP44Account(NetworkType network, uint32_t account) {
    return DerivationPath({
        BIP44_PURPOSE | HARDENED_FLAG,
        GetCoinType(network) | HARDENED_FLAG,
        account | HARDENED_FLAG,
    });
}

DerivationPath DerivationPath::Child(uint32_t index, bool hardened) const {
    std::vector<uint32_t> next = indices_;
    next.push_back(hardened ? (index | HARDENED_FLAG) : index);
    return DerivationPath(std::move(next));
}

std::string DerivationPath::ToString() const {
    std::string result = "m";
    for (uint32_t index : indices_) {
        result += "/" + std::to_string(index & ~HARDENED_FLAG);
        if (index & HARDENED_FLAG) {
            result += "'";
        }
    }
    return result;
}

} // namespace hnsledger

// HNSLEDGER - Address Implementation
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/core/address.h"
#include "hnsledger/crypto/sha3.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace hnsledger {

// ============================================================================
// Networks
// ============================================================================

const char* NetworkToString(NetworkType network) {
    switch (network) {
        case NetworkType::Main:    return "main";
        case NetworkType::Testnet: return "testnet";
        case NetworkType::Regtest: return "regtest";
        case NetworkType::Simnet:  return "simnet";
    }
    return "unknown";
}

NetworkType NetworkFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "main" || lower == "mainnet") return NetworkType::Main;
    if (lower == "testnet") return NetworkType::Testnet;
    if (lower == "regtest") return NetworkType::Regtest;
    if (lower == "simnet") return NetworkType::Simnet;

    throw std::invalid_argument("Unknown network: " + name);
}

const char* GetBech32Hrp(NetworkType network) {
    switch (network) {
        case NetworkType::Main:    return "hs";
        case NetworkType::Testnet: return "ts";
        case NetworkType::Regtest: return "rs";
        case NetworkType::Simnet:  return "ss";
    }
    return "hs";
}

uint32_t GetCoinType(NetworkType network) {
    return 5353 + static_cast<uint32_t>(network);
}

// ============================================================================
// Bech32
// ============================================================================

namespace {

constexpr char kCharset[] = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

int8_t CharsetRev(char c) {
    const char* p = std::find(kCharset, kCharset + 32, c);
    return p == kCharset + 32 ? -1 : static_cast<int8_t>(p - kCharset);
}

uint32_t Polymod(const std::vector<uint8_t>& values) {
    static const uint32_t kGen[5] = {
        0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3
    };
    uint32_t chk = 1;
    for (uint8_t v : values) {
        uint32_t top = chk >> 25;
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        for (int i = 0; i < 5; ++i) {
            if ((top >> i) & 1) chk ^= kGen[i];
        }
    }
    return chk;
}

std::vector<uint8_t> ExpandHrp(const std::string& hrp) {
    std::vector<uint8_t> out;
    out.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) out.push_back(static_cast<uint8_t>(c) >> 5);
    out.push_back(0);
    for (char c : hrp) out.push_back(static_cast<uint8_t>(c) & 31);
    return out;
}

/// Regroup bits; returns false on bad padding when decoding
bool Regroup(const std::vector<uint8_t>& in, int fromBits, int toBits,
             bool pad, std::vector<uint8_t>& out) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t maxv = (1u << toBits) - 1;
    for (uint8_t value : in) {
        if (value >> fromBits) return false;
        acc = (acc << fromBits) | value;
        bits += fromBits;
        while (bits >= toBits) {
            bits -= toBits;
            out.push_back((acc >> bits) & maxv);
        }
    }
    if (pad) {
        if (bits > 0) out.push_back((acc << (toBits - bits)) & maxv);
    } else if (bits >= fromBits || ((acc << (toBits - bits)) & maxv)) {
        return false;
    }
    return true;
}

} // namespace

std::string EncodeBech32(const std::string& hrp, uint8_t version,
                         const std::vector<uint8_t>& program) {
    std::vector<uint8_t> values{version};
    if (version > 31 || !Regroup(program, 8, 5, true, values)) {
        throw std::invalid_argument("EncodeBech32: bad version");
    }

    std::vector<uint8_t> check = ExpandHrp(hrp);
    check.insert(check.end(), values.begin(), values.end());
    check.resize(check.size() + 6, 0);
    uint32_t mod = Polymod(check) ^ 1;

    std::string out = hrp + "1";
    for (uint8_t v : values) out += kCharset[v];
    for (int i = 0; i < 6; ++i) out += kCharset[(mod >> (5 * (5 - i))) & 31];
    return out;
}

std::optional<std::tuple<std::string, uint8_t, std::vector<uint8_t>>>
DecodeBech32(const std::string& input) {
    if (input.size() < 8 || input.size() > 90) {
        return std::nullopt;
    }

    bool lower = false, upper = false;
    for (char c : input) {
        if (c < 33 || c > 126) return std::nullopt;
        if (std::islower(static_cast<unsigned char>(c))) lower = true;
        if (std::isupper(static_cast<unsigned char>(c))) upper = true;
    }
    if (lower && upper) {
        return std::nullopt;
    }

    std::string str = input;
    std::transform(str.begin(), str.end(), str.begin(), ::tolower);

    size_t sep = str.rfind('1');
    if (sep == std::string::npos || sep < 1 || sep + 7 > str.size()) {
        return std::nullopt;
    }

    std::string hrp = str.substr(0, sep);
    std::vector<uint8_t> values;
    for (size_t i = sep + 1; i < str.size(); ++i) {
        int8_t v = CharsetRev(str[i]);
        if (v < 0) return std::nullopt;
        values.push_back(static_cast<uint8_t>(v));
    }

    std::vector<uint8_t> check = ExpandHrp(hrp);
    check.insert(check.end(), values.begin(), values.end());
    if (Polymod(check) != 1) {
        return std::nullopt;
    }

    values.resize(values.size() - 6);
    if (values.empty()) {
        return std::nullopt;
    }

    uint8_t version = values.front();
    values.erase(values.begin());

    std::vector<uint8_t> program;
    if (!Regroup(values, 5, 8, false, program)) {
        return std::nullopt;
    }
    return std::make_tuple(hrp, version, program);
}

// ============================================================================
// Address
// ============================================================================

Address::Address(uint8_t version, std::vector<uint8_t> hash)
    : version_(version), hash_(std::move(hash)) {
    if (version_ > 31) {
        throw std::invalid_argument("Address version out of range");
    }
    if (hash_.size() < MIN_HASH_SIZE || hash_.size() > MAX_HASH_SIZE) {
        throw std::invalid_argument("Address hash has invalid length");
    }
}

Address Address::FromPubkeyHash(const Hash160& keyHash) {
    return Address(0, keyHash.ToBytes());
}

Address Address::FromScriptHash(const Hash256& scriptHash) {
    return Address(0, scriptHash.ToBytes());
}

Address Address::FromScript(const Script& script) {
    return FromScriptHash(SHA3_256Hash(script.data(), script.size()));
}

Address Address::FromString(const std::string& str, NetworkType network) {
    auto decoded = DecodeBech32(str);
    if (!decoded) {
        throw std::invalid_argument("Invalid bech32 address: " + str);
    }
    if (std::get<0>(*decoded) != GetBech32Hrp(network)) {
        throw std::invalid_argument("Address is for a different network: " + str);
    }
    return Address(std::get<1>(*decoded), std::move(std::get<2>(*decoded)));
}

std::string Address::ToString(NetworkType network) const {
    if (IsNull()) {
        return "";
    }
    return EncodeBech32(GetBech32Hrp(network), version_, hash_);
}

} // namespace hnsledger

// HNSLEDGER - Address Header
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// Handshake addresses: a witness version plus a 2-40 byte program, printed
// as bech32 with a per-network human readable part.

#ifndef HNSLEDGER_CORE_ADDRESS_H
#define HNSLEDGER_CORE_ADDRESS_H

#include "hnsledger/core/script.h"
#include "hnsledger/core/serialize.h"
#include "hnsledger/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace hnsledger {

// ============================================================================
// Networks
// ============================================================================

enum class NetworkType : uint8_t {
    Main = 0,
    Testnet = 1,
    Regtest = 2,
    Simnet = 3,
};

const char* NetworkToString(NetworkType network);

/// Throws std::invalid_argument for an unknown name
NetworkType NetworkFromString(const std::string& name);

/// Bech32 human readable part ("hs", "ts", "rs", "ss")
const char* GetBech32Hrp(NetworkType network);

/// SLIP-44 coin type used as the second path component
uint32_t GetCoinType(NetworkType network);

// ============================================================================
// Bech32
// ============================================================================

std::string EncodeBech32(const std::string& hrp, uint8_t version,
                         const std::vector<uint8_t>& program);

/// Returns (hrp, version, program), or nullopt on any decoding failure
std::optional<std::tuple<std::string, uint8_t, std::vector<uint8_t>>>
DecodeBech32(const std::string& str);

// ============================================================================
// Address
// ============================================================================

class Address {
public:
    static constexpr size_t MIN_HASH_SIZE = 2;
    static constexpr size_t MAX_HASH_SIZE = 40;

    Address() = default;

    /// Throws std::invalid_argument on a bad version or hash length
    Address(uint8_t version, std::vector<uint8_t> hash);

    static Address FromPubkeyHash(const Hash160& keyHash);
    static Address FromScriptHash(const Hash256& scriptHash);

    /// Script-hash address of a redeem script (SHA3-256)
    static Address FromScript(const Script& script);

    /// Throws std::invalid_argument when the string is not an address
    /// for the given network
    static Address FromString(const std::string& str, NetworkType network);

    uint8_t GetVersion() const { return version_; }
    const std::vector<uint8_t>& GetHash() const { return hash_; }

    bool IsNull() const { return hash_.empty(); }

    /// Version 0, 20-byte program
    bool IsPubkeyHash() const { return version_ == 0 && hash_.size() == 20; }

    /// Version 0, 32-byte program
    bool IsScriptHash() const { return version_ == 0 && hash_.size() == 32; }

    std::string ToString(NetworkType network) const;

    bool operator==(const Address& other) const {
        return version_ == other.version_ && hash_ == other.hash_;
    }
    bool operator!=(const Address& other) const { return !(*this == other); }

private:
    uint8_t version_{0};
    std::vector<uint8_t> hash_;
};

/// Wire form: u8 version, u8 hash length, hash
template<typename Stream>
void Serialize(Stream& s, const Address& addr) {
    ser_writedata8(s, addr.GetVersion());
    ser_writedata8(s, static_cast<uint8_t>(addr.GetHash().size()));
    if (!addr.GetHash().empty()) {
        s.Write(addr.GetHash().data(), addr.GetHash().size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, Address& addr) {
    uint8_t version = ser_readdata8(s);
    uint8_t len = ser_readdata8(s);
    std::vector<uint8_t> hash(len);
    if (len > 0) {
        s.Read(hash.data(), len);
    }
    try {
        addr = Address(version, std::move(hash));
    } catch (const std::invalid_argument& e) {
        throw std::ios_base::failure(e.what());
    }
}

} // namespace hnsledger

#endif // HNSLEDGER_CORE_ADDRESS_H

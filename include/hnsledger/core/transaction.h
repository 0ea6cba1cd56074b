// HNSLEDGER - Transaction Header
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// Handshake transaction primitives as far as the device needs them: the
// outpoints and sequences of the inputs, the value/address/covenant of the
// outputs, and the coins being spent.

#ifndef HNSLEDGER_CORE_TRANSACTION_H
#define HNSLEDGER_CORE_TRANSACTION_H

#include "hnsledger/core/address.h"
#include "hnsledger/core/serialize.h"
#include "hnsledger/core/types.h"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace hnsledger {

// ============================================================================
// Sighash Types
// ============================================================================

enum SighashType : uint32_t {
    SIGHASH_ALL = 1,
    SIGHASH_NONE = 2,
    SIGHASH_SINGLE = 3,
    SIGHASH_SINGLEREVERSE = 4,
    SIGHASH_NOINPUT = 0x40,
    SIGHASH_ANYONECANPAY = 0x80,
};

// ============================================================================
// Outpoint - Reference to a previous transaction output
// ============================================================================

class Outpoint {
public:
    TxHash hash;
    uint32_t index;

    static constexpr uint32_t NULL_INDEX = std::numeric_limits<uint32_t>::max();

    Outpoint() : index(NULL_INDEX) {}
    Outpoint(const TxHash& hashIn, uint32_t indexIn) : hash(hashIn), index(indexIn) {}

    bool IsNull() const { return hash.IsNull() && index == NULL_INDEX; }

    /// 36-byte map key: hash followed by the index as u32 little-endian
    std::string ToKey() const;

    /// Inverse of ToKey(). Throws std::invalid_argument on a bad length.
    static Outpoint FromKey(const std::string& key);

    /// "<hash hex>/<index>"
    std::string ToString() const;

    friend bool operator<(const Outpoint& a, const Outpoint& b) {
        if (a.hash != b.hash) return a.hash < b.hash;
        return a.index < b.index;
    }

    friend bool operator==(const Outpoint& a, const Outpoint& b) {
        return a.hash == b.hash && a.index == b.index;
    }

    friend bool operator!=(const Outpoint& a, const Outpoint& b) {
        return !(a == b);
    }
};

template<typename Stream>
void Serialize(Stream& s, const Outpoint& outpoint) {
    Serialize(s, outpoint.hash);
    ser_writedata32(s, outpoint.index);
}

template<typename Stream>
void Unserialize(Stream& s, Outpoint& outpoint) {
    Unserialize(s, outpoint.hash);
    outpoint.index = ser_readdata32(s);
}

// ============================================================================
// Covenant
// ============================================================================

/// Name-auction covenant attached to every output. NONE carries no items.
struct Covenant {
    enum Type : uint8_t {
        NONE = 0,
        CLAIM = 1,
        OPEN = 2,
        BID = 3,
        REVEAL = 4,
        REDEEM = 5,
        REGISTER = 6,
        UPDATE = 7,
        RENEW = 8,
        TRANSFER = 9,
        FINALIZE = 10,
        REVOKE = 11,
    };

    uint8_t type{NONE};
    std::vector<std::vector<uint8_t>> items;

    bool operator==(const Covenant& other) const {
        return type == other.type && items == other.items;
    }
};

template<typename Stream>
void Serialize(Stream& s, const Covenant& covenant) {
    ser_writedata8(s, covenant.type);
    WriteCompactSize(s, covenant.items.size());
    for (const auto& item : covenant.items) {
        Serialize(s, item);
    }
}

template<typename Stream>
void Unserialize(Stream& s, Covenant& covenant) {
    covenant.type = ser_readdata8(s);
    uint64_t count = ReadCompactSize(s);
    covenant.items.clear();
    for (uint64_t i = 0; i < count; ++i) {
        std::vector<uint8_t> item;
        Unserialize(s, item);
        covenant.items.push_back(std::move(item));
    }
}

// ============================================================================
// Coin - An unspent output being consumed
// ============================================================================

class Coin {
public:
    uint32_t version{0};
    uint32_t height{0};
    Amount value{0};
    Address address;
    Covenant covenant;
    bool coinbase{false};
    TxHash hash;
    uint32_t index{0};

    Outpoint GetOutpoint() const { return Outpoint(hash, index); }
};

// ============================================================================
// Input / Output
// ============================================================================

class Input {
public:
    Outpoint prevout;
    std::vector<std::vector<uint8_t>> witness;
    uint32_t sequence;

    static constexpr uint32_t SEQUENCE_FINAL = 0xFFFFFFFF;

    Input() : sequence(SEQUENCE_FINAL) {}
    explicit Input(const Outpoint& prevoutIn, uint32_t sequenceIn = SEQUENCE_FINAL)
        : prevout(prevoutIn), sequence(sequenceIn) {}
};

class Output {
public:
    Amount value{0};
    Address address;
    Covenant covenant;

    Output() = default;
    Output(Amount valueIn, const Address& addressIn)
        : value(valueIn), address(addressIn) {}
};

template<typename Stream>
void Serialize(Stream& s, const Output& output) {
    ser_writedata64(s, static_cast<uint64_t>(output.value));
    Serialize(s, output.address);
    Serialize(s, output.covenant);
}

template<typename Stream>
void Unserialize(Stream& s, Output& output) {
    output.value = static_cast<Amount>(ser_readdata64(s));
    Unserialize(s, output.address);
    Unserialize(s, output.covenant);
}

// ============================================================================
// MutableTransaction
// ============================================================================

class MutableTransaction {
public:
    uint32_t version{0};
    std::vector<Input> inputs;
    std::vector<Output> outputs;
    uint32_t locktime{0};

    /// Index of the input spending an outpoint, or -1
    int FindInput(const Outpoint& prevout) const;

    /// Sum of output serialized sizes
    size_t GetOutputsSize() const;
};

} // namespace hnsledger

#endif // HNSLEDGER_CORE_TRANSACTION_H

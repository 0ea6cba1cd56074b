// HNSLEDGER - Script Header
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// Handshake scripts, limited to what the signing bridge has to build and
// inspect: pay-to-pubkey-hash previous scripts and multisig redeem scripts.

#ifndef HNSLEDGER_CORE_SCRIPT_H
#define HNSLEDGER_CORE_SCRIPT_H

#include "hnsledger/core/types.h"
#include "hnsledger/core/serialize.h"

#include <cstdint>
#include <string>
#include <vector>

namespace hnsledger {

// ============================================================================
// Script Limits
// ============================================================================

/// Maximum script length in bytes
static constexpr size_t MAX_SCRIPT_SIZE = 10000;

/// Maximum number of public keys per multisig
static constexpr int MAX_PUBKEYS_PER_MULTISIG = 20;

// ============================================================================
// Opcodes
// ============================================================================

enum Opcode : uint8_t {
    OP_0 = 0x00,
    OP_FALSE = OP_0,
    OP_PUSHDATA1 = 0x4c,
    OP_PUSHDATA2 = 0x4d,
    OP_PUSHDATA4 = 0x4e,
    OP_1NEGATE = 0x4f,
    OP_1 = 0x51,
    OP_TRUE = OP_1,
    OP_16 = 0x60,

    OP_RETURN = 0x6a,
    OP_DUP = 0x76,
    OP_EQUAL = 0x87,
    OP_EQUALVERIFY = 0x88,

    OP_CHECKSIG = 0xac,
    OP_CHECKSIGVERIFY = 0xad,
    OP_CHECKMULTISIG = 0xae,
    OP_CHECKMULTISIGVERIFY = 0xaf,

    // Handshake hashing opcodes
    OP_BLAKE160 = 0xc0,
    OP_BLAKE256 = 0xc1,
    OP_SHA3 = 0xc2,
    OP_KECCAK = 0xc3,

    OP_INVALIDOPCODE = 0xff,
};

/// Parsed m-of-n multisig redeem script
struct MultisigInfo {
    int required{0};
    std::vector<std::vector<uint8_t>> keys;
};

// ============================================================================
// Script Class
// ============================================================================

class Script : public std::vector<uint8_t> {
public:
    using base_type = std::vector<uint8_t>;
    using base_type::base_type;

    Script() = default;
    explicit Script(const std::vector<uint8_t>& raw) : base_type(raw) {}

    Script& operator<<(Opcode opcode);

    /// Push data with the minimal size prefix
    Script& operator<<(const std::vector<uint8_t>& data);

    Script& operator<<(const Hash160& hash);

    /// Read the next opcode and its push data. Returns false at the end of
    /// the script or on a truncated push.
    bool GetOp(const_iterator& pc, Opcode& opcodeRet,
               std::vector<uint8_t>& dataRet) const;

    /// OP_DUP OP_BLAKE160 <20 bytes> OP_EQUALVERIFY OP_CHECKSIG
    bool IsPayToPubkeyHash() const;

    /// OP_m <key>... OP_n OP_CHECKMULTISIG
    bool IsMultisig() const;

    bool ExtractPubkeyHash(Hash160& hash) const;

    bool ExtractMultisig(MultisigInfo& info) const;

    std::string ToHex() const { return BytesToHex(data(), size()); }

    /// Decode OP_N to integer (0-16), -1 for anything else
    static int DecodeOP_N(Opcode opcode);

    /// Encode integer (0-16) to OP_N
    static Opcode EncodeOP_N(int n);

    static Script CreatePayToPubkeyHash(const Hash160& keyHash);

    /// Throws std::invalid_argument on an impossible m-of-n
    static Script CreateMultisig(int required,
                                 const std::vector<std::vector<uint8_t>>& keys);

private:
    void AppendDataSize(uint32_t size);
};

template<typename Stream>
void Serialize(Stream& s, const Script& script) {
    WriteCompactSize(s, script.size());
    if (!script.empty()) {
        s.Write(script.data(), script.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, Script& script) {
    uint64_t size = ReadCompactSize(s);
    script.resize(size);
    if (size > 0) {
        s.Read(script.data(), size);
    }
}

} // namespace hnsledger

#endif // HNSLEDGER_CORE_SCRIPT_H

// HNSLEDGER - Script Implementation
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/core/script.h"

#include <stdexcept>

namespace hnsledger {

// ============================================================================
// Building
// ============================================================================

void Script::AppendDataSize(uint32_t size) {
    if (size < OP_PUSHDATA1) {
        push_back(static_cast<uint8_t>(size));
    } else if (size <= 0xff) {
        push_back(OP_PUSHDATA1);
        push_back(static_cast<uint8_t>(size));
    } else if (size <= 0xffff) {
        push_back(OP_PUSHDATA2);
        push_back(size & 0xff);
        push_back((size >> 8) & 0xff);
    } else {
        push_back(OP_PUSHDATA4);
        for (int shift = 0; shift < 32; shift += 8) {
            push_back((size >> shift) & 0xff);
        }
    }
}

Script& Script::operator<<(Opcode opcode) {
    push_back(static_cast<uint8_t>(opcode));
    return *this;
}

Script& Script::operator<<(const std::vector<uint8_t>& data) {
    AppendDataSize(static_cast<uint32_t>(data.size()));
    insert(end(), data.begin(), data.end());
    return *this;
}

Script& Script::operator<<(const Hash160& hash) {
    AppendDataSize(Hash160::SIZE);
    insert(end(), hash.begin(), hash.end());
    return *this;
}

// ============================================================================
// Parsing
// ============================================================================

bool Script::GetOp(const_iterator& pc, Opcode& opcodeRet,
                   std::vector<uint8_t>& dataRet) const {
    dataRet.clear();
    if (pc >= end()) {
        return false;
    }

    uint8_t op = *pc++;
    opcodeRet = static_cast<Opcode>(op);
    if (op > OP_PUSHDATA4) {
        return true;
    }

    size_t width = 0;
    if (op == OP_PUSHDATA1) width = 1;
    else if (op == OP_PUSHDATA2) width = 2;
    else if (op == OP_PUSHDATA4) width = 4;

    if (static_cast<size_t>(end() - pc) < width) {
        return false;
    }

    size_t len = op < OP_PUSHDATA1 ? op : 0;
    for (size_t i = 0; i < width; ++i) {
        len |= static_cast<size_t>(pc[i]) << (8 * i);
    }
    pc += width;

    if (static_cast<size_t>(end() - pc) < len) {
        return false;
    }
    dataRet.assign(pc, pc + len);
    pc += len;
    return true;
}

bool Script::IsPayToPubkeyHash() const {
    return size() == 25 &&
           (*this)[0] == OP_DUP &&
           (*this)[1] == OP_BLAKE160 &&
           (*this)[2] == 20 &&
           (*this)[23] == OP_EQUALVERIFY &&
           (*this)[24] == OP_CHECKSIG;
}

bool Script::ExtractPubkeyHash(Hash160& hash) const {
    if (!IsPayToPubkeyHash()) {
        return false;
    }
    hash = Hash160(data() + 3, 20);
    return true;
}

bool Script::ExtractMultisig(MultisigInfo& info) const {
    if (size() < 3 || back() != OP_CHECKMULTISIG) {
        return false;
    }

    const_iterator pc = begin();
    Opcode op;
    std::vector<uint8_t> push;

    if (!GetOp(pc, op, push)) return false;
    int m = DecodeOP_N(op);
    if (m < 1) return false;

    std::vector<std::vector<uint8_t>> keys;
    while (GetOp(pc, op, push)) {
        if (op > OP_PUSHDATA4) break;
        if (push.size() != 33) return false;
        keys.push_back(push);
    }

    int n = DecodeOP_N(op);
    if (n < 1 || n != static_cast<int>(keys.size()) || m > n) return false;
    if (n > MAX_PUBKEYS_PER_MULTISIG) return false;

    // OP_n must be followed only by OP_CHECKMULTISIG
    if (pc == end() || *pc != OP_CHECKMULTISIG || pc + 1 != end()) return false;

    info.required = m;
    info.keys = std::move(keys);
    return true;
}

bool Script::IsMultisig() const {
    MultisigInfo info;
    return ExtractMultisig(info);
}

// ============================================================================
// Static Helpers
// ============================================================================

int Script::DecodeOP_N(Opcode opcode) {
    if (opcode == OP_0) return 0;
    if (opcode >= OP_1 && opcode <= OP_16) return static_cast<int>(opcode) - (OP_1 - 1);
    return -1;
}

Opcode Script::EncodeOP_N(int n) {
    if (n < 0 || n > 16) {
        throw std::invalid_argument("EncodeOP_N: value out of range");
    }
    if (n == 0) return OP_0;
    return static_cast<Opcode>(OP_1 + n - 1);
}

Script Script::CreatePayToPubkeyHash(const Hash160& keyHash) {
    Script script;
    script << OP_DUP << OP_BLAKE160 << keyHash << OP_EQUALVERIFY << OP_CHECKSIG;
    return script;
}

Script Script::CreateMultisig(int required,
                              const std::vector<std::vector<uint8_t>>& keys) {
    int n = static_cast<int>(keys.size());
    if (required < 1 || required > n || n > MAX_PUBKEYS_PER_MULTISIG) {
        throw std::invalid_argument("CreateMultisig: bad m-of-n");
    }

    Script script;
    script << EncodeOP_N(required);
    for (const auto& key : keys) {
        script << key;
    }
    script << EncodeOP_N(n) << OP_CHECKMULTISIG;
    return script;
}

} // namespace hnsledger

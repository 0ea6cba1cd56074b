// HNSLEDGER - Transaction Implementation
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/core/transaction.h"

#include <stdexcept>

namespace hnsledger {

// ============================================================================
// Outpoint
// ============================================================================

std::string Outpoint::ToKey() const {
    DataStream ss;
    ss << *this;
    const auto& raw = ss.Data();
    return std::string(raw.begin(), raw.end());
}

Outpoint Outpoint::FromKey(const std::string& key) {
    if (key.size() != TxHash::SIZE + 4) {
        throw std::invalid_argument("Outpoint key must be 36 bytes");
    }
    DataStream ss(reinterpret_cast<const uint8_t*>(key.data()), key.size());
    Outpoint out;
    ss >> out;
    return out;
}

std::string Outpoint::ToString() const {
    return hash.ToHex() + "/" + std::to_string(index);
}

// ============================================================================
// MutableTransaction
// ============================================================================

int MutableTransaction::FindInput(const Outpoint& prevout) const {
    for (size_t i = 0; i < inputs.size(); ++i) {
        if (inputs[i].prevout == prevout) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

size_t MutableTransaction::GetOutputsSize() const {
    size_t total = 0;
    for (const auto& output : outputs) {
        total += GetSerializeSize(output);
    }
    return total;
}

} // namespace hnsledger

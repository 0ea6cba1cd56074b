// HNSLEDGER - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/core/hex.h"

namespace hnsledger {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int DecodeNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

} // namespace

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = kHexDigits[data[i] >> 4];
        out[2 * i + 1] = kHexDigits[data[i] & 0x0f];
    }
    return out;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    if (hex.size() & 1) {
        throw std::invalid_argument("Hex string must have even length");
    }

    std::vector<uint8_t> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = DecodeNibble(hex[2 * i]);
        int lo = DecodeNibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || (str.size() & 1)) {
        return false;
    }
    for (char c : str) {
        if (DecodeNibble(c) < 0) return false;
    }
    return true;
}

} // namespace hnsledger

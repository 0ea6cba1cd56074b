// HNSLEDGER - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#ifndef HNSLEDGER_CORE_HEX_H
#define HNSLEDGER_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace hnsledger {

/// Lowercase hex of a byte range
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Decode hex (either case). Throws std::invalid_argument.
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// True for a non-empty, even-length hex string
bool IsValidHex(const std::string& str);

} // namespace hnsledger

#endif // HNSLEDGER_CORE_HEX_H

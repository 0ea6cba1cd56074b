// HNSLEDGER - Device Status Words
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// Status words returned by the Handshake device app in the last two bytes
// of every response.

#ifndef HNSLEDGER_LEDGER_STATUS_H
#define HNSLEDGER_LEDGER_STATUS_H

#include <cstddef>
#include <cstdint>

namespace hnsledger {
namespace ledger {

/// Coarse grouping of status words
enum class StatusKind {
    Success,
    UserRejected,      // declined on screen, or device locked
    BadRequest,        // malformed command (length, P1, P2, data)
    BadTransaction,    // app could not parse the streamed transaction
    BadPath,           // derivation path refused
    Unsupported,       // wrong app open, unknown class or instruction
    DeviceFailure,     // internal app failure
    Unknown,
};

const char* StatusKindToString(StatusKind kind);

namespace StatusWord {
    constexpr uint16_t SUCCESS = 0x9000;
    constexpr uint16_t INTERNAL_ERROR = 0x006f;
    constexpr uint16_t INCORRECT_LC = 0x6700;
    constexpr uint16_t INCORRECT_LENGTH = 0x6701;
    constexpr uint16_t SECURITY_CONDITION_NOT_SATISFIED = 0x6982;
    constexpr uint16_t CONDITIONS_OF_USE_NOT_SATISFIED = 0x6985;
    constexpr uint16_t INCORRECT_CDATA = 0x6a80;
    constexpr uint16_t FILE_NOT_FOUND = 0x6a82;
    constexpr uint16_t INCORRECT_P1 = 0x6af1;
    constexpr uint16_t INCORRECT_P2 = 0x6af2;
    constexpr uint16_t INCORRECT_PARAMETERS = 0x6b00;
    constexpr uint16_t INS_NOT_SUPPORTED = 0x6d00;
    constexpr uint16_t CLA_NOT_SUPPORTED = 0x6e00;
    constexpr uint16_t CANNOT_INIT_BLAKE2B_CTX = 0x6f13;
    constexpr uint16_t CANNOT_ENCODE_ADDRESS = 0x6f14;
    constexpr uint16_t CANNOT_READ_BIP32_PATH = 0x6f15;
    constexpr uint16_t CANNOT_READ_TX_VERSION = 0x6f16;
    constexpr uint16_t CANNOT_READ_TX_LOCKTIME = 0x6f17;
    constexpr uint16_t CANNOT_READ_INPUTS_LEN = 0x6f18;
    constexpr uint16_t CANNOT_READ_OUTPUTS_LEN = 0x6f19;
    constexpr uint16_t CANNOT_READ_OUTPUTS_SIZE = 0x6f1a;
    constexpr uint16_t CANNOT_READ_INPUT_INDEX = 0x6f1b;
    constexpr uint16_t CANNOT_READ_SIGHASH_TYPE = 0x6f1c;
    constexpr uint16_t CANNOT_READ_SCRIPT_LEN = 0x6f1d;
    constexpr uint16_t CANNOT_PEEK_SCRIPT_LEN = 0x6f1e;
    constexpr uint16_t INCORRECT_INPUT_INDEX = 0x6f1f;
    constexpr uint16_t INCORRECT_SIGHASH_TYPE = 0x6f20;
    constexpr uint16_t INCORRECT_PARSER_STATE = 0x6f21;
    constexpr uint16_t INCORRECT_SIGNATURE_PATH = 0x6f22;
    constexpr uint16_t CANNOT_ENCODE_XPUB = 0x6f23;
    constexpr uint16_t INCORRECT_INPUTS_LEN = 0x6f24;
    constexpr uint16_t INCORRECT_ADDR_PATH = 0x6f25;
    constexpr uint16_t CACHE_WRITE_ERROR = 0x6f26;
    constexpr uint16_t CACHE_FLUSH_ERROR = 0x6f27;
    constexpr uint16_t CANNOT_UPDATE_UI = 0x6f28;
    constexpr uint16_t FAILED_TO_SIGN_INPUT = 0x6f29;
}

struct StatusEntry {
    uint16_t code;
    const char* name;
    StatusKind kind;
    const char* message;
};

/// Entry for a status word, or nullptr when the code is not in the table
const StatusEntry* LookupStatus(uint16_t code);

/// Every known status word, success included
const StatusEntry* StatusTableBegin();
const StatusEntry* StatusTableEnd();
size_t StatusTableSize();

} // namespace ledger
} // namespace hnsledger

#endif // HNSLEDGER_LEDGER_STATUS_H

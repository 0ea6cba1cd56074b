// HNSLEDGER - Device Status Words
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/ledger/status.h"

#include <iterator>

namespace hnsledger {
namespace ledger {

namespace {

constexpr const char* MSG_UNSUPPORTED = "Instruction not supported (check app on the device)";

// Sorted by name, the order the device app documents them in.
constexpr StatusEntry STATUS_TABLE[] = {
    {StatusWord::CACHE_FLUSH_ERROR, "CACHE_FLUSH_ERROR",
     StatusKind::DeviceFailure, "Error flushing internal cache"},
    {StatusWord::CACHE_WRITE_ERROR, "CACHE_WRITE_ERROR",
     StatusKind::DeviceFailure, "Error writing to internal cache"},
    {StatusWord::CANNOT_ENCODE_ADDRESS, "CANNOT_ENCODE_ADDRESS",
     StatusKind::DeviceFailure, "Cannot bech32 encode address"},
    {StatusWord::CANNOT_ENCODE_XPUB, "CANNOT_ENCODE_XPUB",
     StatusKind::DeviceFailure, "Cannot base58 encode xpub"},
    {StatusWord::CANNOT_INIT_BLAKE2B_CTX, "CANNOT_INIT_BLAKE2B_CTX",
     StatusKind::DeviceFailure, "Cannot initialize blake2b context"},
    {StatusWord::CANNOT_PEEK_SCRIPT_LEN, "CANNOT_PEEK_SCRIPT_LEN",
     StatusKind::BadTransaction, "Cannot peek input script length"},
    {StatusWord::CANNOT_READ_BIP32_PATH, "CANNOT_READ_BIP32_PATH",
     StatusKind::BadPath, "Cannot read BIP32 path"},
    {StatusWord::CANNOT_READ_INPUT_INDEX, "CANNOT_READ_INPUT_INDEX",
     StatusKind::BadTransaction, "Cannot read index of input"},
    {StatusWord::CANNOT_READ_INPUTS_LEN, "CANNOT_READ_INPUTS_LEN",
     StatusKind::BadTransaction, "Cannot read input vector length"},
    {StatusWord::CANNOT_READ_OUTPUTS_LEN, "CANNOT_READ_OUTPUTS_LEN",
     StatusKind::BadTransaction, "Cannot read output vector length"},
    {StatusWord::CANNOT_READ_OUTPUTS_SIZE, "CANNOT_READ_OUTPUTS_SIZE",
     StatusKind::BadTransaction, "Cannot read size of outputs vector"},
    {StatusWord::CANNOT_READ_TX_VERSION, "CANNOT_READ_TX_VERSION",
     StatusKind::BadTransaction, "Cannot read tx version"},
    {StatusWord::CANNOT_READ_TX_LOCKTIME, "CANNOT_READ_TX_LOCKTIME",
     StatusKind::BadTransaction, "Cannot read tx locktime"},
    {StatusWord::CANNOT_READ_SCRIPT_LEN, "CANNOT_READ_SCRIPT_LEN",
     StatusKind::BadTransaction, "Cannot read input script length"},
    {StatusWord::CANNOT_READ_SIGHASH_TYPE, "CANNOT_READ_SIGHASH_TYPE",
     StatusKind::BadTransaction, "Cannot read sighash type"},
    {StatusWord::CANNOT_UPDATE_UI, "CANNOT_UPDATE_UI",
     StatusKind::DeviceFailure, "Cannot update Ledger UI"},
    {StatusWord::CLA_NOT_SUPPORTED, "CLA_NOT_SUPPORTED",
     StatusKind::Unsupported, MSG_UNSUPPORTED},
    {StatusWord::CONDITIONS_OF_USE_NOT_SATISFIED, "CONDITIONS_OF_USE_NOT_SATISFIED",
     StatusKind::UserRejected, "User rejected on-screen confirmation"},
    {StatusWord::FAILED_TO_SIGN_INPUT, "FAILED_TO_SIGN_INPUT",
     StatusKind::DeviceFailure, "Failed to sign input"},
    {StatusWord::FILE_NOT_FOUND, "FILE_NOT_FOUND",
     StatusKind::Unsupported, "File not found"},
    {StatusWord::INCORRECT_ADDR_PATH, "INCORRECT_ADDR_PATH",
     StatusKind::BadPath, "Incorrect BIP44 address path"},
    {StatusWord::INCORRECT_INPUT_INDEX, "INCORRECT_INPUT_INDEX",
     StatusKind::BadTransaction, "Input index larger than inputs vector length"},
    {StatusWord::INCORRECT_LENGTH, "INCORRECT_LENGTH",
     StatusKind::BadRequest, "Incorrect length"},
    {StatusWord::INCORRECT_LC, "INCORRECT_LC",
     StatusKind::BadRequest, "Incorrect LC (length of command data)"},
    {StatusWord::INCORRECT_CDATA, "INCORRECT_CDATA",
     StatusKind::BadRequest, "Incorrect CDATA (command data)"},
    {StatusWord::INCORRECT_P1, "INCORRECT_P1",
     StatusKind::BadRequest, "Incorrect P1"},
    {StatusWord::INCORRECT_P2, "INCORRECT_P2",
     StatusKind::BadRequest, "Incorrect P2"},
    {StatusWord::INCORRECT_PARAMETERS, "INCORRECT_PARAMETERS",
     StatusKind::BadRequest, "Incorrect parameters (P1 or P2)"},
    {StatusWord::INCORRECT_PARSER_STATE, "INCORRECT_PARSER_STATE",
     StatusKind::BadTransaction, "Incorrect parser state"},
    {StatusWord::INCORRECT_SIGHASH_TYPE, "INCORRECT_SIGHASH_TYPE",
     StatusKind::BadTransaction, "Incorrect sighash type"},
    {StatusWord::INCORRECT_SIGNATURE_PATH, "INCORRECT_SIGNATURE_PATH",
     StatusKind::BadPath, "Incorrect signature path"},
    {StatusWord::INCORRECT_INPUTS_LEN, "INCORRECT_INPUTS_LEN",
     StatusKind::BadTransaction, "Inputs vector length is larger than device limit"},
    {StatusWord::INTERNAL_ERROR, "INTERNAL_ERROR",
     StatusKind::DeviceFailure, "Internal error"},
    {StatusWord::INS_NOT_SUPPORTED, "INS_NOT_SUPPORTED",
     StatusKind::Unsupported, MSG_UNSUPPORTED},
    {StatusWord::SECURITY_CONDITION_NOT_SATISFIED, "SECURITY_CONDITION_NOT_SATISFIED",
     StatusKind::UserRejected, "Invalid security status"},
    {StatusWord::SUCCESS, "SUCCESS",
     StatusKind::Success, "Success"},
};

} // namespace

const char* StatusKindToString(StatusKind kind) {
    switch (kind) {
        case StatusKind::Success:        return "success";
        case StatusKind::UserRejected:   return "user-rejected";
        case StatusKind::BadRequest:     return "bad-request";
        case StatusKind::BadTransaction: return "bad-transaction";
        case StatusKind::BadPath:        return "bad-path";
        case StatusKind::Unsupported:    return "unsupported";
        case StatusKind::DeviceFailure:  return "device-failure";
        case StatusKind::Unknown:        return "unknown";
    }
    return "unknown";
}

const StatusEntry* LookupStatus(uint16_t code) {
    for (const auto& entry : STATUS_TABLE) {
        if (entry.code == code) {
            return &entry;
        }
    }
    return nullptr;
}

const StatusEntry* StatusTableBegin() { return std::begin(STATUS_TABLE); }
const StatusEntry* StatusTableEnd() { return std::end(STATUS_TABLE); }
size_t StatusTableSize() { return std::size(STATUS_TABLE); }

} // namespace ledger
} // namespace hnsledger

// HNSLEDGER - Ledger Errors
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/ledger/error.h"

#include <cstdio>

namespace hnsledger {
namespace ledger {

const char* ErrorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Frame:     return "frame";
        case ErrorCategory::Protocol:  return "protocol";
        case ErrorCategory::Device:    return "device";
        case ErrorCategory::Usage:     return "usage";
        case ErrorCategory::Transport: return "transport";
        case ErrorCategory::Timeout:   return "timeout";
    }
    return "unknown";
}

namespace {

std::string FormatDeviceMessage(uint16_t statusWord, const std::string& name,
                                const std::string& message) {
    char code[8];
    std::snprintf(code, sizeof(code), "0x%04x", statusWord);
    return name + " (" + code + "): " + message;
}

} // namespace

DeviceError::DeviceError(uint16_t statusWord, const std::string& name,
                         StatusKind kind, const std::string& message)
    : LedgerError(ErrorCategory::Device, FormatDeviceMessage(statusWord, name, message)),
      statusWord_(statusWord),
      name_(name),
      kind_(kind),
      description_(message) {}

DeviceError DeviceError::FromStatusWord(uint16_t statusWord) {
    const StatusEntry* entry = LookupStatus(statusWord);
    if (entry == nullptr) {
        return DeviceError(statusWord, "UNKNOWN_ERROR", StatusKind::Unknown,
                           "Unknown status code");
    }
    return DeviceError(entry->code, entry->name, entry->kind, entry->message);
}

} // namespace ledger
} // namespace hnsledger

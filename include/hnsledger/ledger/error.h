// HNSLEDGER - Ledger Errors
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// Every failure raised while talking to the device derives from LedgerError.
// Usage errors are raised before anything reaches the transport.

#ifndef HNSLEDGER_LEDGER_ERROR_H
#define HNSLEDGER_LEDGER_ERROR_H

#include "hnsledger/ledger/status.h"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace hnsledger {
namespace ledger {

enum class ErrorCategory {
    Frame,
    Protocol,
    Device,
    Usage,
    Transport,
    Timeout,
};

const char* ErrorCategoryToString(ErrorCategory category);

class LedgerError : public std::runtime_error {
public:
    LedgerError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    ErrorCategory GetCategory() const { return category_; }

private:
    ErrorCategory category_;
};

/// Bad channel id, tag, sequence or length while (de)framing
class FrameError : public LedgerError {
public:
    explicit FrameError(const std::string& message)
        : LedgerError(ErrorCategory::Frame, message) {}
};

/// Response shape does not fit the instruction
class ProtocolError : public LedgerError {
public:
    explicit ProtocolError(const std::string& message)
        : LedgerError(ErrorCategory::Protocol, message) {}
};

/// Non-success status word returned by the device
class DeviceError : public LedgerError {
public:
    DeviceError(uint16_t statusWord, const std::string& name, StatusKind kind,
                const std::string& message);

    /// Error for a status word through the status table. Unknown codes
    /// become UNKNOWN_ERROR "Unknown status code".
    static DeviceError FromStatusWord(uint16_t statusWord);

    uint16_t GetStatusWord() const { return statusWord_; }
    const std::string& GetName() const { return name_; }
    StatusKind GetKind() const { return kind_; }

    /// Device-side message without the name prefix
    const std::string& GetDescription() const { return description_; }

private:
    uint16_t statusWord_;
    std::string name_;
    StatusKind kind_;
    std::string description_;
};

/// Caller misuse detectable before any exchange
class UsageError : public LedgerError {
public:
    explicit UsageError(const std::string& message)
        : LedgerError(ErrorCategory::Usage, message) {}
};

class TransportError : public LedgerError {
public:
    explicit TransportError(const std::string& message)
        : LedgerError(ErrorCategory::Transport, message) {}
};

class TimeoutError : public LedgerError {
public:
    explicit TimeoutError(const std::string& message)
        : LedgerError(ErrorCategory::Timeout, message) {}
};

} // namespace ledger
} // namespace hnsledger

#endif // HNSLEDGER_LEDGER_ERROR_H

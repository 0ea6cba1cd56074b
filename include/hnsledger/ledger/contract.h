// HNSLEDGER - Device App Wire Contract
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// The byte order of the derivation path and of the signature request header
// fields, and the sighash types the app accepts, depend on the app version.
// Commands are built against the contract selected for the version the
// device reports. The streamed transaction preamble is the consensus
// encoding and is not covered.

#ifndef HNSLEDGER_LEDGER_CONTRACT_H
#define HNSLEDGER_LEDGER_CONTRACT_H

#include <cstdint>
#include <string>
#include <vector>

namespace hnsledger {
namespace ledger {

struct AppVersion {
    uint8_t major{0};
    uint8_t minor{0};
    uint8_t patch{0};

    AppVersion() = default;
    AppVersion(uint8_t majorIn, uint8_t minorIn, uint8_t patchIn)
        : major{majorIn}, minor{minorIn}, patch{patchIn} {}

    /// Parse "major.minor.patch". Throws UsageError on malformed input.
    static AppVersion FromString(const std::string& str);

    std::string ToString() const;

    friend bool operator<(const AppVersion& a, const AppVersion& b) {
        if (a.major != b.major) return a.major < b.major;
        if (a.minor != b.minor) return a.minor < b.minor;
        return a.patch < b.patch;
    }
    friend bool operator==(const AppVersion& a, const AppVersion& b) {
        return a.major == b.major && a.minor == b.minor && a.patch == b.patch;
    }
    friend bool operator>=(const AppVersion& a, const AppVersion& b) { return !(a < b); }
};

enum class ByteOrder {
    Little,
    Big,
};

struct WireContract {
    /// Oldest app version speaking this contract
    AppVersion minVersion;

    /// Order of derivation path indices
    ByteOrder pathOrder;

    /// Order of the prevout index, value, sequence and sighash fields of the
    /// first signature chunk
    ByteOrder fieldOrder;

    std::vector<uint32_t> allowedSighash;

    bool AllowsSighash(uint32_t type) const;

    /**
     * Newest contract whose minVersion does not exceed the version.
     *
     * @throws UsageError for firmware older than every contract
     */
    static const WireContract& ForVersion(const AppVersion& version);

    /// Contract of the newest known app
    static const WireContract& Latest();
};

} // namespace ledger
} // namespace hnsledger

#endif // HNSLEDGER_LEDGER_CONTRACT_H

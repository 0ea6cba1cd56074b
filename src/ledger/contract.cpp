// HNSLEDGER - Device App Wire Contract
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/ledger/contract.h"

#include "hnsledger/core/transaction.h"
#include "hnsledger/ledger/error.h"

#include <algorithm>
#include <sstream>

namespace hnsledger {
namespace ledger {

namespace {

// Ordered by minVersion.
const std::vector<WireContract>& Contracts() {
    static const std::vector<WireContract> contracts = {
        {AppVersion(1, 0, 0), ByteOrder::Big, ByteOrder::Little, {SIGHASH_ALL}},
    };
    return contracts;
}

} // namespace

AppVersion AppVersion::FromString(const std::string& str) {
    std::istringstream in(str);
    unsigned major = 0;
    unsigned minor = 0;
    unsigned patch = 0;
    char dot1 = 0;
    char dot2 = 0;

    if (!(in >> major >> dot1 >> minor >> dot2 >> patch) || dot1 != '.' ||
        dot2 != '.' || !in.eof() || major > 0xff || minor > 0xff || patch > 0xff) {
        throw UsageError("Invalid app version: '" + str + "'");
    }
    return AppVersion(static_cast<uint8_t>(major), static_cast<uint8_t>(minor),
                      static_cast<uint8_t>(patch));
}

std::string AppVersion::ToString() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." +
           std::to_string(patch);
}

bool WireContract::AllowsSighash(uint32_t type) const {
    return std::find(allowedSighash.begin(), allowedSighash.end(), type) !=
           allowedSighash.end();
}

const WireContract& WireContract::ForVersion(const AppVersion& version) {
    const auto& contracts = Contracts();
    for (auto it = contracts.rbegin(); it != contracts.rend(); ++it) {
        if (version >= it->minVersion) {
            return *it;
        }
    }
    throw UsageError("Device app " + version.ToString() +
                     " is older than the oldest supported version " +
                     contracts.front().minVersion.ToString());
}

const WireContract& WireContract::Latest() {
    return Contracts().back();
}

} // namespace ledger
} // namespace hnsledger

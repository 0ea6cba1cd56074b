// HNSLEDGER - Device Settings
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#ifndef HNSLEDGER_LEDGER_SETTINGS_H
#define HNSLEDGER_LEDGER_SETTINGS_H

#include "hnsledger/core/address.h"
#include "hnsledger/ledger/transport.h"
#include "hnsledger/util/config.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace hnsledger {
namespace ledger {

enum class TransportKind {
    Hid,
    Tcp,
};

/// Typed view of the device-related configuration keys
struct DeviceSettings {
    TransportKind transport{TransportKind::Hid};
    std::string devicePath;
    std::string host{"127.0.0.1"};
    uint16_t port{9999};
    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT};
    NetworkType network{NetworkType::Main};

    /**
     * Read transport, device, host, port, timeout and network.
     *
     * @throws std::invalid_argument on an unknown transport or network, a
     *         port outside 1-65535, a timeout outside 1-INT_MAX ms, or a missing
     *         device path for the hid transport
     */
    static DeviceSettings FromConfig(const util::ConfigManager& config);
};

/// Build, configure and open the transport the settings describe
std::unique_ptr<Transport> OpenTransport(const DeviceSettings& settings);

} // namespace ledger
} // namespace hnsledger

#endif // HNSLEDGER_LEDGER_SETTINGS_H

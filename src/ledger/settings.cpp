// HNSLEDGER - Device Settings
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/ledger/settings.h"

#include "hnsledger/ledger/hidraw.h"
#include "hnsledger/ledger/tcp.h"
#include "hnsledger/util/logging.h"

#include <limits>
#include <stdexcept>

namespace hnsledger {
namespace ledger {

DeviceSettings DeviceSettings::FromConfig(const util::ConfigManager& config) {
    namespace ConfigKeys = util::ConfigKeys;

    DeviceSettings settings;

    std::string transport = config.GetString(ConfigKeys::TRANSPORT, "hid");
    if (transport == "hid") {
        settings.transport = TransportKind::Hid;
    } else if (transport == "tcp") {
        settings.transport = TransportKind::Tcp;
    } else {
        throw std::invalid_argument("Unknown transport '" + transport +
                                    "' (expected hid or tcp)");
    }

    settings.devicePath = config.GetString(ConfigKeys::DEVICE, "");
    settings.host = config.GetString(ConfigKeys::HOST, settings.host);

    if (config.HasKey(ConfigKeys::PORT)) {
        auto port = config.TryGetInt(ConfigKeys::PORT);
        if (!port || *port < 1 || *port > 65535) {
            throw std::invalid_argument("Invalid port: " +
                                        config.GetString(ConfigKeys::PORT, ""));
        }
        settings.port = static_cast<uint16_t>(*port);
    }

    if (config.HasKey(ConfigKeys::TIMEOUT)) {
        auto timeout = config.TryGetInt(ConfigKeys::TIMEOUT);
        if (!timeout || *timeout <= 0 || *timeout > std::numeric_limits<int>::max()) {
            throw std::invalid_argument("Invalid timeout: " +
                                        config.GetString(ConfigKeys::TIMEOUT, ""));
        }
        settings.timeout = std::chrono::milliseconds(*timeout);
    }

    settings.network = NetworkFromString(config.GetString(ConfigKeys::NETWORK, "main"));

    if (settings.transport == TransportKind::Hid && settings.devicePath.empty()) {
        throw std::invalid_argument("The hid transport requires a device path");
    }

    return settings;
}

std::unique_ptr<Transport> OpenTransport(const DeviceSettings& settings) {
    std::unique_ptr<Transport> transport;

    switch (settings.transport) {
        case TransportKind::Hid:
            transport = std::make_unique<HidTransport>(
                std::make_unique<HidrawChannel>(settings.devicePath));
            break;
        case TransportKind::Tcp:
            transport = std::make_unique<TcpTransport>(settings.host, settings.port);
            break;
    }

    transport->Configure(settings.timeout, util::LogCategory::DEVICE);
    transport->Open();

    LOG_INFO(util::LogCategory::DEVICE)
        << "Opened " << (settings.transport == TransportKind::Hid ? "hid" : "tcp")
        << " transport, timeout " << settings.timeout.count() << " ms";
    return transport;
}

} // namespace ledger
} // namespace hnsledger

// HNSLEDGER - Emulator TCP Transport
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// APDU transport for the Speculos emulator. Requests are a u32 BE length
// followed by the APDU; replies are a u32 BE length, that many data bytes,
// then the status word.

#ifndef HNSLEDGER_LEDGER_TCP_H
#define HNSLEDGER_LEDGER_TCP_H

#include "hnsledger/ledger/transport.h"

#include <cstdint>
#include <string>

namespace hnsledger {
namespace ledger {

constexpr uint16_t DEFAULT_EMULATOR_PORT = 9999;

/**
 * APDU transport to the Speculos emulator. An exchange that times out or
 * fails half way leaves its reply in flight, so the next exchange first
 * replaces the connection.
 */
class TcpTransport : public Transport {
public:
    TcpTransport(std::string host, uint16_t port);
    ~TcpTransport() override;

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    void Open() override;
    void Close() override;
    bool IsOpen() const override { return socket_ >= 0; }

    const std::string& GetHost() const { return host_; }
    uint16_t GetPort() const { return port_; }

    /// True after an interrupted exchange until the connection is replaced
    bool IsOutOfSync() const { return outOfSync_; }

protected:
    std::vector<uint8_t> DoExchange(const std::vector<uint8_t>& apdu,
                                    std::chrono::milliseconds timeout) override;

private:
    void SendAll(const std::vector<uint8_t>& data);
    std::vector<uint8_t> RecvExact(size_t len,
                                   std::chrono::steady_clock::time_point deadline);

    std::string host_;
    uint16_t port_;
    int socket_{-1};
    bool outOfSync_{false};
};

} // namespace ledger
} // namespace hnsledger

#endif // HNSLEDGER_LEDGER_TCP_H

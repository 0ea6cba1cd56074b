// HNSLEDGER - Emulator TCP Transport
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/ledger/tcp.h"

#include "hnsledger/core/serialize.h"
#include "hnsledger/ledger/apdu.h"
#include "hnsledger/ledger/error.h"
#include "hnsledger/util/logging.h"

#include <cerrno>
#include <cstring>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace hnsledger {
namespace ledger {

namespace {

/// Largest reply data the emulator can produce for one APDU
constexpr uint32_t MAX_REPLY_SIZE = 0x10000;

std::string ErrnoString(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // namespace

TcpTransport::TcpTransport(std::string host, uint16_t port)
    : host_(std::move(host)), port_(port) {}

TcpTransport::~TcpTransport() {
    Close();
}

void TcpTransport::Open() {
    if (IsOpen()) {
        return;
    }

    struct addrinfo hints{};
    struct addrinfo* res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string portStr = std::to_string(port_);
    int status = getaddrinfo(host_.c_str(), portStr.c_str(), &hints, &res);
    if (status != 0) {
        throw TransportError("Cannot resolve " + host_ + ": " + gai_strerror(status));
    }

    std::string lastError = "no addresses";
    for (struct addrinfo* p = res; p != nullptr; p = p->ai_next) {
        int fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (fd < 0) {
            lastError = std::strerror(errno);
            continue;
        }
        if (::connect(fd, p->ai_addr, p->ai_addrlen) == 0) {
            int opt = 1;
            setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
            socket_ = fd;
            break;
        }
        lastError = std::strerror(errno);
        ::close(fd);
    }
    freeaddrinfo(res);

    if (socket_ < 0) {
        throw TransportError("Cannot connect to " + host_ + ":" + portStr + ": " + lastError);
    }
    outOfSync_ = false;
    LOG_DEBUG(GetLogCategory()) << "Connected to emulator at " << host_ << ":" << port_;
}

void TcpTransport::Close() {
    if (socket_ < 0) {
        return;
    }
    shutdown(socket_, SHUT_RDWR);
    ::close(socket_);
    socket_ = -1;
}

void TcpTransport::SendAll(const std::vector<uint8_t>& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t sent = ::send(socket_, data.data() + offset, data.size() - offset,
                              MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransportError(ErrnoString("Send to emulator failed"));
        }
        offset += static_cast<size_t>(sent);
    }
}

std::vector<uint8_t> TcpTransport::RecvExact(size_t len,
                                             std::chrono::steady_clock::time_point deadline) {
    std::vector<uint8_t> out(len);
    size_t offset = 0;

    while (offset < len) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw TimeoutError("Emulator did not respond in time");
        }

        struct pollfd pfd;
        pfd.fd = socket_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, PollTimeout(remaining));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransportError(ErrnoString("poll on emulator socket failed"));
        }
        if (ready == 0) {
            continue;
        }

        ssize_t got = ::recv(socket_, out.data() + offset, len - offset, 0);
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransportError(ErrnoString("Receive from emulator failed"));
        }
        if (got == 0) {
            Close();
            throw TransportError("Emulator closed the connection");
        }
        offset += static_cast<size_t>(got);
    }
    return out;
}

std::vector<uint8_t> TcpTransport::DoExchange(const std::vector<uint8_t>& apdu,
                                              std::chrono::milliseconds timeout) {
    if (outOfSync_) {
        LOG_DEBUG(GetLogCategory()) << "Reconnecting to emulator after an interrupted exchange";
        Close();
        Open();
    }

    DataStream request;
    ser_writedata32be(request, static_cast<uint32_t>(apdu.size()));
    request.Write(apdu.data(), apdu.size());

    auto deadline = std::chrono::steady_clock::now() + timeout;

    try {
        SendAll(request.Data());

        DataStream header(RecvExact(4, deadline));
        uint32_t len = ser_readdata32be(header);
        if (len > MAX_REPLY_SIZE) {
            throw TransportError("Emulator reply length " + std::to_string(len) +
                                 " is implausible");
        }

        // The length covers the data only; the status word follows.
        return RecvExact(len + STATUS_WORD_SIZE, deadline);
    } catch (const LedgerError& e) {
        outOfSync_ = true;
        LOG_WARN(GetLogCategory()) << "Emulator exchange interrupted: " << e.what();
        throw;
    }
}

} // namespace ledger
} // namespace hnsledger

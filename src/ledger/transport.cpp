// HNSLEDGER - Device Transports
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/ledger/transport.h"

#include "hnsledger/core/hex.h"
#include "hnsledger/ledger/error.h"
#include "hnsledger/util/logging.h"

#include <limits>

namespace hnsledger {
namespace ledger {

namespace {

/// How long Drain() waits for each stale frame
constexpr std::chrono::milliseconds DRAIN_POLL{20};

} // namespace

int PollTimeout(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return 0;
    }
    if (timeout.count() > std::numeric_limits<int>::max()) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(timeout.count());
}

// ============================================================================
// Transport
// ============================================================================

Transport::Transport()
    : timeout_(DEFAULT_TIMEOUT), logCategory_(util::LogCategory::DEVICE) {}

void Transport::Configure(std::chrono::milliseconds timeout,
                          const std::string& logCategory) {
    timeout_ = timeout;
    logCategory_ = logCategory;
}

std::vector<uint8_t> Transport::Exchange(const std::vector<uint8_t>& apdu) {
    return Exchange(apdu, timeout_);
}

std::vector<uint8_t> Transport::Exchange(const std::vector<uint8_t>& apdu,
                                         std::chrono::milliseconds timeout) {
    if (!IsOpen()) {
        throw TransportError("Transport is not open");
    }

    LOG_TRACE(logCategory_) << "=> " << BytesToHex(apdu);
    std::vector<uint8_t> response = DoExchange(apdu, timeout);
    LOG_TRACE(logCategory_) << "<= " << BytesToHex(response);

    ++exchanges_;
    return response;
}

// ============================================================================
// HidTransport
// ============================================================================

HidTransport::HidTransport(std::unique_ptr<FrameChannel> channel)
    : channel_(std::move(channel)) {
    if (!channel_) {
        throw std::invalid_argument("HidTransport requires a frame channel");
    }
}

HidTransport::~HidTransport() {
    try {
        Close();
    } catch (const std::exception& e) {
        LOG_WARN(GetLogCategory()) << "Error closing HID transport: " << e.what();
    }
}

void HidTransport::Open() {
    channel_->Open();
    outOfSync_ = false;
}

void HidTransport::Close() {
    if (channel_->IsOpen()) {
        channel_->Close();
    }
}

bool HidTransport::IsOpen() const {
    return channel_->IsOpen();
}

size_t HidTransport::Drain() {
    size_t dropped = 0;
    while (channel_->Read(DRAIN_POLL)) {
        ++dropped;
    }
    if (dropped > 0) {
        LOG_DEBUG(GetLogCategory()) << "Drained " << dropped << " stale frame(s)";
    }
    outOfSync_ = false;
    return dropped;
}

void HidTransport::Ping(std::chrono::milliseconds timeout) {
    if (!IsOpen()) {
        throw TransportError("Transport is not open");
    }
    RoundTrip({}, FrameTag::Ping, timeout);
}

std::vector<uint8_t> HidTransport::DoExchange(const std::vector<uint8_t>& apdu,
                                              std::chrono::milliseconds timeout) {
    return RoundTrip(apdu, FrameTag::Apdu, timeout);
}

std::vector<uint8_t> HidTransport::RoundTrip(const std::vector<uint8_t>& message,
                                             FrameTag tag,
                                             std::chrono::milliseconds timeout) {
    if (outOfSync_) {
        Drain();
    }

    std::vector<Frame> frames = EncodeFrames(message, tag);
    try {
        for (const auto& frame : frames) {
            channel_->Write(frame);
        }
    } catch (const TransportError&) {
        // Part of the message may already be on the wire
        outOfSync_ = true;
        throw;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    FrameDecoder decoder(tag);

    try {
        while (!decoder.IsComplete()) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                throw TimeoutError("Device did not respond within " +
                                   std::to_string(timeout.count()) + " ms");
            }
            auto frame = channel_->Read(remaining);
            if (!frame) {
                continue;
            }
            LOG_TRACE(GetLogCategory()) << "frame " << BytesToHex(*frame);
            decoder.Push(*frame);
        }
    } catch (const FrameError& e) {
        outOfSync_ = true;
        LOG_WARN(GetLogCategory()) << "Framing error, resynchronizing: " << e.what();
        throw;
    } catch (const TimeoutError&) {
        outOfSync_ = true;
        throw;
    }

    return decoder.TakeMessage();
}

} // namespace ledger
} // namespace hnsledger

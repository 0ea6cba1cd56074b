// HNSLEDGER - Device Transports
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// A Transport carries one APDU to the device and returns its response.
// HidTransport does so over 64-byte HID frames through a FrameChannel.

#ifndef HNSLEDGER_LEDGER_TRANSPORT_H
#define HNSLEDGER_LEDGER_TRANSPORT_H

#include "hnsledger/ledger/frame.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hnsledger {
namespace ledger {

/// Default exchange timeout (5 minutes, room for on-screen confirmation)
constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{5 * 60 * 1000};

/// Timeout argument for poll(): negative values become 0, values above
/// INT_MAX are clamped to INT_MAX.
int PollTimeout(std::chrono::milliseconds timeout);

// ============================================================================
// Transport
// ============================================================================

class Transport {
public:
    virtual ~Transport() = default;

    virtual void Open() = 0;
    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;

    /// Exchange with the configured timeout
    std::vector<uint8_t> Exchange(const std::vector<uint8_t>& apdu);

    /**
     * Send one APDU and wait for its response (payload and status word).
     *
     * @throws TransportError if closed or on I/O failure
     * @throws TimeoutError if the response does not arrive in time
     * @throws FrameError on a malformed response
     */
    std::vector<uint8_t> Exchange(const std::vector<uint8_t>& apdu,
                                  std::chrono::milliseconds timeout);

    void Configure(std::chrono::milliseconds timeout, const std::string& logCategory);

    void SetTimeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }
    std::chrono::milliseconds GetTimeout() const { return timeout_; }

    const std::string& GetLogCategory() const { return logCategory_; }

    /// Exchanges completed since construction
    uint64_t GetExchangeCount() const { return exchanges_; }

    /**
     * Claim the channel for one device operation. Every engine sharing this
     * transport claims it first, so only one operation is in flight.
     *
     * @return false if another operation holds the claim
     */
    bool TryClaim() { return !claimed_.exchange(true); }
    void Release() { claimed_.store(false); }
    bool IsClaimed() const { return claimed_.load(); }

protected:
    Transport();

    virtual std::vector<uint8_t> DoExchange(const std::vector<uint8_t>& apdu,
                                            std::chrono::milliseconds timeout) = 0;

private:
    std::chrono::milliseconds timeout_;
    std::string logCategory_;
    uint64_t exchanges_{0};
    std::atomic<bool> claimed_{false};
};

// ============================================================================
// FrameChannel - raw HID report I/O
// ============================================================================

class FrameChannel {
public:
    virtual ~FrameChannel() = default;

    virtual void Open() = 0;
    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;

    /// Write one 64-byte frame. Throws TransportError on failure.
    virtual void Write(const Frame& frame) = 0;

    /// Next frame, or nullopt if none arrives within the timeout
    virtual std::optional<Frame> Read(std::chrono::milliseconds timeout) = 0;
};

// ============================================================================
// HidTransport
// ============================================================================

class HidTransport : public Transport {
public:
    explicit HidTransport(std::unique_ptr<FrameChannel> channel);
    ~HidTransport() override;

    void Open() override;
    void Close() override;
    bool IsOpen() const override;

    /**
     * Send a ping frame and wait for the echo.
     *
     * @throws TimeoutError if the device does not answer in time
     */
    void Ping(std::chrono::milliseconds timeout = std::chrono::milliseconds(1000));

    /// True after a timeout, framing error or failed write until the next drain
    bool IsOutOfSync() const { return outOfSync_; }

    /// Read and discard pending frames. Returns the number dropped.
    size_t Drain();

protected:
    std::vector<uint8_t> DoExchange(const std::vector<uint8_t>& apdu,
                                    std::chrono::milliseconds timeout) override;

private:
    std::vector<uint8_t> RoundTrip(const std::vector<uint8_t>& message, FrameTag tag,
                                   std::chrono::milliseconds timeout);

    std::unique_ptr<FrameChannel> channel_;
    bool outOfSync_{false};
};

} // namespace ledger
} // namespace hnsledger

#endif // HNSLEDGER_LEDGER_TRANSPORT_H

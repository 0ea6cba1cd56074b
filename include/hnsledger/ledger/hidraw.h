// HNSLEDGER - Linux hidraw Frame Channel
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#ifndef HNSLEDGER_LEDGER_HIDRAW_H
#define HNSLEDGER_LEDGER_HIDRAW_H

#include "hnsledger/ledger/transport.h"

#include <string>

namespace hnsledger {
namespace ledger {

/**
 * Frame channel over a /dev/hidrawN node. Writes carry a report id of 0 in
 * front of the 64-byte frame; reads use poll() for the deadline.
 */
class HidrawChannel : public FrameChannel {
public:
    explicit HidrawChannel(std::string devicePath);
    ~HidrawChannel() override;

    HidrawChannel(const HidrawChannel&) = delete;
    HidrawChannel& operator=(const HidrawChannel&) = delete;

    void Open() override;
    void Close() override;
    bool IsOpen() const override { return fd_ >= 0; }

    void Write(const Frame& frame) override;
    std::optional<Frame> Read(std::chrono::milliseconds timeout) override;

    const std::string& GetDevicePath() const { return devicePath_; }

private:
    std::string devicePath_;
    int fd_{-1};
};

} // namespace ledger
} // namespace hnsledger

#endif // HNSLEDGER_LEDGER_HIDRAW_H

// HNSLEDGER - Linux hidraw Frame Channel
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/ledger/hidraw.h"

#include "hnsledger/ledger/error.h"
#include "hnsledger/util/logging.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace hnsledger {
namespace ledger {

namespace {

std::string ErrnoString(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // namespace

HidrawChannel::HidrawChannel(std::string devicePath)
    : devicePath_(std::move(devicePath)) {}

HidrawChannel::~HidrawChannel() {
    Close();
}

void HidrawChannel::Open() {
    if (IsOpen()) {
        return;
    }
    if (devicePath_.empty()) {
        throw TransportError("No hidraw device configured");
    }

    fd_ = ::open(devicePath_.c_str(), O_RDWR | O_CLOEXEC);
    if (fd_ < 0) {
        throw TransportError(ErrnoString("Cannot open " + devicePath_));
    }
    LOG_DEBUG(util::LogCategory::DEVICE) << "Opened " << devicePath_;
}

void HidrawChannel::Close() {
    if (fd_ < 0) {
        return;
    }
    ::close(fd_);
    fd_ = -1;
    LOG_DEBUG(util::LogCategory::DEVICE) << "Closed " << devicePath_;
}

void HidrawChannel::Write(const Frame& frame) {
    if (!IsOpen()) {
        throw TransportError("hidraw device is not open");
    }

    // Report id 0, then the frame
    std::vector<uint8_t> report;
    report.reserve(frame.size() + 1);
    report.push_back(0x00);
    report.insert(report.end(), frame.begin(), frame.end());

    ssize_t written;
    do {
        written = ::write(fd_, report.data(), report.size());
    } while (written < 0 && errno == EINTR);

    if (written < 0) {
        throw TransportError(ErrnoString("Write to " + devicePath_ + " failed"));
    }
    if (static_cast<size_t>(written) != report.size()) {
        throw TransportError("Short write to " + devicePath_);
    }
}

std::optional<Frame> HidrawChannel::Read(std::chrono::milliseconds timeout) {
    if (!IsOpen()) {
        throw TransportError("hidraw device is not open");
    }

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ready;
    do {
        ready = poll(&pfd, 1, PollTimeout(timeout));
    } while (ready < 0 && errno == EINTR);

    if (ready < 0) {
        throw TransportError(ErrnoString("poll on " + devicePath_ + " failed"));
    }
    if (ready == 0) {
        return std::nullopt;
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        throw TransportError("Device " + devicePath_ + " disconnected");
    }

    Frame frame(FRAME_SIZE);
    ssize_t got = ::read(fd_, frame.data(), frame.size());
    if (got < 0) {
        throw TransportError(ErrnoString("Read from " + devicePath_ + " failed"));
    }
    frame.resize(static_cast<size_t>(got));
    return frame;
}

} // namespace ledger
} // namespace hnsledger

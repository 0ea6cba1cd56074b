// HNSLEDGER - HID Frame Codec
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/ledger/frame.h"

#include "hnsledger/core/serialize.h"
#include "hnsledger/ledger/error.h"

#include <algorithm>
#include <string>

namespace hnsledger {
namespace ledger {

// ============================================================================
// Encoding
// ============================================================================

std::vector<Frame> EncodeFrames(const std::vector<uint8_t>& message, FrameTag tag) {
    if (message.size() > MAX_FRAMED_MESSAGE) {
        throw FrameError("Message of " + std::to_string(message.size()) +
                         " bytes exceeds the frame length field");
    }

    std::vector<Frame> frames;
    size_t offset = 0;
    uint16_t sequence = 0;

    do {
        DataStream ss;
        ss.reserve(FRAME_SIZE);
        ser_writedata16be(ss, CHANNEL_ID);
        ser_writedata8(ss, static_cast<uint8_t>(tag));
        ser_writedata16be(ss, sequence);
        if (sequence == 0) {
            ser_writedata16be(ss, static_cast<uint16_t>(message.size()));
        }

        size_t room = FRAME_SIZE - ss.size();
        size_t chunk = std::min(room, message.size() - offset);
        ss.Write(message.data() + offset, chunk);
        offset += chunk;

        Frame frame(ss.data(), ss.data() + ss.size());
        frame.resize(FRAME_SIZE, 0);
        frames.push_back(std::move(frame));
        ++sequence;
    } while (offset < message.size());

    return frames;
}

std::vector<uint8_t> DecodeFrames(const std::vector<Frame>& frames, FrameTag tag) {
    FrameDecoder decoder(tag);
    for (const auto& frame : frames) {
        if (decoder.IsComplete()) {
            throw FrameError("Unexpected frame after message completed");
        }
        decoder.Push(frame);
    }
    return decoder.TakeMessage();
}

// ============================================================================
// FrameDecoder
// ============================================================================

bool FrameDecoder::Push(const uint8_t* data, size_t len) {
    if (IsComplete()) {
        throw FrameError("Unexpected frame after message completed");
    }

    size_t header = (sequence_ == 0) ? FIRST_FRAME_HEADER_SIZE : FRAME_HEADER_SIZE;
    if (len < header) {
        throw FrameError("Frame of " + std::to_string(len) +
                         " bytes is shorter than its header");
    }

    DataStream ss;
    ss.Write(data, len);

    uint16_t channel = ser_readdata16be(ss);
    if (channel != CHANNEL_ID) {
        throw FrameError("Unexpected channel id " + std::to_string(channel));
    }

    uint8_t tag = ser_readdata8(ss);
    if (tag != static_cast<uint8_t>(tag_)) {
        throw FrameError("Unexpected frame tag " + std::to_string(tag));
    }

    uint16_t sequence = ser_readdata16be(ss);
    if (sequence != sequence_) {
        throw FrameError("Out of order frame: expected sequence " +
                         std::to_string(sequence_) + ", got " +
                         std::to_string(sequence));
    }

    if (sequence_ == 0) {
        total_ = ser_readdata16be(ss);
        message_.reserve(*total_);
    }

    // Everything past the declared length is padding.
    size_t chunk = std::min(ss.size(), *total_ - message_.size());
    message_.insert(message_.end(), ss.data(), ss.data() + chunk);
    ++sequence_;

    return IsComplete();
}

std::vector<uint8_t> FrameDecoder::TakeMessage() {
    if (!IsComplete()) {
        if (!total_) {
            throw FrameError("No frames received");
        }
        throw FrameError("Declared length " + std::to_string(*total_) +
                         " not satisfied, received " +
                         std::to_string(message_.size()) + " bytes");
    }
    std::vector<uint8_t> out = std::move(message_);
    Reset();
    return out;
}

void FrameDecoder::Reset() {
    sequence_ = 0;
    total_.reset();
    message_.clear();
}

} // namespace ledger
} // namespace hnsledger

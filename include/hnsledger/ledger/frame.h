// HNSLEDGER - HID Frame Codec
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// Messages travel over HID as fixed 64-byte frames:
//
//   channel id (u16 BE) | tag (u8) | sequence (u16 BE) | payload
//
// The first frame (sequence 0) puts the total message length (u16 BE) in
// front of the payload. The last frame is zero-padded.

#ifndef HNSLEDGER_LEDGER_FRAME_H
#define HNSLEDGER_LEDGER_FRAME_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace hnsledger {
namespace ledger {

constexpr uint16_t CHANNEL_ID = 0x0101;

/// Size of one HID report
constexpr size_t FRAME_SIZE = 64;

/// channel id + tag + sequence
constexpr size_t FRAME_HEADER_SIZE = 5;

/// Header plus the total length field of the first frame
constexpr size_t FIRST_FRAME_HEADER_SIZE = FRAME_HEADER_SIZE + 2;

/// Largest message the length field can describe
constexpr size_t MAX_FRAMED_MESSAGE = 0xffff;

enum class FrameTag : uint8_t {
    Ping = 0x02,
    Apdu = 0x05,
};

using Frame = std::vector<uint8_t>;

/**
 * Split a message into 64-byte frames. An empty message still produces one
 * frame carrying a zero length.
 *
 * @throws FrameError if the message does not fit the length field
 */
std::vector<Frame> EncodeFrames(const std::vector<uint8_t>& message,
                                FrameTag tag = FrameTag::Apdu);

/**
 * Reassemble a message from every frame of one response.
 *
 * @throws FrameError on a short frame, a foreign channel or tag, a sequence
 *         gap, a length that is never satisfied, or frames left over
 */
std::vector<uint8_t> DecodeFrames(const std::vector<Frame>& frames,
                                  FrameTag tag = FrameTag::Apdu);

/// Reassembles a message one frame at a time as reports arrive.
class FrameDecoder {
public:
    explicit FrameDecoder(FrameTag tag = FrameTag::Apdu) : tag_(tag) {}

    /**
     * Consume one frame.
     *
     * @return true once the declared length has been received
     * @throws FrameError if the frame does not continue the message
     */
    bool Push(const uint8_t* data, size_t len);
    bool Push(const Frame& frame) { return Push(frame.data(), frame.size()); }

    bool IsComplete() const { return total_.has_value() && message_.size() == *total_; }

    /// Declared length, known after the first frame
    std::optional<size_t> GetTotalLength() const { return total_; }

    size_t GetFrameCount() const { return sequence_; }

    const std::vector<uint8_t>& GetMessage() const { return message_; }

    /// Move the reassembled message out. Throws FrameError if incomplete.
    std::vector<uint8_t> TakeMessage();

    void Reset();

private:
    FrameTag tag_;
    uint16_t sequence_{0};
    std::optional<size_t> total_;
    std::vector<uint8_t> message_;
};

} // namespace ledger
} // namespace hnsledger

#endif // HNSLEDGER_LEDGER_FRAME_H

// HNSLEDGER - APDU Command and Response Codec
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/ledger/apdu.h"

#include "hnsledger/core/serialize.h"
#include "hnsledger/ledger/error.h"
#include "hnsledger/ledger/status.h"

namespace hnsledger {
namespace ledger {

namespace {

constexpr uint8_t P1_FIRST = 0x01;
constexpr uint8_t P1_CONTINUATION = 0x00;
constexpr uint8_t P1_CONFIRM = 0x01;

constexpr uint8_t P2_XPUB = 0x01;
constexpr uint8_t P2_ADDRESS = 0x02;
constexpr uint8_t P2_PARSE = 0x00;
constexpr uint8_t P2_SIGN = 0x01;

template<typename Stream>
void WriteU32(Stream& s, uint32_t value, ByteOrder order) {
    if (order == ByteOrder::Big) {
        ser_writedata32be(s, value);
    } else {
        ser_writedata32(s, value);
    }
}

template<typename Stream>
void WriteU64(Stream& s, uint64_t value, ByteOrder order) {
    if (order == ByteOrder::Big) {
        ser_writedata32be(s, static_cast<uint32_t>(value >> 32));
        ser_writedata32be(s, static_cast<uint32_t>(value));
    } else {
        ser_writedata64(s, value);
    }
}

template<typename Stream>
void WritePath(Stream& s, const DerivationPath& path, ByteOrder order) {
    CheckPathDepth(path);
    ser_writedata8(s, static_cast<uint8_t>(path.Depth()));
    for (uint32_t index : path.GetIndices()) {
        WriteU32(s, index, order);
    }
}

void RequireChunk(const std::vector<uint8_t>& chunk) {
    if (chunk.empty()) {
        throw UsageError("Command chunk must not be empty");
    }
}

std::vector<uint8_t> ToBytes(const DataStream& ss) {
    return std::vector<uint8_t>(ss.data(), ss.data() + ss.size());
}

/// Payload of a successful response, which must be exactly `expected` long
std::vector<uint8_t> CheckPayload(const std::vector<uint8_t>& raw, size_t expected,
                                  const char* what) {
    std::vector<uint8_t> payload = ApduResponse::CheckSuccess(raw);
    if (payload.size() != expected) {
        throw ProtocolError(std::string(what) + " response has " +
                            std::to_string(payload.size()) + " bytes, expected " +
                            std::to_string(expected));
    }
    return payload;
}

} // namespace

const char* ChunkPositionToString(ChunkPosition position) {
    return position == ChunkPosition::First ? "first" : "continuation";
}

const char* ResponseShapeToString(ResponseShape shape) {
    return shape == ResponseShape::Ack ? "ack" : "result";
}

// ============================================================================
// Paths
// ============================================================================

void CheckPathDepth(const DerivationPath& path) {
    if (path.Depth() > MAX_DEPTH) {
        throw UsageError("Derivation path depth " + std::to_string(path.Depth()) +
                         " exceeds maximum of " + std::to_string(MAX_DEPTH));
    }
}

DerivationPath ParsePath(const std::string& path) {
    auto parsed = DerivationPath::FromString(path);
    if (!parsed) {
        throw UsageError("Invalid derivation path: '" + path + "'");
    }
    CheckPathDepth(*parsed);
    return *parsed;
}

std::string FormatPath(const DerivationPath& path) {
    return path.ToString();
}

// ============================================================================
// ApduCommand
// ============================================================================

ApduCommand::ApduCommand(uint8_t cla, uint8_t ins, uint8_t p1, uint8_t p2,
                         std::vector<uint8_t> data)
    : cla_(cla), ins_(ins), p1_(p1), p2_(p2), data_(std::move(data)) {
    if (data_.size() > MAX_APDU_DATA) {
        throw UsageError("APDU data of " + std::to_string(data_.size()) +
                         " bytes exceeds maximum of " + std::to_string(MAX_APDU_DATA));
    }
}

std::vector<uint8_t> ApduCommand::Encode() const {
    std::vector<uint8_t> raw;
    raw.reserve(5 + data_.size());
    raw.push_back(cla_);
    raw.push_back(ins_);
    raw.push_back(p1_);
    raw.push_back(p2_);
    raw.push_back(static_cast<uint8_t>(data_.size()));
    raw.insert(raw.end(), data_.begin(), data_.end());
    return raw;
}

ApduCommand ApduCommand::GetAppVersion() {
    return ApduCommand(CLA_GENERAL, Ins::GET_APP_VERSION, 0x00, 0x00);
}

ApduCommand ApduCommand::GetPublicKey(const DerivationPath& path,
                                      const PublicKeyOptions& options,
                                      const WireContract& contract) {
    uint8_t p1 = options.confirm ? P1_CONFIRM : 0x00;

    uint8_t p2 = static_cast<uint8_t>(static_cast<uint8_t>(options.network) << 2);
    if (options.xpub) p2 |= P2_XPUB;
    if (options.address) p2 |= P2_ADDRESS;

    DataStream ss;
    WritePath(ss, path, contract.pathOrder);

    return ApduCommand(CLA_GENERAL, Ins::GET_PUBLIC_KEY, p1, p2, ToBytes(ss));
}

ApduCommand ApduCommand::ParseTransaction(const std::vector<uint8_t>& chunk,
                                          ChunkPosition position) {
    RequireChunk(chunk);
    uint8_t p1 = (position == ChunkPosition::First) ? P1_FIRST : P1_CONTINUATION;
    return ApduCommand(CLA_GENERAL, Ins::GET_INPUT_SIGNATURE, p1, P2_PARSE, chunk);
}

ApduCommand ApduCommand::GetInputSignature(const InputSigningHeader& header,
                                           const std::vector<uint8_t>& chunk,
                                           const WireContract& contract) {
    RequireChunk(chunk);

    if (!contract.AllowsSighash(header.sighashType)) {
        throw UsageError("Sighash type " + std::to_string(header.sighashType) +
                         " is not supported by the device");
    }
    if (!MoneyRange(header.value)) {
        throw UsageError("Coin value out of range");
    }

    DataStream ss;
    WritePath(ss, header.path, contract.pathOrder);
    Serialize(ss, header.prevout.hash);
    WriteU32(ss, header.prevout.index, contract.fieldOrder);
    WriteU64(ss, static_cast<uint64_t>(header.value), contract.fieldOrder);
    WriteU32(ss, header.sequence, contract.fieldOrder);
    WriteU32(ss, header.sighashType, contract.fieldOrder);
    ss.Write(chunk.data(), chunk.size());

    return ApduCommand(CLA_GENERAL, Ins::GET_INPUT_SIGNATURE, P1_FIRST, P2_SIGN,
                       ToBytes(ss));
}

ApduCommand ApduCommand::GetInputSignatureContinuation(const std::vector<uint8_t>& chunk) {
    RequireChunk(chunk);
    return ApduCommand(CLA_GENERAL, Ins::GET_INPUT_SIGNATURE, P1_CONTINUATION, P2_SIGN,
                       chunk);
}

// ============================================================================
// ApduResponse
// ============================================================================

namespace ApduResponse {

uint16_t ReadStatusWord(const std::vector<uint8_t>& raw) {
    if (raw.size() < STATUS_WORD_SIZE) {
        throw ProtocolError("Response of " + std::to_string(raw.size()) +
                            " bytes has no status word");
    }
    return static_cast<uint16_t>((raw[raw.size() - 2] << 8) | raw[raw.size() - 1]);
}

std::vector<uint8_t> CheckSuccess(const std::vector<uint8_t>& raw) {
    uint16_t sw = ReadStatusWord(raw);
    if (sw != StatusWord::SUCCESS) {
        throw DeviceError::FromStatusWord(sw);
    }
    return std::vector<uint8_t>(raw.begin(), raw.end() - STATUS_WORD_SIZE);
}

std::string ParseAppVersion(const std::vector<uint8_t>& raw) {
    std::vector<uint8_t> payload = CheckPayload(raw, 3, "App version");
    return AppVersion(payload[0], payload[1], payload[2]).ToString();
}

PublicKeyResult ParsePublicKey(const std::vector<uint8_t>& raw,
                               const PublicKeyOptions& options) {
    std::vector<uint8_t> payload = CheckSuccess(raw);

    size_t fixed = PublicKey::COMPRESSED_SIZE;
    if (options.xpub) {
        fixed += CHAIN_CODE_SIZE + 4;
    }
    size_t expected = fixed;
    if (options.address) {
        if (payload.size() <= fixed) {
            throw ProtocolError("Public key response is missing the address");
        }
        expected += 1 + payload[fixed];
    }
    if (payload.size() != expected) {
        throw ProtocolError("Public key response has " + std::to_string(payload.size()) +
                            " bytes, expected " + std::to_string(expected));
    }

    DataStream ss(std::move(payload));
    PublicKeyResult result;

    result.publicKey = PublicKey(ss.ReadBytes(PublicKey::COMPRESSED_SIZE));
    if (!result.publicKey.IsFullyFormed()) {
        throw ProtocolError("Device returned a malformed public key");
    }

    if (options.xpub) {
        result.chainCode = ss.ReadBytes(CHAIN_CODE_SIZE);
        result.parentFingerprint = ser_readdata32be(ss);
    }

    if (options.address) {
        uint8_t len = ser_readdata8(ss);
        std::vector<uint8_t> ascii = ss.ReadBytes(len);
        result.address = std::string(ascii.begin(), ascii.end());
    }

    return result;
}

void ParseAck(const std::vector<uint8_t>& raw) {
    CheckPayload(raw, 0, "Acknowledgement");
}

std::vector<uint8_t> ParseSignature(const std::vector<uint8_t>& raw) {
    return CheckPayload(raw, SIGNATURE_SIZE, "Signature");
}

std::vector<uint8_t> ParseInputSignature(const std::vector<uint8_t>& raw,
                                         ResponseShape shape) {
    if (shape == ResponseShape::Ack) {
        ParseAck(raw);
        return {};
    }
    return ParseSignature(raw);
}

} // namespace ApduResponse

} // namespace ledger
} // namespace hnsledger

// HNSLEDGER - APDU Command and Response Codec
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// Commands: cla | ins | p1 | p2 | lc | data (at most 255 bytes)
// Responses: payload | status word (u16 BE)

#ifndef HNSLEDGER_LEDGER_APDU_H
#define HNSLEDGER_LEDGER_APDU_H

#include "hnsledger/core/address.h"
#include "hnsledger/core/transaction.h"
#include "hnsledger/crypto/keys.h"
#include "hnsledger/ledger/contract.h"
#include "hnsledger/wallet/path.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hnsledger {
namespace ledger {

// ============================================================================
// Constants
// ============================================================================

constexpr uint8_t CLA_GENERAL = 0xe0;

namespace Ins {
    constexpr uint8_t GET_APP_VERSION = 0x40;
    constexpr uint8_t GET_PUBLIC_KEY = 0x42;
    constexpr uint8_t GET_INPUT_SIGNATURE = 0x44;
}

/// Deepest derivation path the app accepts
constexpr size_t MAX_DEPTH = 10;

/// Largest command data field
constexpr size_t MAX_APDU_DATA = 255;

/// Chunk size for the streamed transaction
constexpr size_t MAX_TX_PACKET = 255;

/// Chunk size for the script of an input signature request
constexpr size_t MAX_SCRIPT_PACKET = 128;

/// Status word size at the end of every response
constexpr size_t STATUS_WORD_SIZE = 2;

/// 64-byte signature followed by the sighash type byte
constexpr size_t SIGNATURE_SIZE = 65;

constexpr size_t CHAIN_CODE_SIZE = 32;

/// Position of a chunk in a multi-command message
enum class ChunkPosition {
    First,
    Continuation,
};

/// What a successful response must carry
enum class ResponseShape {
    Ack,      // status word only
    Result,   // a payload
};

const char* ChunkPositionToString(ChunkPosition position);
const char* ResponseShapeToString(ResponseShape shape);

// ============================================================================
// Request Parameters
// ============================================================================

struct PublicKeyOptions {
    /// Show the key or address on screen and wait for approval
    bool confirm{false};
    /// Also return chain code and parent fingerprint
    bool xpub{false};
    /// Also return the bech32 address
    bool address{false};
    NetworkType network{NetworkType::Main};
};

struct PublicKeyResult {
    PublicKey publicKey;
    std::optional<std::vector<uint8_t>> chainCode;
    std::optional<uint32_t> parentFingerprint;
    std::optional<std::string> address;
};

/// Fields the first signature chunk carries ahead of the script
struct InputSigningHeader {
    DerivationPath path;
    Outpoint prevout;
    Amount value{0};
    uint32_t sequence{Input::SEQUENCE_FINAL};
    uint32_t sighashType{SIGHASH_ALL};
};

/**
 * Parse a textual derivation path for the device.
 *
 * @throws UsageError if the path is malformed or deeper than MAX_DEPTH
 */
DerivationPath ParsePath(const std::string& path);

std::string FormatPath(const DerivationPath& path);

/// Throws UsageError if the path is deeper than MAX_DEPTH
void CheckPathDepth(const DerivationPath& path);

// ============================================================================
// ApduCommand
// ============================================================================

class ApduCommand {
public:
    ApduCommand(uint8_t cla, uint8_t ins, uint8_t p1, uint8_t p2,
                std::vector<uint8_t> data = {});

    uint8_t GetCla() const { return cla_; }
    uint8_t GetIns() const { return ins_; }
    uint8_t GetP1() const { return p1_; }
    uint8_t GetP2() const { return p2_; }
    const std::vector<uint8_t>& GetData() const { return data_; }

    /// Raw command bytes
    std::vector<uint8_t> Encode() const;

    static ApduCommand GetAppVersion();

    static ApduCommand GetPublicKey(const DerivationPath& path,
                                    const PublicKeyOptions& options,
                                    const WireContract& contract = WireContract::Latest());

    /// One chunk of the serialized transaction
    static ApduCommand ParseTransaction(const std::vector<uint8_t>& chunk,
                                        ChunkPosition position);

    /// First signature chunk: header fields, then the script chunk
    static ApduCommand GetInputSignature(const InputSigningHeader& header,
                                         const std::vector<uint8_t>& chunk,
                                         const WireContract& contract = WireContract::Latest());

    /// Later signature chunks carry script bytes only
    static ApduCommand GetInputSignatureContinuation(const std::vector<uint8_t>& chunk);

private:
    uint8_t cla_;
    uint8_t ins_;
    uint8_t p1_;
    uint8_t p2_;
    std::vector<uint8_t> data_;
};

// ============================================================================
// ApduResponse
// ============================================================================

namespace ApduResponse {

/// Trailing status word. Throws ProtocolError if the response is too short.
uint16_t ReadStatusWord(const std::vector<uint8_t>& raw);

/// Payload of a successful response. Throws DeviceError for any other status.
std::vector<uint8_t> CheckSuccess(const std::vector<uint8_t>& raw);

/// "major.minor.patch"
std::string ParseAppVersion(const std::vector<uint8_t>& raw);

PublicKeyResult ParsePublicKey(const std::vector<uint8_t>& raw,
                               const PublicKeyOptions& options);

/// Status word only
void ParseAck(const std::vector<uint8_t>& raw);

/// 65-byte signature
std::vector<uint8_t> ParseSignature(const std::vector<uint8_t>& raw);

/// Ack or signature depending on the expected shape; empty for Ack
std::vector<uint8_t> ParseInputSignature(const std::vector<uint8_t>& raw,
                                         ResponseShape shape);

} // namespace ApduResponse

} // namespace ledger
} // namespace hnsledger

#endif // HNSLEDGER_LEDGER_APDU_H

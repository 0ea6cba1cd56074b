// HNSLEDGER - Device Protocol Engine
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include "hnsledger/ledger/client.h"

#include "hnsledger/core/serialize.h"
#include "hnsledger/ledger/error.h"
#include "hnsledger/util/logging.h"

#include <algorithm>

namespace hnsledger {
namespace ledger {

const char* EngineStateToString(EngineState state) {
    switch (state) {
        case EngineState::Idle:           return "idle";
        case EngineState::Sending:        return "sending";
        case EngineState::AwaitingAck:    return "awaiting-ack";
        case EngineState::AwaitingResult: return "awaiting-result";
        case EngineState::Error:          return "error";
    }
    return "unknown";
}

// ============================================================================
// OperationGuard
// ============================================================================

LedgerClient::OperationGuard::OperationGuard(LedgerClient& client, const char* operation)
    : client_(client), operation_(operation) {
    if (client_.busy_.exchange(true)) {
        throw UsageError(std::string("Cannot start ") + operation +
                         ": another device operation is in progress");
    }
    if (!client_.transport_.TryClaim()) {
        client_.busy_.store(false);
        throw UsageError(std::string("Cannot start ") + operation +
                         ": the device channel is held by another operation");
    }
    client_.state_.store(EngineState::Idle);
    LOG_DEBUG(util::LogCategory::LEDGER) << operation_ << ": start";
}

LedgerClient::OperationGuard::~OperationGuard() {
    if (completed_) {
        client_.state_.store(EngineState::Idle);
        LOG_DEBUG(util::LogCategory::LEDGER) << operation_ << ": done";
    } else {
        client_.state_.store(EngineState::Error);
        LOG_WARN(util::LogCategory::LEDGER) << operation_ << ": aborted";
    }
    client_.transport_.Release();
    client_.busy_.store(false);
}

// ============================================================================
// LedgerClient
// ============================================================================

LedgerClient::LedgerClient(Transport& transport, NetworkType network)
    : transport_(transport),
      network_(network),
      contract_(&WireContract::Latest()) {}

std::vector<uint8_t> LedgerClient::Exchange(const ApduCommand& command,
                                            ResponseShape shape) {
    state_.store(EngineState::Sending);
    std::vector<uint8_t> raw = command.Encode();

    state_.store(shape == ResponseShape::Ack ? EngineState::AwaitingAck
                                             : EngineState::AwaitingResult);
    try {
        return transport_.Exchange(raw);
    } catch (const LedgerError& e) {
        LOG_ERROR(util::LogCategory::LEDGER)
            << "Exchange failed (" << ErrorCategoryToString(e.GetCategory())
            << "): " << e.what();
        throw;
    }
}

std::string LedgerClient::GetAppVersion() {
    ApduCommand command = ApduCommand::GetAppVersion();

    OperationGuard guard(*this, "GetAppVersion");
    std::string version = ApduResponse::ParseAppVersion(
        Exchange(command, ResponseShape::Result));
    guard.Complete();

    LOG_DEBUG(util::LogCategory::LEDGER) << "App version " << version;
    return version;
}

PublicKeyResult LedgerClient::GetPublicKey(const DerivationPath& path,
                                           PublicKeyOptions options) {
    options.network = network_;
    ApduCommand command = ApduCommand::GetPublicKey(path, options, *contract_);

    OperationGuard guard(*this, "GetPublicKey");
    PublicKeyResult result = ApduResponse::ParsePublicKey(
        Exchange(command, ResponseShape::Result), options);
    guard.Complete();

    return result;
}

PublicKeyResult LedgerClient::GetPublicKey(const std::string& path,
                                           PublicKeyOptions options) {
    return GetPublicKey(ParsePath(path), options);
}

void LedgerClient::StreamTransaction(const MutableTransaction& mtx) {
    if (mtx.inputs.empty()) {
        throw UsageError("Cannot stream a transaction without inputs");
    }

    std::vector<ApduCommand> commands;
    auto chunks = SplitBuffer(SerializeTxPreamble(mtx), MAX_TX_PACKET);
    for (size_t i = 0; i < chunks.size(); ++i) {
        commands.push_back(ApduCommand::ParseTransaction(
            chunks[i], i == 0 ? ChunkPosition::First : ChunkPosition::Continuation));
    }

    OperationGuard guard(*this, "StreamTransaction");
    HNSLEDGER_LOG_TIMER(util::LogCategory::LEDGER, "StreamTransaction");

    for (size_t i = 0; i < commands.size(); ++i) {
        LOG_TRACE(util::LogCategory::APDU)
            << "tx chunk " << (i + 1) << "/" << commands.size();
        ApduResponse::ParseAck(Exchange(commands[i], ResponseShape::Ack));
    }
    guard.Complete();
}

std::vector<uint8_t> LedgerClient::GetInputSignature(const LedgerInput& input,
                                                     const Input& rawInput) {
    if (rawInput.prevout != input.GetOutpoint()) {
        throw UsageError("Input " + rawInput.prevout.ToString() +
                         " does not spend coin " + input.GetOutpoint().ToString());
    }

    // The device reads the script as a varbytes field.
    DataStream ss;
    Serialize(ss, input.GetPrevRedeem());
    std::vector<uint8_t> script(ss.data(), ss.data() + ss.size());

    InputSigningHeader header;
    header.path = input.GetPath();
    header.prevout = rawInput.prevout;
    header.value = input.GetCoin().value;
    header.sequence = rawInput.sequence;
    header.sighashType = input.GetSighashType();

    auto chunks = SplitBuffer(script, MAX_SCRIPT_PACKET);
    std::vector<ApduCommand> commands;
    commands.push_back(ApduCommand::GetInputSignature(header, chunks.front(), *contract_));
    for (size_t i = 1; i < chunks.size(); ++i) {
        commands.push_back(ApduCommand::GetInputSignatureContinuation(chunks[i]));
    }

    OperationGuard guard(*this, "GetInputSignature");

    std::vector<uint8_t> signature;
    for (size_t i = 0; i < commands.size(); ++i) {
        ResponseShape shape = ExpectedShape(i, commands.size());
        signature = ApduResponse::ParseInputSignature(Exchange(commands[i], shape), shape);
    }
    guard.Complete();

    LOG_DEBUG(util::LogCategory::LEDGER)
        << "Signed input " << rawInput.prevout.ToString() << " in "
        << commands.size() << " exchange(s)";
    return signature;
}

// ============================================================================
// Helpers
// ============================================================================

std::vector<uint8_t> LedgerClient::SerializeTxPreamble(const MutableTransaction& mtx) {
    DataStream ss;
    ser_writedata32(ss, mtx.version);
    ser_writedata32(ss, mtx.locktime);
    WriteCompactSize(ss, mtx.inputs.size());
    WriteCompactSize(ss, mtx.outputs.size());
    WriteCompactSize(ss, mtx.GetOutputsSize());

    for (const auto& input : mtx.inputs) {
        Serialize(ss, input.prevout);
        ser_writedata32(ss, input.sequence);
    }

    for (const auto& output : mtx.outputs) {
        Serialize(ss, output);
    }

    return std::vector<uint8_t>(ss.data(), ss.data() + ss.size());
}

std::vector<std::vector<uint8_t>> LedgerClient::SplitBuffer(const std::vector<uint8_t>& data,
                                                            size_t size) {
    std::vector<std::vector<uint8_t>> chunks;
    for (size_t offset = 0; offset < data.size(); offset += size) {
        size_t len = std::min(size, data.size() - offset);
        chunks.emplace_back(data.begin() + offset, data.begin() + offset + len);
    }
    return chunks;
}

ResponseShape LedgerClient::ExpectedShape(size_t chunkIndex, size_t chunkCount) {
    return chunkIndex + 1 == chunkCount ? ResponseShape::Result : ResponseShape::Ack;
}

} // namespace ledger
} // namespace hnsledger

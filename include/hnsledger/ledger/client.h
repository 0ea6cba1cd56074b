// HNSLEDGER - Device Protocol Engine
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License
//
// Drives the Handshake device app one APDU at a time: version and public
// key queries, streaming the transaction, and per-input signature requests.

#ifndef HNSLEDGER_LEDGER_CLIENT_H
#define HNSLEDGER_LEDGER_CLIENT_H

#include "hnsledger/core/transaction.h"
#include "hnsledger/ledger/apdu.h"
#include "hnsledger/ledger/contract.h"
#include "hnsledger/ledger/input.h"
#include "hnsledger/ledger/transport.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace hnsledger {
namespace ledger {

enum class EngineState {
    Idle,
    Sending,
    AwaitingAck,
    AwaitingResult,
    Error,
};

const char* EngineStateToString(EngineState state);

/**
 * Protocol engine over one transport. Only one operation may be in flight
 * on the transport, whichever engine started it; starting another while one
 * is outstanding raises UsageError before the transport is touched. A failed
 * operation leaves the engine in the Error state until the next operation
 * starts.
 */
class LedgerClient {
public:
    explicit LedgerClient(Transport& transport,
                          NetworkType network = NetworkType::Main);

    LedgerClient(const LedgerClient&) = delete;
    LedgerClient& operator=(const LedgerClient&) = delete;

    /// "major.minor.patch"
    std::string GetAppVersion();

    /// The options' network is replaced by the client's network.
    PublicKeyResult GetPublicKey(const DerivationPath& path,
                                 PublicKeyOptions options = PublicKeyOptions());
    PublicKeyResult GetPublicKey(const std::string& path,
                                 PublicKeyOptions options = PublicKeyOptions());

    /**
     * Send the transaction preamble the device hashes for every input.
     * Each chunk must be acknowledged; the first failure stops the stream.
     *
     * @throws UsageError if the transaction has no inputs
     */
    void StreamTransaction(const MutableTransaction& mtx);

    /**
     * Request the signature for one input. The transaction must have been
     * streamed first.
     *
     * @param input Signing data for the input
     * @param rawInput The transaction input being signed
     * @return 65-byte signature (64 bytes plus sighash type)
     * @throws UsageError if rawInput does not spend the input's coin
     */
    std::vector<uint8_t> GetInputSignature(const LedgerInput& input,
                                           const Input& rawInput);

    void SetContract(const WireContract& contract) { contract_ = &contract; }
    const WireContract& GetContract() const { return *contract_; }

    NetworkType GetNetwork() const { return network_; }
    EngineState GetState() const { return state_.load(); }
    bool IsBusy() const { return busy_.load(); }

    Transport& GetTransport() { return transport_; }

    // ------------------------------------------------------------------------
    // Helpers
    // ------------------------------------------------------------------------

    /// version, locktime, counts, outputs size, inputs, then outputs, in the
    /// little-endian consensus encoding whatever the wire contract says
    static std::vector<uint8_t> SerializeTxPreamble(const MutableTransaction& mtx);

    /// Consecutive chunks of at most `size` bytes; an empty buffer yields none
    static std::vector<std::vector<uint8_t>> SplitBuffer(const std::vector<uint8_t>& data,
                                                         size_t size);

    /// Only the last signature chunk returns the signature
    static ResponseShape ExpectedShape(size_t chunkIndex, size_t chunkCount);

private:
    /// Claims the engine and its transport for one operation
    class OperationGuard {
    public:
        OperationGuard(LedgerClient& client, const char* operation);
        ~OperationGuard();

        OperationGuard(const OperationGuard&) = delete;
        OperationGuard& operator=(const OperationGuard&) = delete;

        /// Mark success; otherwise the engine ends in the Error state
        void Complete() { completed_ = true; }

    private:
        LedgerClient& client_;
        const char* operation_;
        bool completed_{false};
    };

    std::vector<uint8_t> Exchange(const ApduCommand& command, ResponseShape shape);

    Transport& transport_;
    NetworkType network_;
    const WireContract* contract_;
    std::atomic<bool> busy_{false};
    std::atomic<EngineState> state_{EngineState::Idle};
};

} // namespace ledger
} // namespace hnsledger

#endif // HNSLEDGER_LEDGER_CLIENT_H

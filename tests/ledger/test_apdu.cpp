// HNSLEDGER - APDU Codec Tests
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "hnsledger/core/hex.h"
#include "hnsledger/ledger/apdu.h"
#include "hnsledger/ledger/error.h"

#include "mock_device.h"

using namespace hnsledger;
using namespace hnsledger::ledger;
using hnsledger::ledger::test::Reply;

namespace {

DerivationPath FirstReceive() {
    return DerivationPath::BIP44(NetworkType::Main, 0, 0, 0);
}

} // namespace

// ============================================================================
// Paths
// ============================================================================

TEST(ApduPathTest, ParseAndFormat) {
    DerivationPath path = ParsePath("m/44'/5353'/0'/0/1");
    EXPECT_EQ(path.Depth(), 5u);
    EXPECT_EQ(path.GetIndices()[1], 5353u | HARDENED_FLAG);
    EXPECT_EQ(FormatPath(path), "m/44'/5353'/0'/0/1");
}

TEST(ApduPathTest, ParseRejectsMalformed) {
    EXPECT_THROW(ParsePath("44'/5353'"), UsageError);
    EXPECT_THROW(ParsePath("m/abc"), UsageError);
}

TEST(ApduPathTest, DepthLimit) {
    EXPECT_NO_THROW(ParsePath("m/1/2/3/4/5/6/7/8/9/10"));
    EXPECT_THROW(ParsePath("m/1/2/3/4/5/6/7/8/9/10/11"), UsageError);
}

// ============================================================================
// Commands
// ============================================================================

TEST(ApduCommandTest, AppVersion) {
    EXPECT_EQ(BytesToHex(ApduCommand::GetAppVersion().Encode()), "e040000000");
}

TEST(ApduCommandTest, PublicKeyEncoding) {
    PublicKeyOptions options;
    ApduCommand cmd = ApduCommand::GetPublicKey(FirstReceive(), options);
    EXPECT_EQ(BytesToHex(cmd.Encode()),
              "e042000015"
              "05"
              "8000002c"
              "800014e9"
              "80000000"
              "00000000"
              "00000000");
}

TEST(ApduCommandTest, PublicKeyFlags) {
    PublicKeyOptions options;
    options.confirm = true;
    options.xpub = true;
    options.address = true;
    options.network = NetworkType::Testnet;

    ApduCommand cmd = ApduCommand::GetPublicKey(FirstReceive(), options);
    EXPECT_EQ(cmd.GetP1(), 0x01);
    EXPECT_EQ(cmd.GetP2(), 0x07);

    options.xpub = false;
    options.address = false;
    options.network = NetworkType::Simnet;
    EXPECT_EQ(ApduCommand::GetPublicKey(FirstReceive(), options).GetP2(), 0x0c);
}

TEST(ApduCommandTest, PublicKeyRejectsDeepPath) {
    std::vector<uint32_t> indices(MAX_DEPTH + 1, 0);
    EXPECT_THROW(ApduCommand::GetPublicKey(DerivationPath(indices), PublicKeyOptions()),
                 UsageError);
}

TEST(ApduCommandTest, DataLimit) {
    EXPECT_NO_THROW(ApduCommand(CLA_GENERAL, Ins::GET_INPUT_SIGNATURE, 0, 0,
                                std::vector<uint8_t>(MAX_APDU_DATA)));
    EXPECT_THROW(ApduCommand(CLA_GENERAL, Ins::GET_INPUT_SIGNATURE, 0, 0,
                             std::vector<uint8_t>(MAX_APDU_DATA + 1)),
                 UsageError);
}

TEST(ApduCommandTest, ParseTransactionChunks) {
    std::vector<uint8_t> chunk = {0xaa, 0xbb};
    EXPECT_EQ(BytesToHex(ApduCommand::ParseTransaction(chunk, ChunkPosition::First).Encode()),
              "e044010002aabb");
    EXPECT_EQ(BytesToHex(ApduCommand::ParseTransaction(chunk, ChunkPosition::Continuation)
                             .Encode()),
              "e044000002aabb");
    EXPECT_THROW(ApduCommand::ParseTransaction({}, ChunkPosition::First), UsageError);
}

TEST(ApduCommandTest, InputSignatureFirstChunk) {
    InputSigningHeader header;
    header.path = DerivationPath({HARDENED_FLAG | 44, 1});
    header.prevout = Outpoint(test::FilledHash(0x11), 2);
    header.value = 1000000;
    header.sequence = 0xfffffffe;
    header.sighashType = SIGHASH_ALL;

    std::vector<uint8_t> script = {0x01, 0x51};
    ApduCommand cmd = ApduCommand::GetInputSignature(header, script);

    EXPECT_EQ(cmd.GetIns(), 0x44);
    EXPECT_EQ(cmd.GetP1(), 0x01);
    EXPECT_EQ(cmd.GetP2(), 0x01);

    std::string expected =
        "02" "8000002c" "00000001"                     // path
        + std::string(64, '1') +                        // prevout hash
        "02000000"                                      // index
        "40420f0000000000"                              // value
        "feffffff"                                      // sequence
        "01000000"                                      // sighash
        "0151";                                         // script chunk
    EXPECT_EQ(BytesToHex(cmd.GetData()), expected);
}

TEST(ApduCommandTest, InputSignatureHeaderFollowsContractFieldOrder) {
    WireContract bigEndian{AppVersion(9, 0, 0), ByteOrder::Big, ByteOrder::Big, {SIGHASH_ALL}};

    InputSigningHeader header;
    header.path = DerivationPath({HARDENED_FLAG | 44});
    header.prevout = Outpoint(test::FilledHash(0x11), 2);
    header.value = 1000000;
    header.sequence = 0xfffffffe;
    header.sighashType = SIGHASH_ALL;

    ApduCommand cmd = ApduCommand::GetInputSignature(header, {0x00}, bigEndian);
    std::string expected =
        "01" "8000002c"
        + std::string(64, '1') +
        "00000002"
        "00000000000f4240"
        "fffffffe"
        "00000001"
        "00";
    EXPECT_EQ(BytesToHex(cmd.GetData()), expected);
}

TEST(ApduCommandTest, InputSignatureRejectsOtherSighash) {
    InputSigningHeader header;
    header.sighashType = SIGHASH_NONE;
    EXPECT_THROW(ApduCommand::GetInputSignature(header, {0x00}), UsageError);
}

TEST(ApduCommandTest, InputSignatureContinuation) {
    ApduCommand cmd = ApduCommand::GetInputSignatureContinuation({0x01, 0x02, 0x03});
    EXPECT_EQ(BytesToHex(cmd.Encode()), "e044000103010203");
}

// ============================================================================
// Responses
// ============================================================================

TEST(ApduResponseTest, StatusWordRequired) {
    EXPECT_THROW(ApduResponse::ReadStatusWord({0x90}), ProtocolError);
    EXPECT_EQ(ApduResponse::ReadStatusWord({0x01, 0x90, 0x00}), 0x9000);
}

TEST(ApduResponseTest, AppVersion) {
    EXPECT_EQ(ApduResponse::ParseAppVersion(Reply({1, 0, 4})), "1.0.4");
    EXPECT_THROW(ApduResponse::ParseAppVersion(Reply({1, 0})), ProtocolError);
    EXPECT_THROW(ApduResponse::ParseAppVersion(Reply({}, 0x6d00)), DeviceError);
}

TEST(ApduResponseTest, PublicKeyOnly) {
    std::vector<uint8_t> key = test::TestKey(0).ToVector();
    PublicKeyResult result = ApduResponse::ParsePublicKey(Reply(key), PublicKeyOptions());
    EXPECT_EQ(result.publicKey, test::TestKey(0));
    EXPECT_FALSE(result.chainCode.has_value());
    EXPECT_FALSE(result.parentFingerprint.has_value());
    EXPECT_FALSE(result.address.has_value());
}

TEST(ApduResponseTest, PublicKeyWithXpubAndAddress) {
    std::vector<uint8_t> payload = test::TestKey(1).ToVector();
    std::vector<uint8_t> chainCode(32, 0xcc);
    payload.insert(payload.end(), chainCode.begin(), chainCode.end());
    payload.insert(payload.end(), {0x12, 0x34, 0x56, 0x78});
    std::string address = "hs1qexample";
    payload.push_back(static_cast<uint8_t>(address.size()));
    payload.insert(payload.end(), address.begin(), address.end());

    PublicKeyOptions options;
    options.xpub = true;
    options.address = true;

    PublicKeyResult result = ApduResponse::ParsePublicKey(Reply(payload), options);
    EXPECT_EQ(result.publicKey, test::TestKey(1));
    ASSERT_TRUE(result.chainCode.has_value());
    EXPECT_EQ(*result.chainCode, chainCode);
    ASSERT_TRUE(result.parentFingerprint.has_value());
    EXPECT_EQ(*result.parentFingerprint, 0x12345678u);
    ASSERT_TRUE(result.address.has_value());
    EXPECT_EQ(*result.address, address);
}

TEST(ApduResponseTest, PublicKeyLengthMustMatchOptions) {
    std::vector<uint8_t> key = test::TestKey(0).ToVector();
    PublicKeyOptions xpub;
    xpub.xpub = true;
    EXPECT_THROW(ApduResponse::ParsePublicKey(Reply(key), xpub), ProtocolError);

    std::vector<uint8_t> longer = key;
    longer.push_back(0x00);
    EXPECT_THROW(ApduResponse::ParsePublicKey(Reply(longer), PublicKeyOptions()),
                 ProtocolError);
}

TEST(ApduResponseTest, AckAndSignature) {
    EXPECT_NO_THROW(ApduResponse::ParseAck(Reply({})));
    EXPECT_THROW(ApduResponse::ParseAck(Reply({0x00})), ProtocolError);

    std::vector<uint8_t> sig = test::FakeSignature();
    EXPECT_EQ(ApduResponse::ParseSignature(Reply(sig)), sig);
    sig.pop_back();
    EXPECT_THROW(ApduResponse::ParseSignature(Reply(sig)), ProtocolError);
}

TEST(ApduResponseTest, InputSignatureByShape) {
    EXPECT_TRUE(ApduResponse::ParseInputSignature(Reply({}), ResponseShape::Ack).empty());
    EXPECT_EQ(ApduResponse::ParseInputSignature(Reply(test::FakeSignature()),
                                                ResponseShape::Result),
              test::FakeSignature());
    EXPECT_THROW(ApduResponse::ParseInputSignature(Reply(test::FakeSignature()),
                                                   ResponseShape::Ack),
                 ProtocolError);
}

TEST(ApduResponseTest, ErrorStatusWinsOverLength) {
    try {
        ApduResponse::ParseSignature(Reply({}, 0x6f20));
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_EQ(e.GetName(), "INCORRECT_SIGHASH_TYPE");
    }
}

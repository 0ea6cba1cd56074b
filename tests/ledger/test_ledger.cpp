// HNSLEDGER - Hardware Signer Tests
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "hnsledger/ledger/error.h"
#include "hnsledger/ledger/ledger.h"

#include "mock_device.h"

using namespace hnsledger;
using namespace hnsledger::ledger;

namespace {

using test::Ack;
using test::Reply;

std::vector<uint8_t> VersionReply(uint8_t major, uint8_t minor, uint8_t patch) {
    return Reply({major, minor, patch});
}

Coin MakeCoin(const Address& address, uint8_t fill, uint32_t index = 0) {
    Coin coin;
    coin.value = 5 * COIN;
    coin.address = address;
    coin.hash = test::FilledHash(fill);
    coin.index = index;
    return coin;
}

MutableTransaction Spending(const std::vector<Coin>& coins) {
    MutableTransaction mtx;
    for (const auto& coin : coins) {
        mtx.inputs.emplace_back(coin.GetOutpoint());
    }
    mtx.outputs.emplace_back(COIN, Address(0, std::vector<uint8_t>(20, 0x33)));
    return mtx;
}

LedgerInput PubkeyHashInput(const Coin& coin, int key = 0) {
    LedgerInput::Options options;
    options.path = DerivationPath::BIP44(NetworkType::Main, 0, 0, 0);
    options.coin = coin;
    options.publicKey = test::TestKey(key);
    return LedgerInput(options);
}

Script TwoOfThree() {
    return Script::CreateMultisig(2, {test::TestKey(0).ToVector(),
                                      test::TestKey(1).ToVector(),
                                      test::TestKey(2).ToVector()});
}

LedgerInput MultisigInput(const Coin& coin, int key) {
    LedgerInput::Options options;
    options.path = DerivationPath::BIP44(NetworkType::Main, 0, 0, 0);
    options.coin = coin;
    options.redeem = TwoOfThree();
    options.publicKey = test::TestKey(key);
    return LedgerInput(options);
}

class LedgerHSDTest : public ::testing::Test {
protected:
    test::ScriptedTransport transport_;
    LedgerHSD hsd_{transport_};

    /// Version, one transaction chunk, then one signature per input
    void QueueSigningSession(const std::vector<std::vector<uint8_t>>& signatures) {
        transport_.Queue(VersionReply(1, 0, 0));
        transport_.Queue(Ack());
        for (const auto& sig : signatures) {
            transport_.Queue(Reply(sig));
        }
    }
};

} // namespace

// ============================================================================
// Queries
// ============================================================================

TEST_F(LedgerHSDTest, GetAppVersionCachesParsedVersion) {
    EXPECT_FALSE(hsd_.GetCachedVersion().has_value());
    transport_.Queue(VersionReply(1, 4, 2));

    EXPECT_EQ(hsd_.GetAppVersion(), "1.4.2");
    ASSERT_TRUE(hsd_.GetCachedVersion().has_value());
    EXPECT_EQ(*hsd_.GetCachedVersion(), AppVersion(1, 4, 2));
}

TEST_F(LedgerHSDTest, GetAddress) {
    std::string address = "hs1qtestaddress";
    std::vector<uint8_t> payload = test::TestKey(0).ToVector();
    payload.push_back(static_cast<uint8_t>(address.size()));
    payload.insert(payload.end(), address.begin(), address.end());
    transport_.Queue(Reply(payload));

    EXPECT_EQ(hsd_.GetAddress(DerivationPath::BIP44(NetworkType::Main, 0, 0, 0), true),
              address);
    ASSERT_EQ(transport_.sent.size(), 1u);
    EXPECT_EQ(transport_.sent[0][2], 0x01);
    EXPECT_EQ(transport_.sent[0][3] & 0x02, 0x02);
}

// ============================================================================
// Signing
// ============================================================================

TEST_F(LedgerHSDTest, SignPubkeyHashInput) {
    Coin coin = MakeCoin(Address::FromPubkeyHash(test::TestKey(0).GetKeyHash()), 0x01);
    MutableTransaction mtx = Spending({coin});
    QueueSigningSession({test::FakeSignature(0x10)});

    hsd_.SignTransaction(mtx, {PubkeyHashInput(coin)});

    EXPECT_EQ(transport_.sent.size(), 3u);
    ASSERT_EQ(mtx.inputs[0].witness.size(), 2u);
    EXPECT_EQ(mtx.inputs[0].witness[0], test::FakeSignature(0x10));
    EXPECT_EQ(mtx.inputs[0].witness[1], test::TestKey(0).ToVector());
}

TEST_F(LedgerHSDTest, SignsInTransactionOrder) {
    Coin first = MakeCoin(Address::FromPubkeyHash(test::TestKey(0).GetKeyHash()), 0x01);
    Coin second = MakeCoin(Address::FromPubkeyHash(test::TestKey(1).GetKeyHash()), 0x02);
    MutableTransaction mtx = Spending({first, second});
    QueueSigningSession({test::FakeSignature(0x10), test::FakeSignature(0x20)});

    // Listed out of order; signatures still follow the transaction inputs.
    hsd_.SignTransaction(mtx, {PubkeyHashInput(second, 1), PubkeyHashInput(first, 0)});

    EXPECT_EQ(mtx.inputs[0].witness[0], test::FakeSignature(0x10));
    EXPECT_EQ(mtx.inputs[0].witness[1], test::TestKey(0).ToVector());
    EXPECT_EQ(mtx.inputs[1].witness[0], test::FakeSignature(0x20));
    EXPECT_EQ(mtx.inputs[1].witness[1], test::TestKey(1).ToVector());
}

TEST_F(LedgerHSDTest, SignMultisigInputFillsKeySlot) {
    Coin coin = MakeCoin(Address::FromScript(TwoOfThree()), 0x01);
    MutableTransaction mtx = Spending({coin});
    QueueSigningSession({test::FakeSignature(0x10)});

    hsd_.SignTransaction(mtx, {MultisigInput(coin, 1)});

    const auto& witness = mtx.inputs[0].witness;
    ASSERT_EQ(witness.size(), 5u);
    EXPECT_TRUE(witness[0].empty());
    EXPECT_TRUE(witness[1].empty());
    EXPECT_EQ(witness[2], test::FakeSignature(0x10));
    EXPECT_TRUE(witness[3].empty());
    Script redeem = TwoOfThree();
    EXPECT_EQ(witness[4], std::vector<uint8_t>(redeem.begin(), redeem.end()));
}

TEST_F(LedgerHSDTest, MultisigKeepsExistingSignatures) {
    Coin coin = MakeCoin(Address::FromScript(TwoOfThree()), 0x01);
    MutableTransaction mtx = Spending({coin});
    Script redeem = TwoOfThree();
    std::vector<uint8_t> redeemBytes(redeem.begin(), redeem.end());
    mtx.inputs[0].witness = {{}, test::FakeSignature(0x01), {}, {}, redeemBytes};

    QueueSigningSession({test::FakeSignature(0x03)});
    hsd_.SignTransaction(mtx, {MultisigInput(coin, 2)});

    const auto& witness = mtx.inputs[0].witness;
    ASSERT_EQ(witness.size(), 5u);
    EXPECT_EQ(witness[1], test::FakeSignature(0x01));
    EXPECT_TRUE(witness[2].empty());
    EXPECT_EQ(witness[3], test::FakeSignature(0x03));
    EXPECT_EQ(witness[4], redeemBytes);
}

TEST(ApplySignatureTest, MultisigResetsForeignWitness) {
    Coin coin = MakeCoin(Address::FromScript(TwoOfThree()), 0x01);
    LedgerInput signer = MultisigInput(coin, 0);

    Input input(coin.GetOutpoint());
    input.witness = {std::vector<uint8_t>{0x01}, std::vector<uint8_t>{0x02}};
    LedgerHSD::ApplySignature(input, signer, test::FakeSignature());

    ASSERT_EQ(input.witness.size(), 5u);
    EXPECT_EQ(input.witness[1], test::FakeSignature());
    EXPECT_TRUE(input.witness[0].empty());
}

TEST_F(LedgerHSDTest, SignNonMultisigScriptHashInput) {
    Script redeem;
    redeem << test::TestKey(0).ToVector() << OP_CHECKSIG;
    Coin coin = MakeCoin(Address::FromScript(redeem), 0x01);
    MutableTransaction mtx = Spending({coin});

    LedgerInput::Options options;
    options.path = DerivationPath::BIP44(NetworkType::Main, 0, 0, 0);
    options.coin = coin;
    options.redeem = redeem;
    LedgerInput input(options);

    QueueSigningSession({test::FakeSignature(0x10)});
    hsd_.SignTransaction(mtx, {input});

    ASSERT_EQ(mtx.inputs[0].witness.size(), 2u);
    EXPECT_EQ(mtx.inputs[0].witness[0], test::FakeSignature(0x10));
    EXPECT_EQ(mtx.inputs[0].witness[1], std::vector<uint8_t>(redeem.begin(), redeem.end()));
}

// ============================================================================
// Local Validation
// ============================================================================

TEST_F(LedgerHSDTest, RejectsEmptyInputList) {
    MutableTransaction mtx;
    EXPECT_THROW(hsd_.SignTransaction(mtx, {}), UsageError);
    EXPECT_TRUE(transport_.sent.empty());
}

TEST_F(LedgerHSDTest, RejectsInputNotInTransaction) {
    Coin spent = MakeCoin(Address::FromPubkeyHash(test::TestKey(0).GetKeyHash()), 0x01);
    Coin other = MakeCoin(Address::FromPubkeyHash(test::TestKey(0).GetKeyHash()), 0x02);
    MutableTransaction mtx = Spending({spent});

    EXPECT_THROW(hsd_.SignTransaction(mtx, {PubkeyHashInput(other)}), UsageError);
    EXPECT_TRUE(transport_.sent.empty());
}

TEST_F(LedgerHSDTest, RejectsDuplicateInput) {
    Coin coin = MakeCoin(Address::FromPubkeyHash(test::TestKey(0).GetKeyHash()), 0x01);
    MutableTransaction mtx = Spending({coin});

    EXPECT_THROW(hsd_.SignTransaction(mtx, {PubkeyHashInput(coin), PubkeyHashInput(coin)}),
                 UsageError);
    EXPECT_TRUE(transport_.sent.empty());
}

TEST_F(LedgerHSDTest, RejectsMissingPublicKey) {
    Coin coin = MakeCoin(Address::FromPubkeyHash(test::TestKey(0).GetKeyHash()), 0x01);
    MutableTransaction mtx = Spending({coin});

    LedgerInput::Options options;
    options.coin = coin;
    EXPECT_THROW(hsd_.SignTransaction(mtx, {LedgerInput(options)}), UsageError);
    EXPECT_TRUE(transport_.sent.empty());
}

TEST_F(LedgerHSDTest, RejectsKeyOutsideMultisig) {
    Script redeem = Script::CreateMultisig(1, {test::TestKey(1).ToVector(),
                                               test::TestKey(2).ToVector()});
    Coin coin = MakeCoin(Address::FromScript(redeem), 0x01);
    MutableTransaction mtx = Spending({coin});

    LedgerInput::Options options;
    options.coin = coin;
    options.redeem = redeem;
    options.publicKey = test::TestKey(0);

    EXPECT_THROW(hsd_.SignTransaction(mtx, {LedgerInput(options)}), UsageError);
    EXPECT_TRUE(transport_.sent.empty());
}

TEST_F(LedgerHSDTest, OldFirmwareRejectedAfterVersionQuery) {
    Coin coin = MakeCoin(Address::FromPubkeyHash(test::TestKey(0).GetKeyHash()), 0x01);
    MutableTransaction mtx = Spending({coin});
    transport_.Queue(VersionReply(0, 9, 0));

    EXPECT_THROW(hsd_.SignTransaction(mtx, {PubkeyHashInput(coin)}), UsageError);
    EXPECT_EQ(transport_.sent.size(), 1u);
    EXPECT_TRUE(mtx.inputs[0].witness.empty());
}

TEST_F(LedgerHSDTest, UserRejectionStopsSigning) {
    Coin coin = MakeCoin(Address::FromPubkeyHash(test::TestKey(0).GetKeyHash()), 0x01);
    MutableTransaction mtx = Spending({coin});
    transport_.Queue(VersionReply(1, 0, 0));
    transport_.Queue(Reply({}, 0x6985));

    try {
        hsd_.SignTransaction(mtx, {PubkeyHashInput(coin)});
        FAIL() << "expected DeviceError";
    } catch (const DeviceError& e) {
        EXPECT_EQ(e.GetStatusWord(), 0x6985);
        EXPECT_EQ(e.GetKind(), StatusKind::UserRejected);
    }
    EXPECT_EQ(transport_.sent.size(), 2u);
    EXPECT_TRUE(mtx.inputs[0].witness.empty());
    EXPECT_EQ(hsd_.GetClient().GetState(), EngineState::Error);
}

// HNSLEDGER - Address Tests
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "hnsledger/core/address.h"
#include "hnsledger/core/hex.h"
#include <vector>

using namespace hnsledger;

// ============================================================================
// Networks
// ============================================================================

TEST(NetworkTest, Names) {
    EXPECT_EQ(NetworkFromString("main"), NetworkType::Main);
    EXPECT_EQ(NetworkFromString("MainNet"), NetworkType::Main);
    EXPECT_EQ(NetworkFromString("regtest"), NetworkType::Regtest);
    EXPECT_STREQ(NetworkToString(NetworkType::Simnet), "simnet");
    EXPECT_THROW(NetworkFromString("bitcoin"), std::invalid_argument);
}

TEST(NetworkTest, HrpAndCoinType) {
    EXPECT_STREQ(GetBech32Hrp(NetworkType::Main), "hs");
    EXPECT_STREQ(GetBech32Hrp(NetworkType::Testnet), "ts");
    EXPECT_STREQ(GetBech32Hrp(NetworkType::Regtest), "rs");
    EXPECT_STREQ(GetBech32Hrp(NetworkType::Simnet), "ss");
    EXPECT_EQ(GetCoinType(NetworkType::Main), 5353u);
    EXPECT_EQ(GetCoinType(NetworkType::Simnet), 5356u);
}

// ============================================================================
// Bech32
// ============================================================================

TEST(Bech32Test, KnownWitnessProgram) {
    std::vector<uint8_t> program = HexToBytes("751e76e8199196d454941c45d1b3a323f1433bd6");
    EXPECT_EQ(EncodeBech32("bc", 0, program), "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4");

    auto decoded = DecodeBech32("BC1QW508D6QEJXTDG4Y5R3ZARVARY0C5XW7KV8F3T4");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::get<0>(*decoded), "bc");
    EXPECT_EQ(std::get<1>(*decoded), 0);
    EXPECT_EQ(std::get<2>(*decoded), program);
}

TEST(Bech32Test, RejectsCorruption) {
    // Flipped checksum character
    EXPECT_FALSE(DecodeBech32("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t5").has_value());
    // Mixed case
    EXPECT_FALSE(DecodeBech32("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kV8f3t4").has_value());
    // Missing separator
    EXPECT_FALSE(DecodeBech32("bcqw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4").has_value());
    // Character outside the charset
    EXPECT_FALSE(DecodeBech32("bc1bw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4").has_value());
}

// ============================================================================
// Address
// ============================================================================

TEST(AddressTest, Constructor) {
    EXPECT_NO_THROW(Address(0, std::vector<uint8_t>(20, 0x01)));
    EXPECT_THROW(Address(0, std::vector<uint8_t>(1, 0x01)), std::invalid_argument);
    EXPECT_THROW(Address(0, std::vector<uint8_t>(41, 0x01)), std::invalid_argument);
    EXPECT_THROW(Address(32, std::vector<uint8_t>(20, 0x01)), std::invalid_argument);
    EXPECT_TRUE(Address().IsNull());
}

TEST(AddressTest, Kinds) {
    Address pkh(0, std::vector<uint8_t>(20, 0x01));
    Address sh(0, std::vector<uint8_t>(32, 0x01));
    Address other(1, std::vector<uint8_t>(20, 0x01));

    EXPECT_TRUE(pkh.IsPubkeyHash());
    EXPECT_FALSE(pkh.IsScriptHash());
    EXPECT_TRUE(sh.IsScriptHash());
    EXPECT_FALSE(other.IsPubkeyHash());
    EXPECT_FALSE(other.IsScriptHash());
}

TEST(AddressTest, FromEmptyScriptIsSha3OfNothing) {
    Address addr = Address::FromScript(Script());
    EXPECT_TRUE(addr.IsScriptHash());
    EXPECT_EQ(BytesToHex(addr.GetHash()),
              "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

TEST(AddressTest, StringRoundTripPerNetwork) {
    Address addr(0, std::vector<uint8_t>(20, 0x42));

    std::string main = addr.ToString(NetworkType::Main);
    EXPECT_EQ(main.substr(0, 3), "hs1");
    EXPECT_EQ(Address::FromString(main, NetworkType::Main), addr);
    EXPECT_THROW(Address::FromString(main, NetworkType::Testnet), std::invalid_argument);

    std::string regtest = addr.ToString(NetworkType::Regtest);
    EXPECT_EQ(regtest.substr(0, 3), "rs1");
    EXPECT_EQ(Address::FromString(regtest, NetworkType::Regtest), addr);

    EXPECT_THROW(Address::FromString("not an address", NetworkType::Main),
                 std::invalid_argument);
    EXPECT_EQ(Address().ToString(NetworkType::Main), "");
}

// HNSLEDGER - SHA3-256 Tests
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "hnsledger/core/hex.h"
#include "hnsledger/crypto/sha3.h"
#include <string>
#include <vector>

using namespace hnsledger;

TEST(SHA3Test, Empty) {
    EXPECT_EQ(SHA3_256Hash(std::vector<Byte>()).ToHex(),
              "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

TEST(SHA3Test, Abc) {
    std::string abc = "abc";
    EXPECT_EQ(SHA3_256Hash(reinterpret_cast<const Byte*>(abc.data()), abc.size()).ToHex(),
              "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST(SHA3Test, IncrementalAndReset) {
    std::vector<Byte> data(500, 0x33);

    SHA3_256 hasher;
    hasher.Write(data.data(), 123).Write(data.data() + 123, data.size() - 123);
    Byte out[SHA3_256::OUTPUT_SIZE];
    hasher.Finalize(out);
    EXPECT_EQ(Hash256(out, sizeof(out)), SHA3_256Hash(data));

    hasher.Reset();
    hasher.Finalize(out);
    EXPECT_EQ(BytesToHex(out, sizeof(out)),
              "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

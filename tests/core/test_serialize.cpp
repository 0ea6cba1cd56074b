// HNSLEDGER - Serialization Tests
// Copyright (c) 2024 HNSLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "hnsledger/core/hex.h"
#include "hnsledger/core/serialize.h"
#include "hnsledger/core/types.h"
#include <vector>

using namespace hnsledger;

// ============================================================================
// DataStream
// ============================================================================

TEST(DataStreamTest, ReadAdvancesPosition) {
    DataStream ds(std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF});
    EXPECT_EQ(ds.size(), 4u);

    uint8_t first;
    ds >> first;
    EXPECT_EQ(first, 0xDE);
    EXPECT_EQ(ds.ReadPos(), 1u);
    EXPECT_EQ(ds.size(), 3u);
    EXPECT_EQ(ds.ToHex(), "adbeef");

    ds.Rewind();
    EXPECT_EQ(ds.size(), 4u);
}

TEST(DataStreamTest, ReadPastEndThrows) {
    DataStream ds(std::vector<uint8_t>{0x01, 0x02});
    EXPECT_THROW(ds.ReadBytes(3), std::ios_base::failure);
    EXPECT_THROW(ds.Ignore(3), std::ios_base::failure);

    ds.Ignore(2);
    EXPECT_TRUE(ds.empty());
    EXPECT_EQ(ds.Data().size(), 2u);
}

// ============================================================================
// Integers
// ============================================================================

TEST(SerializeTest, LittleEndianIntegers) {
    DataStream ds;
    ser_writedata16(ds, 0x0102);
    ser_writedata32(ds, 0x01020304);
    ser_writedata64(ds, 0x0102030405060708ULL);
    EXPECT_EQ(ds.ToHex(), "0201" "04030201" "0807060504030201");

    EXPECT_EQ(ser_readdata16(ds), 0x0102);
    EXPECT_EQ(ser_readdata32(ds), 0x01020304u);
    EXPECT_EQ(ser_readdata64(ds), 0x0102030405060708ULL);
}

TEST(SerializeTest, BigEndianIntegers) {
    DataStream ds;
    ser_writedata16be(ds, 0x0101);
    ser_writedata32be(ds, 0x8000002c);
    EXPECT_EQ(ds.ToHex(), "0101" "8000002c");

    EXPECT_EQ(ser_readdata16be(ds), 0x0101);
    EXPECT_EQ(ser_readdata32be(ds), 0x8000002cu);
}

TEST(SerializeTest, Amount) {
    DataStream ds;
    ds << Amount(COIN);
    EXPECT_EQ(ds.ToHex(), "40420f0000000000");
}

// ============================================================================
// CompactSize
// ============================================================================

TEST(CompactSizeTest, Boundaries) {
    struct Case {
        uint64_t value;
        const char* hex;
    };
    const Case cases[] = {
        {0, "00"},
        {252, "fc"},
        {253, "fdfd00"},
        {0xffff, "fdffff"},
        {0x10000, "fe00000100"},
    };

    for (const auto& c : cases) {
        DataStream ds;
        WriteCompactSize(ds, c.value);
        EXPECT_EQ(ds.ToHex(), c.hex) << c.value;
        EXPECT_EQ(ReadCompactSize(ds), c.value);
    }
}

TEST(CompactSizeTest, RejectsNonCanonical) {
    DataStream ds(HexToBytes("fd1000"));
    EXPECT_THROW(ReadCompactSize(ds), std::ios_base::failure);
}

TEST(CompactSizeTest, RangeCheck) {
    DataStream ds;
    WriteCompactSize(ds, MAX_SIZE + 1);
    DataStream copy(ds.Data());

    EXPECT_THROW(ReadCompactSize(ds), std::ios_base::failure);
    EXPECT_EQ(ReadCompactSize(copy, false), MAX_SIZE + 1);
}

// ============================================================================
// Byte Vectors and Hashes
// ============================================================================

TEST(SerializeTest, VarBytes) {
    std::vector<uint8_t> bytes(300, 0x51);
    DataStream ds;
    ds << bytes;
    EXPECT_EQ(ds.size(), 303u);
    EXPECT_EQ(GetSerializeSize(bytes), 303u);

    std::vector<uint8_t> back;
    ds >> back;
    EXPECT_EQ(back, bytes);
}

TEST(SerializeTest, HashIsRawBytes) {
    std::vector<uint8_t> raw(32);
    for (size_t i = 0; i < raw.size(); ++i) {
        raw[i] = static_cast<uint8_t>(i);
    }
    Hash256 hash(raw.data(), raw.size());

    DataStream ds;
    ds << hash;
    EXPECT_EQ(ds.Data(), raw);
}

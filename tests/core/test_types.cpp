// XMLWITNESS - Core Types Tests
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include <gtest/gtest.h>
#include "xmlwitness/core/types.h"

#include <array>
#include <stdexcept>
#include <string>

namespace xmlwitness {
namespace test {

// ============================================================================
// Byte Conversion Tests
// ============================================================================

TEST(ByteTest, SizeIsOneByte) {
    EXPECT_EQ(sizeof(Byte), 1u);
}

TEST(ByteTest, StringConversionKeepsRawBytes) {
    std::string text("<a>\x00\xff", 5);
    ByteVector bytes = ToBytes(text);
    ASSERT_EQ(bytes.size(), 5u);
    EXPECT_EQ(bytes[3], 0x00);
    EXPECT_EQ(bytes[4], 0xFF);
    EXPECT_EQ(ToString(bytes), text);
}

// ============================================================================
// Hash256 Tests
// ============================================================================

TEST(Hash256Test, DefaultConstructorCreatesZeroHash) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
    for (size_t i = 0; i < Hash256::SIZE; ++i) {
        EXPECT_EQ(h[i], 0);
    }
}

TEST(Hash256Test, SizeIs32Bytes) {
    EXPECT_EQ(Hash256::SIZE, 32u);
    Hash256 h;
    EXPECT_EQ(h.size(), 32u);
    EXPECT_EQ(h.end() - h.begin(), 32);
}

TEST(Hash256Test, ConstructFromBytes) {
    std::array<Byte, 32> data;
    for (size_t i = 0; i < 32; ++i) {
        data[i] = static_cast<Byte>(i);
    }

    Hash256 h(data);
    for (size_t i = 0; i < 32; ++i) {
        EXPECT_EQ(h[i], i);
    }
    EXPECT_EQ(h.ToVector(), ByteVector(data.begin(), data.end()));
}

TEST(Hash256Test, ShortBufferIsZeroExtended) {
    const Byte bytes[] = {0xAA, 0xBB};
    Hash256 h(bytes, sizeof(bytes));
    EXPECT_EQ(h[0], 0xAA);
    EXPECT_EQ(h[1], 0xBB);
    EXPECT_EQ(h[2], 0x00);
    EXPECT_FALSE(h.IsNull());
}

TEST(Hash256Test, EqualityOperator) {
    Hash256 h1, h2;
    EXPECT_EQ(h1, h2);

    std::array<Byte, 32> data;
    data.fill(0x42);
    Hash256 h3(data);
    Hash256 h4(data);

    EXPECT_EQ(h3, h4);
    EXPECT_NE(h1, h3);
}

TEST(Hash256Test, HexIsInDigestOrder) {
    std::array<Byte, 32> data;
    data.fill(0x00);
    data[0] = 0xAB;
    data[31] = 0xCD;

    Hash256 h(data);
    std::string hex = h.ToHex();

    EXPECT_EQ(hex.length(), 64u);
    EXPECT_EQ(hex.substr(0, 2), "ab");
    EXPECT_EQ(hex.substr(62, 2), "cd");
    EXPECT_EQ(Hash256::FromHex(hex), h);
}

TEST(Hash256Test, FromHexInvalid) {
    EXPECT_THROW(Hash256::FromHex("invalid"), std::invalid_argument);
    EXPECT_THROW(Hash256::FromHex("0123"), std::invalid_argument);
}

// ============================================================================
// Hash160 Tests
// ============================================================================

TEST(Hash160Test, SizeIs20Bytes) {
    EXPECT_EQ(Hash160::SIZE, 20u);
    Hash160 h;
    EXPECT_EQ(h.size(), 20u);
    EXPECT_TRUE(h.IsNull());
}

TEST(Hash160Test, FromHex) {
    Hash160 h = Hash160::FromHex("da39a3ee5e6b4b0d3255bfef95601890afd80709");
    EXPECT_EQ(h[0], 0xDA);
    EXPECT_EQ(h[19], 0x09);
    EXPECT_THROW(Hash160::FromHex(std::string(64, '0')), std::invalid_argument);
}

} // namespace test
} // namespace xmlwitness

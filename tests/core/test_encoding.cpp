// XMLWITNESS - Hex and Base64 Encoding Tests
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include <gtest/gtest.h>

#include "xmlwitness/core/base64.h"
#include "xmlwitness/core/hex.h"
#include "xmlwitness/core/types.h"

#include <stdexcept>
#include <string>

namespace xmlwitness {
namespace test {

// ============================================================================
// Hex
// ============================================================================

TEST(HexTest, EncodesLowercase) {
    ByteVector data = {0x00, 0xab, 0xff, 0x10};
    EXPECT_EQ(BytesToHex(data), "00abff10");
}

TEST(HexTest, DecodesEitherCase) {
    EXPECT_EQ(HexToBytes("DEADbeef"), (ByteVector{0xde, 0xad, 0xbe, 0xef}));
    EXPECT_TRUE(HexToBytes("").empty());
}

TEST(HexTest, RejectsMalformed) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
    EXPECT_FALSE(IsValidHex("0x12"));
    EXPECT_TRUE(IsValidHex("0a1B"));
}

TEST(HexTest, DigestHexRoundTrip) {
    std::string hex = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    EXPECT_EQ(Hash256::FromHex(hex).ToHex(), hex);
    EXPECT_THROW(Hash256::FromHex("abcd"), std::invalid_argument);
}

// ============================================================================
// Base64
// ============================================================================

TEST(Base64Test, Rfc4648Vectors) {
    EXPECT_EQ(EncodeBase64(ToBytes("")), "");
    EXPECT_EQ(EncodeBase64(ToBytes("f")), "Zg==");
    EXPECT_EQ(EncodeBase64(ToBytes("fo")), "Zm8=");
    EXPECT_EQ(EncodeBase64(ToBytes("foo")), "Zm9v");
    EXPECT_EQ(EncodeBase64(ToBytes("foobar")), "Zm9vYmFy");

    EXPECT_EQ(ToString(DecodeBase64("Zg==")), "f");
    EXPECT_EQ(ToString(DecodeBase64("Zm8=")), "fo");
    EXPECT_EQ(ToString(DecodeBase64("Zm9vYmFy")), "foobar");
}

TEST(Base64Test, DecodeSkipsLineBreaks) {
    // SignatureValue content is wrapped at 64 columns
    EXPECT_EQ(ToString(DecodeBase64("\nZm9v\r\nYmFy\n")), "foobar");
}

TEST(Base64Test, DecodeRejectsMalformed) {
    EXPECT_THROW(DecodeBase64("Zm9"), std::invalid_argument);
    EXPECT_THROW(DecodeBase64("Zm9*"), std::invalid_argument);
}

TEST(Base64Test, DecodeKeepsLeadingZeros) {
    ByteVector data = {0x00, 0x00, 0x01};
    EXPECT_EQ(DecodeBase64(EncodeBase64(data)), data);
}

// ============================================================================
// FindBytes
// ============================================================================

TEST(FindBytesTest, FindsFromOffset) {
    ByteVector hay = ToBytes("a>b c>d");
    EXPECT_EQ(FindBytes(hay, ">"), 1u);
    EXPECT_EQ(FindBytes(hay, ">", 2), 5u);
    EXPECT_EQ(FindBytes(hay, "x"), NPOS);
    EXPECT_EQ(FindBytes(hay, ">", 100), NPOS);
    EXPECT_EQ(FindBytes(hay, "", 3), 3u);
}

} // namespace test
} // namespace xmlwitness

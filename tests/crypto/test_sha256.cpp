// XMLWITNESS - SHA256 Tests
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include <gtest/gtest.h>
#include "xmlwitness/crypto/sha256.h"
#include "xmlwitness/core/types.h"
#include "xmlwitness/core/hex.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <stdexcept>
#include <string>

namespace xmlwitness {
namespace test {

namespace {

std::string HashHex(const std::string& msg) {
    SHA256 hasher;
    std::array<Byte, SHA256::OUTPUT_SIZE> hash;
    hasher.Write(reinterpret_cast<const Byte*>(msg.data()), msg.size());
    hasher.Finalize(hash.data());
    return BytesToHex(hash);
}

} // anonymous namespace

// ============================================================================
// SHA256 Test Vectors (NIST FIPS 180-4)
// ============================================================================

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(HashHex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, ABCString) {
    EXPECT_EQ(HashHex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockInput) {
    EXPECT_EQ(HashHex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, Exactly64Bytes) {
    const char* msg = "This is exactly 64 bytes long, not counting the terminating byte";
    EXPECT_EQ(strlen(msg), 64u);
    EXPECT_EQ(HashHex(msg), "ab64eff7e88e2e46165e29f2bce41826bd4c7b3552f6b382a9e7d3af47c245f8");
}

TEST(SHA256Test, LargeInput) {
    EXPECT_EQ(HashHex(std::string(1000000, 'a')),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST(SHA256Test, ResetStartsOver) {
    const Byte data[] = {0x61, 0x62, 0x63}; // "abc"
    std::array<Byte, SHA256::OUTPUT_SIZE> hash1, hash2;

    SHA256 hasher;
    hasher.Write(data, 3);
    hasher.Finalize(hash1.data());

    hasher.Reset();
    hasher.Write(data, 3);
    hasher.Finalize(hash2.data());

    EXPECT_EQ(hash1, hash2);
}

TEST(SHA256Test, IncrementalMatchesOneShot) {
    const std::string msg = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    Hash256 expected = SHA256Hash(ToBytes(msg));

    for (size_t chunkSize = 1; chunkSize <= 16; ++chunkSize) {
        SHA256 hasher;
        for (size_t pos = 0; pos < msg.size(); pos += chunkSize) {
            size_t n = std::min(chunkSize, msg.size() - pos);
            hasher.Write(reinterpret_cast<const Byte*>(msg.data() + pos), n);
        }
        Hash256 result;
        hasher.Finalize(result.data());
        EXPECT_EQ(result, expected) << "chunk size " << chunkSize;
    }
}

// ============================================================================
// Midstate
// ============================================================================

TEST(SHA256MidstateTest, InitialStateIsIV) {
    SHA256 hasher;
    EXPECT_EQ(hasher.GetMidstate().ToHex(),
              "6a09e667bb67ae853c6ef372a54ff53a510e527f9b05688c1f83d9ab5be0cd19");
}

TEST(SHA256MidstateTest, CompressingPaddedBlocksYieldsDigest) {
    // "abc" padded by hand to one block
    std::array<Byte, 64> block{};
    block[0] = 'a';
    block[1] = 'b';
    block[2] = 'c';
    block[3] = 0x80;
    block[63] = 24;
    EXPECT_EQ(SHA256Midstate(block.data(), block.size()).ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256MidstateTest, ResumeFromMidstate) {
    std::string msg(200, 'q');
    const Byte* data = reinterpret_cast<const Byte*>(msg.data());

    Hash256 mid = SHA256Midstate(data, 128);
    SHA256 resumed = SHA256::FromMidstate(mid, 128);
    resumed.Write(data + 128, msg.size() - 128);

    Hash256 result;
    resumed.Finalize(result.data());
    EXPECT_EQ(result, SHA256Hash(data, msg.size()));
}

TEST(SHA256MidstateTest, CompressRejectsPartialBlocks) {
    SHA256 hasher;
    Byte data[10] = {0};
    EXPECT_THROW(hasher.Compress(data, sizeof(data)), std::invalid_argument);

    hasher.Write(data, 3);
    EXPECT_THROW(hasher.GetMidstate(), std::logic_error);
}

TEST(SHA256MidstateTest, FromMidstateRequiresAlignment) {
    EXPECT_THROW(SHA256::FromMidstate(Hash256(), 65), std::invalid_argument);
}

} // namespace test
} // namespace xmlwitness

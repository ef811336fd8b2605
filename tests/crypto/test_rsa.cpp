// XMLWITNESS - RSA PKCS#1 v1.5 Tests
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include <gtest/gtest.h>

#include "xmlwitness/core/hex.h"
#include "xmlwitness/crypto/rsa.h"
#include "xmlwitness/crypto/sha1.h"

#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace xmlwitness {
namespace test {

namespace {

struct PKeyDeleter {
    void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
};

using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

/// RSA-SHA1 PKCS#1 v1.5 signature produced by OpenSSL itself
BigNum OpenSSLSign(EVP_PKEY* pkey, const ByteVector& message) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    size_t len = 0;
    if (!ctx ||
        EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha1(), nullptr, pkey) != 1 ||
        EVP_DigestSign(ctx.get(), nullptr, &len, message.data(), message.size()) != 1) {
        throw std::runtime_error("EVP_DigestSign setup failed");
    }
    ByteVector sig(len);
    if (EVP_DigestSign(ctx.get(), sig.data(), &len, message.data(), message.size()) != 1) {
        throw std::runtime_error("EVP_DigestSign failed");
    }
    sig.resize(len);
    return BigNum::FromBytes(sig);
}

} // anonymous namespace

// ============================================================================
// SHA-1
// ============================================================================

TEST(SHA1Test, KnownVectors) {
    EXPECT_EQ(SHA1Hash(ToBytes("abc")).ToHex(), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(SHA1Hash(ByteVector()).ToHex(), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

// ============================================================================
// Block Encoding
// ============================================================================

TEST(RSABlockTest, Layout2048) {
    Hash160 digest = SHA1Hash(ToBytes("abc"));
    ByteVector block = EncodePkcs1Sha1Block(digest, 256);

    ASSERT_EQ(block.size(), 256u);
    EXPECT_EQ(block[0], 0x00);
    EXPECT_EQ(block[1], 0x01);
    // 256 - 35 - 3 bytes of 0xFF
    for (size_t i = 2; i < 220; ++i) {
        EXPECT_EQ(block[i], 0xFF) << i;
    }
    EXPECT_EQ(block[220], 0x00);
    EXPECT_EQ(BytesToHex(block.data() + 221, 15), "3021300906052b0e03021a05000414");
    EXPECT_EQ(ByteVector(block.begin() + 236, block.end()), digest.ToVector());
}

TEST(RSABlockTest, TooShortThrows) {
    EXPECT_THROW(EncodePkcs1Sha1Block(Hash160(), 40), std::invalid_argument);
    EXPECT_NO_THROW(EncodePkcs1Sha1Block(Hash160(), 46));
}

// ============================================================================
// Verification
// ============================================================================

class RSAVerifyTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        pkey_ = EVP_RSA_gen(2048);
        ASSERT_NE(pkey_, nullptr);
    }

    static void TearDownTestSuite() {
        EVP_PKEY_free(pkey_);
        pkey_ = nullptr;
    }

    static EVP_PKEY* pkey_;
};

EVP_PKEY* RSAVerifyTest::pkey_ = nullptr;

TEST_F(RSAVerifyTest, PublicKeyFromEvp) {
    RSAPublicKey key = RSAPublicKey::FromEvp(pkey_);
    EXPECT_EQ(key.modulus.NumBits(), 2048u);
    EXPECT_EQ(key.ModulusBytes(), 256u);
    EXPECT_EQ(key.exponent, BigNum(65537));
}

TEST_F(RSAVerifyTest, AcceptsOpenSSLSignature) {
    RSAPublicKey key = RSAPublicKey::FromEvp(pkey_);
    ByteVector message = ToBytes("<SignedInfo>canonical bytes</SignedInfo>");
    EXPECT_TRUE(VerifyPkcs1Sha1(message, OpenSSLSign(pkey_, message), key));
}

TEST_F(RSAVerifyTest, RejectsOtherMessage) {
    RSAPublicKey key = RSAPublicKey::FromEvp(pkey_);
    BigNum sig = OpenSSLSign(pkey_, ToBytes("one"));
    EXPECT_FALSE(VerifyPkcs1Sha1(ToBytes("two"), sig, key));
}

TEST_F(RSAVerifyTest, RejectsSignatureNotBelowModulus) {
    RSAPublicKey key = RSAPublicKey::FromEvp(pkey_);
    EXPECT_FALSE(VerifyPkcs1Sha1(ToBytes("x"), key.modulus, key));
    EXPECT_FALSE(VerifyPkcs1Sha1(ToBytes("x"), key.modulus + BigNum(5), key));
}

TEST_F(RSAVerifyTest, RejectsZeroModulus) {
    RSAPublicKey key;
    key.exponent = BigNum(65537);
    EXPECT_FALSE(VerifyPkcs1Sha1(ToBytes("x"), BigNum(1), key));
}

TEST(RSAPublicKeyTest, NonRsaKeyIsRejected) {
    PKeyPtr ec(EVP_EC_gen("P-256"));
    ASSERT_TRUE(ec);
    EXPECT_THROW(RSAPublicKey::FromEvp(ec.get()), std::invalid_argument);
    EXPECT_THROW(RSAPublicKey::FromEvp(nullptr), std::invalid_argument);
}

} // namespace test
} // namespace xmlwitness

// XMLWITNESS - RSA Public Key Operations
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// Textbook RSA verification of EMSA-PKCS1-v1_5 SHA-1 signatures, computed
// with explicit big-integer arithmetic so the exact values the circuit
// checks (m and signature^e mod n) are visible to the caller.

#ifndef XMLWITNESS_CRYPTO_RSA_H
#define XMLWITNESS_CRYPTO_RSA_H

#include <array>
#include <cstddef>

#include "xmlwitness/core/types.h"
#include "xmlwitness/crypto/bignum.h"

struct evp_pkey_st;

namespace xmlwitness {

/// ASN.1 DigestInfo header for SHA-1 (RFC 8017 section 9.2, note 1)
constexpr std::array<Byte, 15> SHA1_DIGEST_INFO_PREFIX = {
    0x30, 0x21, 0x30, 0x09, 0x06, 0x05, 0x2b, 0x0e,
    0x03, 0x02, 0x1a, 0x05, 0x00, 0x04, 0x14
};

/// RSA public key (n, e)
struct RSAPublicKey {
    BigNum modulus;
    BigNum exponent;

    /// Length of the modulus in bytes (the signature block length)
    size_t ModulusBytes() const { return modulus.NumBytes(); }

    /// Export n and e from an OpenSSL RSA key
    /// @throws std::invalid_argument if the key is not RSA
    static RSAPublicKey FromEvp(const evp_pkey_st* pkey);
};

/// Build 0x00 0x01 FF..FF 0x00 || DigestInfo || digest of blockLen bytes
/// @throws std::invalid_argument if blockLen leaves fewer than 8 bytes of 0xFF
ByteVector EncodePkcs1Sha1Block(const Hash160& digest, size_t blockLen);

/// Check that signature^e mod n equals the PKCS#1 v1.5 block of SHA-1(message)
bool VerifyPkcs1Sha1(const ByteVector& message, const BigNum& signature,
                     const RSAPublicKey& key);

} // namespace xmlwitness

#endif // XMLWITNESS_CRYPTO_RSA_H

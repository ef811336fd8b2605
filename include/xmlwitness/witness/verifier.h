// XMLWITNESS - Local Signature Checks
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// Re-checks, outside the circuit, the two relations the circuit will prove:
// the payload digest is embedded in SignedInfo, and the RSA signature over
// SignedInfo is valid. A witness that fails either would never verify.

#ifndef XMLWITNESS_WITNESS_VERIFIER_H
#define XMLWITNESS_WITNESS_VERIFIER_H

#include <cstddef>

#include "xmlwitness/core/types.h"
#include "xmlwitness/crypto/bignum.h"
#include "xmlwitness/crypto/rsa.h"

namespace xmlwitness {

/// Byte offset of base64(SHA-256(signedPayload)) inside signedInfo
/// @throws WitnessError(DataHashNotFound) if it does not occur
size_t FindDataHash(const ByteVector& signedPayload, const ByteVector& signedInfo);

/// Require signature^e mod n to equal the PKCS#1 v1.5 SHA-1 block of signedInfo
/// @throws WitnessError(RsaVerificationFailed) otherwise
void VerifySignedInfo(const ByteVector& signedInfo, const BigNum& signature,
                      const RSAPublicKey& key);

} // namespace xmlwitness

#endif // XMLWITNESS_WITNESS_VERIFIER_H

// XMLWITNESS - Local Signature Checks Implementation
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include "xmlwitness/witness/verifier.h"
#include "xmlwitness/core/base64.h"
#include "xmlwitness/crypto/sha256.h"
#include "xmlwitness/util/logging.h"
#include "xmlwitness/witness/errors.h"

namespace xmlwitness {

size_t FindDataHash(const ByteVector& signedPayload, const ByteVector& signedInfo) {
    Hash256 digest = SHA256Hash(signedPayload);
    std::string encoded = EncodeBase64(digest.data(), digest.size());

    size_t index = FindBytes(signedInfo, encoded);
    if (index == NPOS) {
        LOG_WARN(util::LogCategory::CRYPTO) << "Payload digest " << encoded
                                            << " not present in SignedInfo";
        throw WitnessError(ErrorCode::DataHashNotFound, "Data hash not found in SignedInfo");
    }

    LOG_DEBUG(util::LogCategory::CRYPTO) << "Data hash at SignedInfo offset " << index;
    return index;
}

void VerifySignedInfo(const ByteVector& signedInfo, const BigNum& signature,
                      const RSAPublicKey& key) {
    bool valid = false;
    try {
        valid = VerifyPkcs1Sha1(signedInfo, signature, key);
    } catch (const std::invalid_argument& e) {
        // Modulus too small to hold a SHA-1 DigestInfo
        throw WitnessError(ErrorCode::RsaVerificationFailed,
                           std::string("RSA verification failed: ") + e.what());
    }

    if (!valid) {
        LOG_WARN(util::LogCategory::CRYPTO) << "signature^e mod n does not match the "
                                            << key.ModulusBytes() << "-byte PKCS#1 block";
        throw WitnessError(ErrorCode::RsaVerificationFailed, "RSA verification failed");
    }
}

} // namespace xmlwitness

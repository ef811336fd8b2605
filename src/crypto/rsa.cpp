// XMLWITNESS - RSA Public Key Operations Implementation
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include "xmlwitness/crypto/rsa.h"
#include "xmlwitness/crypto/sha1.h"

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/evp.h>

#include <stdexcept>

namespace xmlwitness {

namespace {

/// Minimum run of 0xFF padding bytes required by EMSA-PKCS1-v1_5
constexpr size_t MIN_PS_LENGTH = 8;

BigNum GetKeyParam(const EVP_PKEY* pkey, const char* name) {
    BIGNUM* bn = nullptr;
    if (EVP_PKEY_get_bn_param(pkey, name, &bn) != 1 || !bn) {
        throw std::runtime_error(std::string("Cannot read RSA parameter ") + name);
    }
    return BigNum::Adopt(bn);
}

} // anonymous namespace

RSAPublicKey RSAPublicKey::FromEvp(const evp_pkey_st* pkey) {
    if (!pkey || EVP_PKEY_get_base_id(pkey) != EVP_PKEY_RSA) {
        throw std::invalid_argument("Key is not an RSA key");
    }
    RSAPublicKey key;
    key.modulus = GetKeyParam(pkey, OSSL_PKEY_PARAM_RSA_N);
    key.exponent = GetKeyParam(pkey, OSSL_PKEY_PARAM_RSA_E);
    return key;
}

ByteVector EncodePkcs1Sha1Block(const Hash160& digest, size_t blockLen) {
    const size_t tLen = SHA1_DIGEST_INFO_PREFIX.size() + Hash160::SIZE;
    if (blockLen < tLen + 3 + MIN_PS_LENGTH) {
        throw std::invalid_argument("RSA block too short for a SHA-1 DigestInfo");
    }

    ByteVector block;
    block.reserve(blockLen);
    block.push_back(0x00);
    block.push_back(0x01);
    block.insert(block.end(), blockLen - tLen - 3, 0xFF);
    block.push_back(0x00);
    block.insert(block.end(), SHA1_DIGEST_INFO_PREFIX.begin(), SHA1_DIGEST_INFO_PREFIX.end());
    block.insert(block.end(), digest.begin(), digest.end());
    return block;
}

bool VerifyPkcs1Sha1(const ByteVector& message, const BigNum& signature,
                     const RSAPublicKey& key) {
    if (key.modulus.IsZero() || signature >= key.modulus) {
        return false;
    }

    ByteVector block = EncodePkcs1Sha1Block(SHA1Hash(message), key.ModulusBytes());
    BigNum expected = BigNum::FromBytes(block);
    BigNum recovered = BigNum::ModExp(signature, key.exponent, key.modulus);
    return expected == recovered;
}

} // namespace xmlwitness

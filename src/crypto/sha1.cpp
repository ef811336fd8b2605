// XMLWITNESS - SHA1 Implementation
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include "xmlwitness/crypto/sha1.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace xmlwitness {

Hash160 SHA1Hash(const Byte* data, size_t len) {
    Byte out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    if (EVP_Digest(data, len, out, &outLen, EVP_sha1(), nullptr) != 1 ||
        outLen != Hash160::SIZE) {
        throw std::runtime_error("SHA-1 digest failed");
    }
    return Hash160(out, outLen);
}

} // namespace xmlwitness

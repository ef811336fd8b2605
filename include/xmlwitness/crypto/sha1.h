// XMLWITNESS - SHA1 Hash Function
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// SHA-1 is only used to recompute the digest an RSA-SHA1 XML signature
// commits to. It is not used for anything security-relevant on its own.

#ifndef XMLWITNESS_CRYPTO_SHA1_H
#define XMLWITNESS_CRYPTO_SHA1_H

#include <cstddef>
#include "xmlwitness/core/types.h"

namespace xmlwitness {

/// Compute SHA-1 of data in a single call
Hash160 SHA1Hash(const Byte* data, size_t len);

inline Hash160 SHA1Hash(const ByteVector& data) {
    return SHA1Hash(data.data(), data.size());
}

} // namespace xmlwitness

#endif // XMLWITNESS_CRYPTO_SHA1_H

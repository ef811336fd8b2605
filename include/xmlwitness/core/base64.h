// XMLWITNESS - Base64 Encoding/Decoding Utilities
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// Standard (RFC 4648 section 4) base64 as used by XML-DSig DigestValue and
// SignatureValue elements. Backed by OpenSSL's EVP block codec.

#ifndef XMLWITNESS_CORE_BASE64_H
#define XMLWITNESS_CORE_BASE64_H

#include <cstddef>
#include <string>

#include "xmlwitness/core/types.h"

namespace xmlwitness {

/// Encode bytes as padded base64 without line breaks
std::string EncodeBase64(const Byte* data, size_t len);

inline std::string EncodeBase64(const ByteVector& data) {
    return EncodeBase64(data.data(), data.size());
}

/// Decode base64 text.
/// ASCII whitespace anywhere in the input is ignored (XML text nodes are
/// commonly wrapped at 64 or 76 columns).
/// @throws std::invalid_argument if the remaining text is not valid base64
ByteVector DecodeBase64(const std::string& text);

} // namespace xmlwitness

#endif // XMLWITNESS_CORE_BASE64_H

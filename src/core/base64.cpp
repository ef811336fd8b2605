// XMLWITNESS - Base64 Implementation
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include "xmlwitness/core/base64.h"

#include <openssl/evp.h>

#include <cctype>
#include <stdexcept>

namespace xmlwitness {

std::string EncodeBase64(const Byte* data, size_t len) {
    if (len == 0) {
        return "";
    }

    // 4 output chars per 3 input bytes, plus NUL written by OpenSSL
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data, static_cast<int>(len));
    if (written < 0) {
        throw std::runtime_error("Base64 encoding failed");
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

ByteVector DecodeBase64(const std::string& text) {
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(c);
        }
    }

    if (compact.empty()) {
        return {};
    }
    if (compact.size() % 4 != 0) {
        throw std::invalid_argument("Base64 input length is not a multiple of 4");
    }

    ByteVector out(compact.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(compact.data()),
                                  static_cast<int>(compact.size()));
    if (decoded < 0) {
        throw std::invalid_argument("Invalid base64 character");
    }

    // EVP_DecodeBlock emits zero bytes for the '=' padding; drop them
    size_t padding = 0;
    if (compact[compact.size() - 1] == '=') ++padding;
    if (compact[compact.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

} // namespace xmlwitness

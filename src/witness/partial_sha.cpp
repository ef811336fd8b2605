// XMLWITNESS - Partial SHA-256 Precomputation Implementation
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include "xmlwitness/witness/partial_sha.h"
#include "xmlwitness/crypto/sha256.h"
#include "xmlwitness/util/logging.h"
#include "xmlwitness/witness/errors.h"

namespace xmlwitness {

PaddedMessage Sha256Pad(const ByteVector& message, size_t maxShaBytes) {
    const uint64_t bitLength = static_cast<uint64_t>(message.size()) * 8;

    ByteVector padded(message);
    padded.push_back(0x80);
    while (padded.size() % SHA256::BLOCK_SIZE != 56) {
        padded.push_back(0x00);
    }
    for (int shift = 56; shift >= 0; shift -= 8) {
        padded.push_back(static_cast<Byte>(bitLength >> shift));
    }

    if (padded.size() > maxShaBytes) {
        throw WitnessError(ErrorCode::CapacityExceeded,
            "Padded message of " + std::to_string(padded.size()) +
            " bytes exceeds max of " + std::to_string(maxShaBytes));
    }

    PaddedMessage result;
    result.paddedLength = padded.size();
    padded.resize(maxShaBytes, 0x00);
    result.data = std::move(padded);
    return result;
}

PartialShaResult GeneratePartialSha(const ByteVector& body, size_t bodyLength,
                                    const std::string& selector,
                                    size_t maxRemainingLength) {
    if (body.size() % SHA256::BLOCK_SIZE != 0 || bodyLength > body.size()) {
        throw WitnessError(ErrorCode::InvalidParameters,
            "Body must be block aligned and at least bodyLength bytes");
    }
    if (maxRemainingLength == 0 || maxRemainingLength % SHA256::BLOCK_SIZE != 0) {
        throw WitnessError(ErrorCode::InvalidParameters,
            "maxRemainingLength must be a positive multiple of 64");
    }

    size_t selectorIndex = 0;
    if (!selector.empty()) {
        selectorIndex = FindBytes(body, selector);
        if (selectorIndex == NPOS) {
            throw WitnessError(ErrorCode::AnchorNotFound,
                "SHA precompute selector \"" + selector + "\" not found in the body");
        }
    }

    const size_t cut = (selectorIndex / SHA256::BLOCK_SIZE) * SHA256::BLOCK_SIZE;
    const size_t remainingLength = bodyLength > cut ? bodyLength - cut : 0;
    if (remainingLength > maxRemainingLength) {
        throw WitnessError(ErrorCode::CapacityExceeded,
            "Remaining data " + std::to_string(remainingLength) +
            " bytes is longer than max " + std::to_string(maxRemainingLength) +
            "; input too large for the configured maxInputLength");
    }

    PartialShaResult result;
    result.precomputedSha = SHA256Midstate(body.data(), cut);
    result.remainder.assign(body.begin() + static_cast<std::ptrdiff_t>(cut), body.end());
    // Bytes past remainingLength are zero, so trimming only drops padding
    result.remainder.resize(maxRemainingLength, 0x00);
    result.remainderLength = remainingLength;

    LogDebugF(util::LogCategory::WITNESS,
              "Partial SHA: selector at %zu, cut at %zu, %zu bytes remaining",
              selectorIndex, cut, remainingLength);
    return result;
}

} // namespace xmlwitness

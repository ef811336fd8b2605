// XMLWITNESS - Partial SHA-256 Precomputation
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// A circuit can only hash a bounded number of bytes. Everything before the
// block that contains the anchor is hashed on the host and handed to the
// circuit as a SHA-256 midstate; the circuit resumes from there over the
// remaining, already padded, blocks.

#ifndef XMLWITNESS_WITNESS_PARTIAL_SHA_H
#define XMLWITNESS_WITNESS_PARTIAL_SHA_H

#include <cstddef>
#include <string>

#include "xmlwitness/core/types.h"

namespace xmlwitness {

/// Message with SHA-256 padding, zero-extended to a fixed size
struct PaddedMessage {
    /// Padded message followed by zeros; size is the requested capacity
    ByteVector data;

    /// Length of message plus SHA-256 padding (multiple of 64)
    size_t paddedLength{0};
};

/// Append 0x80, zeros and the 64-bit big-endian bit length, then zero-extend
/// to maxShaBytes.
/// @throws WitnessError(CapacityExceeded) if the padded message is longer
///         than maxShaBytes
PaddedMessage Sha256Pad(const ByteVector& message, size_t maxShaBytes);

/// Split point of a padded message
struct PartialShaResult {
    /// SHA-256 chaining state after the blocks before the cut
    Hash256 precomputedSha;

    /// Bytes from the cut onwards, zero-extended to the capacity
    ByteVector remainder;

    /// Number of meaningful bytes in remainder (includes SHA padding)
    size_t remainderLength{0};
};

/**
 * Hash every whole block before the one containing `selector` and return the
 * rest.
 *
 * @param body Padded message (size a multiple of 64)
 * @param bodyLength Padded length of the message inside body
 * @param selector Byte string whose block starts the remainder
 * @param maxRemainingLength Circuit capacity (multiple of 64)
 * @throws WitnessError(AnchorNotFound) if selector does not occur in body
 * @throws WitnessError(CapacityExceeded) if the remainder exceeds the capacity
 * @throws WitnessError(InvalidParameters) on misaligned arguments
 */
PartialShaResult GeneratePartialSha(const ByteVector& body, size_t bodyLength,
                                    const std::string& selector,
                                    size_t maxRemainingLength);

} // namespace xmlwitness

#endif // XMLWITNESS_WITNESS_PARTIAL_SHA_H

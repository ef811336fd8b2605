// XMLWITNESS - SHA256 Hash Function
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// SHA-256 implementation following FIPS 180-4, with access to the chaining
// state so a hash can be split into a host-computed prefix and a tail that is
// resumed elsewhere (e.g. inside a circuit).

#ifndef XMLWITNESS_CRYPTO_SHA256_H
#define XMLWITNESS_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include "xmlwitness/core/types.h"

namespace xmlwitness {

/// SHA-256 hasher class
/// Provides incremental hashing plus midstate export/import
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Block size in bytes
    static constexpr size_t BLOCK_SIZE = 64;

    /// Default constructor - initializes to empty state
    SHA256();

    /// Write data to the hasher
    /// @param data Pointer to input data
    /// @param len Length of input data
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write to output
    /// @param hash Pointer to output buffer (must be at least OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    /// @return Reference to this hasher (for chaining)
    SHA256& Reset();

    /// Run the compression function over whole blocks without appending any
    /// padding. The input must already be block aligned (e.g. a buffer that
    /// carries its own Merkle-Damgard padding).
    /// @throws std::invalid_argument if len is not a multiple of BLOCK_SIZE
    /// @throws std::logic_error if buffered partial-block data is pending
    SHA256& Compress(const Byte* blocks, size_t len);

    /// Chaining state as 8 big-endian 32-bit words.
    /// Only defined on a block boundary.
    /// @throws std::logic_error if a partial block is buffered
    Hash256 GetMidstate() const;

    /// Resume hashing from a midstate produced by GetMidstate()
    /// @param midstate Chaining state (big-endian words)
    /// @param bytesProcessed Length of the prefix it covers (multiple of 64)
    /// @throws std::invalid_argument if bytesProcessed is not block aligned
    static SHA256 FromMidstate(const Hash256& midstate, uint64_t bytesProcessed);

private:
    /// Internal state (8 x 32-bit words)
    uint32_t state_[8];

    /// Buffer for partial block
    Byte buffer_[BLOCK_SIZE];

    /// Total bytes processed
    uint64_t bytes_;

    /// Transform a single 64-byte block
    void Transform(const Byte block[BLOCK_SIZE]);
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
/// @param data Input data
/// @param len Length of input
/// @return Hash256 containing the result
Hash256 SHA256Hash(const Byte* data, size_t len);

/// Compute SHA256 hash of a vector
inline Hash256 SHA256Hash(const ByteVector& data) {
    return SHA256Hash(data.data(), data.size());
}

/// Compute the SHA-256 chaining state after compressing data[0:len].
/// len must be a multiple of SHA256::BLOCK_SIZE; no padding is applied.
Hash256 SHA256Midstate(const Byte* data, size_t len);

} // namespace xmlwitness

#endif // XMLWITNESS_CRYPTO_SHA256_H

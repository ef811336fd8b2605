// XMLWITNESS - Arbitrary Precision Integers
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// Owning wrapper around OpenSSL BIGNUM plus the limb encoding used by
// circuit inputs: a value is split into fixed-width little-endian limbs so
// each limb stays far below the circuit field modulus.

#ifndef XMLWITNESS_CRYPTO_BIGNUM_H
#define XMLWITNESS_CRYPTO_BIGNUM_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "xmlwitness/core/types.h"

struct bignum_st;

namespace xmlwitness {

/// Non-negative arbitrary precision integer.
/// All operations that can fail inside OpenSSL throw std::runtime_error;
/// malformed textual input throws std::invalid_argument.
class BigNum {
public:
    /// Zero
    BigNum();

    /// From a machine word
    explicit BigNum(uint64_t value);

    BigNum(const BigNum& other);
    BigNum& operator=(const BigNum& other);
    BigNum(BigNum&& other) noexcept;
    BigNum& operator=(BigNum&& other) noexcept;
    ~BigNum();

    /// Interpret bytes as an unsigned big-endian integer
    static BigNum FromBytes(const Byte* data, size_t len);
    static BigNum FromBytes(const ByteVector& data) {
        return FromBytes(data.data(), data.size());
    }

    /// Parse a non-negative decimal string (digits only)
    static BigNum FromDecimal(const std::string& dec);

    /// Parse a non-negative hex string (optional 0x prefix)
    static BigNum FromHex(const std::string& hex);

    /// Take ownership of a BIGNUM allocated by OpenSSL
    static BigNum Adopt(bignum_st* bn);

    /// Minimal big-endian encoding (empty for zero)
    ByteVector ToBytes() const;

    /// Big-endian encoding left-padded with zeros to exactly len bytes
    /// @throws std::invalid_argument if the value needs more than len bytes
    ByteVector ToBytesPadded(size_t len) const;

    std::string ToDecimal() const;
    std::string ToHex() const;

    /// Number of significant bits (0 for zero)
    size_t NumBits() const;

    /// Number of bytes of the minimal encoding
    size_t NumBytes() const;

    bool IsZero() const;

    /// -1, 0 or 1
    int Compare(const BigNum& other) const;

    bool operator==(const BigNum& other) const { return Compare(other) == 0; }
    bool operator!=(const BigNum& other) const { return Compare(other) != 0; }
    bool operator<(const BigNum& other) const { return Compare(other) < 0; }
    bool operator<=(const BigNum& other) const { return Compare(other) <= 0; }
    bool operator>(const BigNum& other) const { return Compare(other) > 0; }
    bool operator>=(const BigNum& other) const { return Compare(other) >= 0; }

    BigNum operator+(const BigNum& other) const;
    BigNum operator<<(int bits) const;
    BigNum operator>>(int bits) const;

    /// Keep only the low `bits` bits
    BigNum LowBits(size_t bits) const;

    /// base^exp mod m
    /// @throws std::invalid_argument if m is zero
    static BigNum ModExp(const BigNum& base, const BigNum& exp, const BigNum& m);

    /// Raw access for OpenSSL interop
    const bignum_st* get() const { return bn_; }
    bignum_st* get() { return bn_; }

private:
    bignum_st* bn_;
};

// ============================================================================
// Limb Encoding
// ============================================================================

/// Split value into numChunks limbs of bitsPerChunk bits, limb 0 least
/// significant.
/// @throws std::invalid_argument if bitsPerChunk or numChunks is zero, or the
///         value needs more than bitsPerChunk * numChunks bits
std::vector<BigNum> SplitIntoChunks(const BigNum& value, size_t bitsPerChunk,
                                    size_t numChunks);

/// Inverse of SplitIntoChunks: sum of chunks[i] << (i * bitsPerChunk)
BigNum CombineChunks(const std::vector<BigNum>& chunks, size_t bitsPerChunk);

/// Decimal rendering of each limb
std::vector<std::string> ChunksToDecimal(const std::vector<BigNum>& chunks);

} // namespace xmlwitness

#endif // XMLWITNESS_CRYPTO_BIGNUM_H

// XMLWITNESS - Core Types Header
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// This file defines fundamental types used throughout XMLWITNESS.

#ifndef XMLWITNESS_CORE_TYPES_H
#define XMLWITNESS_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace xmlwitness {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Owned byte buffer
using ByteVector = std::vector<Byte>;

/// Convert a string to its raw bytes (no encoding conversion)
inline ByteVector ToBytes(const std::string& str) {
    return ByteVector(str.begin(), str.end());
}

/// Convert raw bytes to a string (no encoding conversion)
inline std::string ToString(const ByteVector& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

/// Sentinel returned by FindBytes when the needle is absent
constexpr size_t NPOS = static_cast<size_t>(-1);

/// Offset of the first occurrence of needle in haystack at or after `from`.
/// An empty needle matches at `from` when from <= haystack.size().
inline size_t FindBytes(const ByteVector& haystack, const std::string& needle,
                        size_t from = 0) {
    if (from > haystack.size()) {
        return NPOS;
    }
    auto it = std::search(haystack.begin() + static_cast<std::ptrdiff_t>(from), haystack.end(),
                          needle.begin(), needle.end(),
                          [](Byte a, char b) { return a == static_cast<Byte>(b); });
    return it == haystack.end() && !needle.empty()
        ? NPOS
        : static_cast<size_t>(it - haystack.begin());
}

// ============================================================================
// Digest Template
// ============================================================================

/// Fixed-size message digest, stored in the order the hash function emits it
template<size_t BITS>
class BaseDigest {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null digest
    BaseDigest() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseDigest(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes
    BaseDigest(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    /// Check if digest is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Size in bytes
    constexpr size_t size() const noexcept { return SIZE; }

    /// Element access
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    /// Raw data access
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    /// Iterators
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseDigest& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseDigest& other) const noexcept {
        return !(*this == other);
    }

    /// Copy out as an owned buffer
    ByteVector ToVector() const {
        return ByteVector(data_.begin(), data_.end());
    }

    /// Convert to lowercase hex string
    std::string ToHex() const;

    /// Create from hex string (must be exactly SIZE*2 characters)
    static BaseDigest FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Digest Types
// ============================================================================

/// 256-bit digest (SHA-256 output or chaining state)
class Hash256 : public BaseDigest<256> {
public:
    using BaseDigest<256>::BaseDigest;
    Hash256() = default;
    Hash256(const BaseDigest<256>& other) : BaseDigest<256>(other) {}
};

/// 160-bit digest (SHA-1 output)
class Hash160 : public BaseDigest<160> {
public:
    using BaseDigest<160>::BaseDigest;
    Hash160() = default;
    Hash160(const BaseDigest<160>& other) : BaseDigest<160>(other) {}
};

} // namespace xmlwitness

#endif // XMLWITNESS_CORE_TYPES_H

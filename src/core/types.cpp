// XMLWITNESS - Core Types Implementation
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include "xmlwitness/core/types.h"
#include "xmlwitness/core/hex.h"

namespace xmlwitness {

// ============================================================================
// BaseDigest Implementation
// ============================================================================

template<size_t BITS>
std::string BaseDigest<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseDigest<BITS> BaseDigest<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for digest");
    }

    auto bytes = HexToBytes(hex);
    return BaseDigest(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseDigest<160>;
template class BaseDigest<256>;

} // namespace xmlwitness

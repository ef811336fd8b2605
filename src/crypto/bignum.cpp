// XMLWITNESS - Arbitrary Precision Integer Implementation
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include "xmlwitness/crypto/bignum.h"

#include <openssl/bn.h>
#include <openssl/crypto.h>

#include <cctype>
#include <memory>
#include <stdexcept>
#include <utility>

namespace xmlwitness {

namespace {

BIGNUM* NewOrThrow() {
    BIGNUM* bn = BN_new();
    if (!bn) {
        throw std::runtime_error("BN_new failed");
    }
    return bn;
}

struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};

struct OpenSSLStringDeleter {
    void operator()(char* s) const { OPENSSL_free(s); }
};

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

BigNum::BigNum() : bn_(NewOrThrow()) {
    BN_zero(bn_);
}

BigNum::BigNum(uint64_t value) : bn_(NewOrThrow()) {
    // BN_set_word takes BN_ULONG, which may be 32 bits
    BN_zero(bn_);
    for (int shift = 56; shift >= 0; shift -= 8) {
        if (!BN_lshift(bn_, bn_, 8) ||
            !BN_add_word(bn_, static_cast<BN_ULONG>((value >> shift) & 0xFF))) {
            BN_free(bn_);
            throw std::runtime_error("BigNum construction failed");
        }
    }
}

BigNum::BigNum(const BigNum& other) : bn_(BN_dup(other.bn_)) {
    if (!bn_) {
        throw std::runtime_error("BN_dup failed");
    }
}

BigNum& BigNum::operator=(const BigNum& other) {
    if (this != &other) {
        if (!BN_copy(bn_, other.bn_)) {
            throw std::runtime_error("BN_copy failed");
        }
    }
    return *this;
}

BigNum::BigNum(BigNum&& other) noexcept : bn_(other.bn_) {
    other.bn_ = nullptr;
}

BigNum& BigNum::operator=(BigNum&& other) noexcept {
    if (this != &other) {
        if (bn_) BN_free(bn_);
        bn_ = other.bn_;
        other.bn_ = nullptr;
    }
    return *this;
}

BigNum::~BigNum() {
    if (bn_) BN_free(bn_);
}

BigNum BigNum::Adopt(bignum_st* bn) {
    if (!bn) {
        throw std::invalid_argument("Cannot adopt a null BIGNUM");
    }
    BigNum result;
    BN_free(result.bn_);
    result.bn_ = bn;
    return result;
}

BigNum BigNum::FromBytes(const Byte* data, size_t len) {
    BigNum result;
    if (len > 0 && !BN_bin2bn(data, static_cast<int>(len), result.bn_)) {
        throw std::runtime_error("BN_bin2bn failed");
    }
    return result;
}

BigNum BigNum::FromDecimal(const std::string& dec) {
    if (dec.empty()) {
        throw std::invalid_argument("Empty decimal string");
    }
    for (char c : dec) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Invalid decimal string: " + dec);
        }
    }
    BIGNUM* bn = nullptr;
    if (BN_dec2bn(&bn, dec.c_str()) != static_cast<int>(dec.size())) {
        BN_free(bn);
        throw std::invalid_argument("Invalid decimal string: " + dec);
    }
    return Adopt(bn);
}

BigNum BigNum::FromHex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.empty()) {
        throw std::invalid_argument("Empty hex string");
    }
    for (char c : digits) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Invalid hex string: " + hex);
        }
    }
    BIGNUM* bn = nullptr;
    if (BN_hex2bn(&bn, digits.c_str()) != static_cast<int>(digits.size())) {
        BN_free(bn);
        throw std::invalid_argument("Invalid hex string: " + hex);
    }
    return Adopt(bn);
}

// ============================================================================
// Conversion
// ============================================================================

ByteVector BigNum::ToBytes() const {
    ByteVector out(NumBytes());
    if (!out.empty()) {
        BN_bn2bin(bn_, out.data());
    }
    return out;
}

ByteVector BigNum::ToBytesPadded(size_t len) const {
    if (NumBytes() > len) {
        throw std::invalid_argument("Value does not fit in " + std::to_string(len) + " bytes");
    }
    ByteVector out(len);
    if (len > 0 && BN_bn2binpad(bn_, out.data(), static_cast<int>(len)) < 0) {
        throw std::runtime_error("BN_bn2binpad failed");
    }
    return out;
}

std::string BigNum::ToDecimal() const {
    std::unique_ptr<char, OpenSSLStringDeleter> s(BN_bn2dec(bn_));
    if (!s) {
        throw std::runtime_error("BN_bn2dec failed");
    }
    return std::string(s.get());
}

std::string BigNum::ToHex() const {
    std::unique_ptr<char, OpenSSLStringDeleter> s(BN_bn2hex(bn_));
    if (!s) {
        throw std::runtime_error("BN_bn2hex failed");
    }
    std::string out(s.get());
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

size_t BigNum::NumBits() const {
    return static_cast<size_t>(BN_num_bits(bn_));
}

size_t BigNum::NumBytes() const {
    return static_cast<size_t>(BN_num_bytes(bn_));
}

bool BigNum::IsZero() const {
    return BN_is_zero(bn_) != 0;
}

int BigNum::Compare(const BigNum& other) const {
    int c = BN_cmp(bn_, other.bn_);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

// ============================================================================
// Arithmetic
// ============================================================================

BigNum BigNum::operator+(const BigNum& other) const {
    BigNum result;
    if (!BN_add(result.bn_, bn_, other.bn_)) {
        throw std::runtime_error("BN_add failed");
    }
    return result;
}

BigNum BigNum::operator<<(int bits) const {
    BigNum result;
    if (!BN_lshift(result.bn_, bn_, bits)) {
        throw std::runtime_error("BN_lshift failed");
    }
    return result;
}

BigNum BigNum::operator>>(int bits) const {
    BigNum result;
    if (!BN_rshift(result.bn_, bn_, bits)) {
        throw std::runtime_error("BN_rshift failed");
    }
    return result;
}

BigNum BigNum::LowBits(size_t bits) const {
    BigNum result(*this);
    // BN_mask_bits fails when the value is already shorter than bits
    if (NumBits() > bits && !BN_mask_bits(result.bn_, static_cast<int>(bits))) {
        throw std::runtime_error("BN_mask_bits failed");
    }
    return result;
}

BigNum BigNum::ModExp(const BigNum& base, const BigNum& exp, const BigNum& m) {
    if (m.IsZero()) {
        throw std::invalid_argument("Modulus must be non-zero");
    }
    std::unique_ptr<BN_CTX, BnCtxDeleter> ctx(BN_CTX_new());
    if (!ctx) {
        throw std::runtime_error("BN_CTX_new failed");
    }
    BigNum result;
    if (!BN_mod_exp(result.bn_, base.bn_, exp.bn_, m.bn_, ctx.get())) {
        throw std::runtime_error("BN_mod_exp failed");
    }
    return result;
}

// ============================================================================
// Limb Encoding
// ============================================================================

std::vector<BigNum> SplitIntoChunks(const BigNum& value, size_t bitsPerChunk,
                                    size_t numChunks) {
    if (bitsPerChunk == 0 || numChunks == 0) {
        throw std::invalid_argument("Chunk width and count must be positive");
    }
    if (value.NumBits() > bitsPerChunk * numChunks) {
        throw std::invalid_argument(
            "Value of " + std::to_string(value.NumBits()) + " bits does not fit in " +
            std::to_string(numChunks) + " chunks of " + std::to_string(bitsPerChunk) + " bits");
    }

    std::vector<BigNum> chunks;
    chunks.reserve(numChunks);
    BigNum rest(value);
    for (size_t i = 0; i < numChunks; ++i) {
        chunks.push_back(rest.LowBits(bitsPerChunk));
        rest = rest >> static_cast<int>(bitsPerChunk);
    }
    return chunks;
}

BigNum CombineChunks(const std::vector<BigNum>& chunks, size_t bitsPerChunk) {
    BigNum result;
    for (size_t i = chunks.size(); i-- > 0;) {
        result = (result << static_cast<int>(bitsPerChunk)) + chunks[i];
    }
    return result;
}

std::vector<std::string> ChunksToDecimal(const std::vector<BigNum>& chunks) {
    std::vector<std::string> out;
    out.reserve(chunks.size());
    for (const auto& c : chunks) {
        out.push_back(c.ToDecimal());
    }
    return out;
}

} // namespace xmlwitness

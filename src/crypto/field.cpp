// XMLWITNESS - Circuit Field Implementation
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include "xmlwitness/crypto/field.h"

namespace xmlwitness {
namespace field {

const BigNum& Modulus() {
    static const BigNum modulus = BigNum::FromHex(BN254_MODULUS_HEX);
    return modulus;
}

bool IsFieldElement(const BigNum& value) {
    return value < Modulus();
}

} // namespace field
} // namespace xmlwitness

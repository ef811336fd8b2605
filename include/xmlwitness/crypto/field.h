// XMLWITNESS - Circuit Field
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// Bounds of the BN254 scalar field in which the witness circuit operates.
// p = 21888242871839275222246405745257275088548364400416034343698204186575808495617

#ifndef XMLWITNESS_CRYPTO_FIELD_H
#define XMLWITNESS_CRYPTO_FIELD_H

#include "xmlwitness/crypto/bignum.h"

namespace xmlwitness {
namespace field {

/// BN254 scalar field modulus in hex
constexpr const char* BN254_MODULUS_HEX =
    "30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001";

/// The BN254 scalar field modulus
const BigNum& Modulus();

/// True if 0 <= value < p
bool IsFieldElement(const BigNum& value);

} // namespace field
} // namespace xmlwitness

#endif // XMLWITNESS_CRYPTO_FIELD_H

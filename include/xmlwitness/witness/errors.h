// XMLWITNESS - Witness Errors
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// Every failure of the witness pipeline is fatal and surfaces as a
// WitnessError carrying a machine-checkable code.

#ifndef XMLWITNESS_WITNESS_ERRORS_H
#define XMLWITNESS_WITNESS_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace xmlwitness {

/// Failure categories of witness generation
enum class ErrorCode : uint8_t {
    InvalidSeed,
    InvalidParameters,
    MalformedXml,
    ReferenceCount,
    PublicKeyUnavailable,
    TransformFailed,
    DataHashNotFound,
    RsaVerificationFailed,
    AnchorNotFound,
    DocumentTypeNotFound,
    RevealStartNotFound,
    RevealEndNotFound,
    CapacityExceeded,
    CryptoEngine,
};

/// Get string name of an error code
const char* ErrorCodeToString(ErrorCode code);

/// Exception thrown by the extraction, verification and assembly stages
class WitnessError : public std::runtime_error {
public:
    WitnessError(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode Code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace xmlwitness

#endif // XMLWITNESS_WITNESS_ERRORS_H

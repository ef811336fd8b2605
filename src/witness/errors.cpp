// XMLWITNESS - Witness Errors Implementation
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include "xmlwitness/witness/errors.h"

namespace xmlwitness {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidSeed:           return "InvalidSeed";
        case ErrorCode::InvalidParameters:     return "InvalidParameters";
        case ErrorCode::MalformedXml:          return "MalformedXml";
        case ErrorCode::ReferenceCount:        return "ReferenceCount";
        case ErrorCode::PublicKeyUnavailable:  return "PublicKeyUnavailable";
        case ErrorCode::TransformFailed:       return "TransformFailed";
        case ErrorCode::DataHashNotFound:      return "DataHashNotFound";
        case ErrorCode::RsaVerificationFailed: return "RsaVerificationFailed";
        case ErrorCode::AnchorNotFound:        return "AnchorNotFound";
        case ErrorCode::DocumentTypeNotFound:  return "DocumentTypeNotFound";
        case ErrorCode::RevealStartNotFound:   return "RevealStartNotFound";
        case ErrorCode::RevealEndNotFound:     return "RevealEndNotFound";
        case ErrorCode::CapacityExceeded:      return "CapacityExceeded";
        case ErrorCode::CryptoEngine:          return "CryptoEngine";
    }
    return "Unknown";
}

} // namespace xmlwitness

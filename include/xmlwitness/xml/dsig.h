// XMLWITNESS - XML Signature Extraction
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// Pulls the pieces of an enveloped XML-DSig signature that a witness needs:
// the RSA public key, the canonicalized bytes covered by the single
// <Reference>, the canonical <SignedInfo> and the raw <SignatureValue>.
//
// Parsing, reference transforms and canonicalization are done by libxml2 and
// xmlsec (OpenSSL backend). The signature itself is NOT verified here; the
// witness assembler re-checks it with explicit big-integer arithmetic.

#ifndef XMLWITNESS_XML_DSIG_H
#define XMLWITNESS_XML_DSIG_H

#include <string>

#include "xmlwitness/core/types.h"
#include "xmlwitness/crypto/rsa.h"

namespace xmlwitness {
namespace xml {

// ============================================================================
// Crypto Engine Lifetime
// ============================================================================

/**
 * Process-wide setup of libxml2, xmlsec and the xmlsec OpenSSL backend.
 *
 * Initialize() and Shutdown() are idempotent and serialized by a mutex.
 * The engine must be initialized before ExtractSignedXml() is called, and
 * must not be shut down while another thread is extracting.
 */
class CryptoEngine {
public:
    /// @return true if this call started the engine, false if it was running
    /// @throws WitnessError(ErrorCode::CryptoEngine) if a library fails to start
    static bool Initialize();

    static void Shutdown();

    static bool IsInitialized();
};

/// RAII guard: initializes the engine and shuts it down on destruction,
/// unless the engine was already running when the guard was created.
class ScopedCryptoEngine {
public:
    ScopedCryptoEngine();
    ~ScopedCryptoEngine();

    ScopedCryptoEngine(const ScopedCryptoEngine&) = delete;
    ScopedCryptoEngine& operator=(const ScopedCryptoEngine&) = delete;

private:
    bool owner_;
};

// ============================================================================
// Extraction
// ============================================================================

/// Signature material of one signed document
struct SignedXmlParts {
    /// Key resolved from <KeyInfo> (RSAKeyValue or X509Data)
    RSAPublicKey publicKey;

    /// Output of the reference transforms (the bytes that were digested)
    ByteVector signedPayload;

    /// <SignedInfo> canonicalized with its CanonicalizationMethod
    ByteVector signedInfo;

    /// Text content of <SignatureValue>, whitespace preserved
    std::string signatureBase64;
};

/**
 * Extract the signature material from a signed XML document.
 *
 * @param xml Complete document text
 * @return Extracted parts
 * @throws WitnessError with ErrorCode::CryptoEngine, MalformedXml,
 *         ReferenceCount, TransformFailed or PublicKeyUnavailable
 */
SignedXmlParts ExtractSignedXml(const std::string& xml);

} // namespace xml
} // namespace xmlwitness

#endif // XMLWITNESS_XML_DSIG_H

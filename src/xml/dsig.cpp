// XMLWITNESS - XML Signature Extraction Implementation
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include "xmlwitness/xml/dsig.h"
#include "xmlwitness/util/logging.h"
#include "xmlwitness/witness/errors.h"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <xmlsec/xmlsec.h>
#include <xmlsec/crypto.h>
#include <xmlsec/errors.h>
#include <xmlsec/keyinfo.h>
#include <xmlsec/keysmngr.h>
#include <xmlsec/membuf.h>
#include <xmlsec/nodeset.h>
#include <xmlsec/transforms.h>
#include <xmlsec/xmldsig.h>
#include <xmlsec/xmltree.h>
#include <xmlsec/openssl/crypto.h>
#include <xmlsec/openssl/evp.h>

#include <climits>
#include <cstdarg>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace xmlwitness {
namespace xml {

namespace {

// ============================================================================
// Native Handle Ownership
// ============================================================================

template<typename T, void (*Destroy)(T*)>
struct Releaser {
    void operator()(T* p) const {
        if (p) Destroy(p);
    }
};

struct XmlCharReleaser {
    void operator()(xmlChar* p) const {
        if (p) xmlFree(p);
    }
};

using DocPtr = std::unique_ptr<xmlDoc, Releaser<xmlDoc, xmlFreeDoc>>;
using KeysMngrPtr = std::unique_ptr<xmlSecKeysMngr, Releaser<xmlSecKeysMngr, xmlSecKeysMngrDestroy>>;
using DSigCtxPtr = std::unique_ptr<xmlSecDSigCtx, Releaser<xmlSecDSigCtx, xmlSecDSigCtxDestroy>>;
using ReferenceCtxPtr = std::unique_ptr<xmlSecDSigReferenceCtx,
    Releaser<xmlSecDSigReferenceCtx, xmlSecDSigReferenceCtxDestroy>>;
using TransformCtxPtr = std::unique_ptr<xmlSecTransformCtx,
    Releaser<xmlSecTransformCtx, xmlSecTransformCtxDestroy>>;
using NodeSetPtr = std::unique_ptr<xmlSecNodeSet, Releaser<xmlSecNodeSet, xmlSecNodeSetDestroy>>;
using KeyInfoCtxPtr = std::unique_ptr<xmlSecKeyInfoCtx, Releaser<xmlSecKeyInfoCtx, xmlSecKeyInfoCtxDestroy>>;
using KeyPtr = std::unique_ptr<xmlSecKey, Releaser<xmlSecKey, xmlSecKeyDestroy>>;
using XmlStringPtr = std::unique_ptr<xmlChar, XmlCharReleaser>;

// ============================================================================
// Library Diagnostics
// ============================================================================

void XmlSecErrorCallback(const char* file, int line, const char* func,
                         const char* errorObject, const char* errorSubject,
                         int reason, const char* msg) {
    (void)file;
    (void)line;
    LOG_DEBUG(util::LogCategory::XML)
        << "xmlsec: " << (func ? func : "?")
        << " obj=" << (errorObject ? errorObject : "unknown")
        << " subj=" << (errorSubject ? errorSubject : "unknown")
        << " reason=" << reason
        << " " << (msg ? msg : "");
}

void LibXmlErrorHandler(void* ctx, const char* format, ...) {
    (void)ctx;
    va_list args;
    va_start(args, format);
    va_list sizing;
    va_copy(sizing, args);
    int needed = vsnprintf(nullptr, 0, format, sizing);
    va_end(sizing);

    std::string message;
    if (needed > 0) {
        std::vector<char> buffer(static_cast<size_t>(needed) + 1);
        vsnprintf(buffer.data(), buffer.size(), format, args);
        message.assign(buffer.data(), static_cast<size_t>(needed));
    }
    va_end(args);

    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    if (!message.empty()) {
        LOG_DEBUG(util::LogCategory::XML) << "libxml2: " << message;
    }
}

// ============================================================================
// Engine State
// ============================================================================

std::mutex g_engineMutex;
bool g_engineInitialized = false;

[[noreturn]] void Fail(ErrorCode code, const std::string& message) {
    LOG_WARN(util::LogCategory::XML) << message;
    throw WitnessError(code, message);
}

ByteVector CopyBuffer(xmlSecBufferPtr buffer) {
    if (!buffer) {
        return {};
    }
    const xmlSecByte* data = xmlSecBufferGetData(buffer);
    xmlSecSize size = xmlSecBufferGetSize(buffer);
    if (!data || size == 0) {
        return {};
    }
    return ByteVector(data, data + size);
}

size_t CountReferences(xmlNodePtr signedInfoNode) {
    size_t count = 0;
    for (xmlNodePtr cur = xmlSecGetNextElementNode(signedInfoNode->children);
         cur != nullptr;
         cur = xmlSecGetNextElementNode(cur->next)) {
        if (xmlSecCheckNodeName(cur, xmlSecNodeReference, xmlSecDSigNs)) {
            ++count;
        }
    }
    return count;
}

// ============================================================================
// Extraction Stages
// ============================================================================

ByteVector ApplyReferenceTransforms(xmlSecKeysMngrPtr keysMngr, xmlNodePtr referenceNode) {
    DSigCtxPtr dsigCtx(xmlSecDSigCtxCreate(keysMngr));
    if (!dsigCtx) {
        Fail(ErrorCode::CryptoEngine, "Failed to create signature context");
    }
    dsigCtx->flags |= XMLSEC_DSIG_FLAGS_STORE_SIGNEDINFO_REFERENCES;
    dsigCtx->operation = xmlSecTransformOperationVerify;

    ReferenceCtxPtr refCtx(xmlSecDSigReferenceCtxCreate(dsigCtx.get(),
                                                        xmlSecDSigReferenceOriginSignedInfo));
    if (!refCtx) {
        Fail(ErrorCode::CryptoEngine, "Failed to create reference context");
    }

    // A digest mismatch is not an error here: the stored payload is what the
    // witness is built from, and the data-hash search rejects tampering.
    if (xmlSecDSigReferenceCtxProcessNode(refCtx.get(), referenceNode) < 0) {
        Fail(ErrorCode::TransformFailed, "Failed to apply reference transforms");
    }

    LOG_DEBUG(util::LogCategory::XML) << "Reference digest "
        << (refCtx->status == xmlSecDSigStatusSucceeded ? "matches" : "does not match");

    xmlSecBufferPtr preDigest = xmlSecDSigReferenceCtxGetPreDigestBuffer(refCtx.get());
    if (!preDigest) {
        Fail(ErrorCode::TransformFailed, "Reference transforms produced no output");
    }
    return CopyBuffer(preDigest);
}

ByteVector CanonicalizeSignedInfo(xmlDocPtr doc, xmlNodePtr signedInfoNode) {
    xmlNodePtr c14nNode = xmlSecFindChild(signedInfoNode, xmlSecNodeCanonicalizationMethod,
                                          xmlSecDSigNs);
    if (!c14nNode) {
        Fail(ErrorCode::MalformedXml, "CanonicalizationMethod node not found");
    }

    TransformCtxPtr ctx(xmlSecTransformCtxCreate());
    if (!ctx) {
        Fail(ErrorCode::CryptoEngine, "Failed to create transform context");
    }

    if (!xmlSecTransformCtxNodeRead(ctx.get(), c14nNode, xmlSecTransformUsageC14NMethod)) {
        Fail(ErrorCode::TransformFailed, "Unsupported SignedInfo canonicalization method");
    }

    xmlSecTransformPtr memBuf = xmlSecTransformCtxCreateAndAppend(ctx.get(),
                                                                  xmlSecTransformMemBufId);
    if (!memBuf) {
        Fail(ErrorCode::CryptoEngine, "Failed to create memory buffer transform");
    }

    NodeSetPtr nodes(xmlSecNodeSetGetChildren(doc, signedInfoNode, 1, 0));
    if (!nodes) {
        Fail(ErrorCode::TransformFailed, "Failed to select SignedInfo nodes");
    }

    if (xmlSecTransformCtxXmlExecute(ctx.get(), nodes.get()) < 0) {
        Fail(ErrorCode::TransformFailed, "Failed to canonicalize SignedInfo");
    }

    return CopyBuffer(xmlSecTransformMemBufGetBuffer(memBuf));
}

RSAPublicKey ResolvePublicKey(xmlSecKeysMngrPtr keysMngr, xmlNodePtr signatureNode) {
    xmlNodePtr keyInfoNode = xmlSecFindChild(signatureNode, xmlSecNodeKeyInfo, xmlSecDSigNs);
    if (!keyInfoNode) {
        Fail(ErrorCode::PublicKeyUnavailable, "Public key not found in KeyInfo: no KeyInfo node");
    }

    KeyInfoCtxPtr keyInfoCtx(xmlSecKeyInfoCtxCreate(keysMngr));
    if (!keyInfoCtx) {
        Fail(ErrorCode::CryptoEngine, "Failed to create key info context");
    }
    // Certificate trust is the verifier's concern, not the witness generator's
    keyInfoCtx->flags |= XMLSEC_KEYINFO_FLAGS_X509DATA_DONT_VERIFY_CERTS;
    keyInfoCtx->keyReq.keyId = xmlSecOpenSSLKeyDataRsaId;
    keyInfoCtx->keyReq.keyType = xmlSecKeyDataTypePublic;
    keyInfoCtx->keyReq.keyUsage = xmlSecKeyUsageVerify;

    KeyPtr key(xmlSecKeysMngrGetKey(keyInfoNode, keyInfoCtx.get()));
    if (!key || !xmlSecKeyGetValue(key.get())) {
        Fail(ErrorCode::PublicKeyUnavailable, "Public key not found in KeyInfo");
    }

    EVP_PKEY* pkey = xmlSecOpenSSLEvpKeyDataGetEvp(xmlSecKeyGetValue(key.get()));
    try {
        return RSAPublicKey::FromEvp(pkey);
    } catch (const std::invalid_argument& e) {
        Fail(ErrorCode::PublicKeyUnavailable, std::string("Public key not usable: ") + e.what());
    }
}

std::string ReadSignatureValue(xmlNodePtr signatureNode) {
    xmlNodePtr valueNode = xmlSecFindChild(signatureNode, xmlSecNodeSignatureValue, xmlSecDSigNs);
    if (!valueNode) {
        Fail(ErrorCode::MalformedXml, "SignatureValue node not found");
    }
    XmlStringPtr content(xmlNodeGetContent(valueNode));
    if (!content) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(content.get()));
}

} // anonymous namespace

// ============================================================================
// CryptoEngine
// ============================================================================

bool CryptoEngine::Initialize() {
    std::lock_guard<std::mutex> lock(g_engineMutex);
    if (g_engineInitialized) {
        return false;
    }

    LIBXML_TEST_VERSION
    xmlSetGenericErrorFunc(nullptr, LibXmlErrorHandler);

    if (xmlSecInit() < 0) {
        throw WitnessError(ErrorCode::CryptoEngine, "xmlsec initialization failed");
    }
    if (xmlSecCheckVersion() != 1) {
        xmlSecShutdown();
        throw WitnessError(ErrorCode::CryptoEngine, "Loaded xmlsec library version is not compatible");
    }
    xmlSecErrorsSetCallback(XmlSecErrorCallback);

    if (xmlSecCryptoAppInit(nullptr) < 0) {
        xmlSecShutdown();
        throw WitnessError(ErrorCode::CryptoEngine, "xmlsec crypto application initialization failed");
    }
    if (xmlSecCryptoInit() < 0) {
        xmlSecCryptoAppShutdown();
        xmlSecShutdown();
        throw WitnessError(ErrorCode::CryptoEngine, "xmlsec-crypto initialization failed");
    }

    g_engineInitialized = true;
    LOG_DEBUG(util::LogCategory::XML) << "Crypto engine initialized";
    return true;
}

void CryptoEngine::Shutdown() {
    std::lock_guard<std::mutex> lock(g_engineMutex);
    if (!g_engineInitialized) {
        return;
    }

    xmlSecCryptoShutdown();
    xmlSecCryptoAppShutdown();
    xmlSecErrorsSetCallback(xmlSecErrorsDefaultCallback);
    xmlSecShutdown();
    xmlSetGenericErrorFunc(nullptr, nullptr);

    g_engineInitialized = false;
    LOG_DEBUG(util::LogCategory::XML) << "Crypto engine shut down";
}

bool CryptoEngine::IsInitialized() {
    std::lock_guard<std::mutex> lock(g_engineMutex);
    return g_engineInitialized;
}

ScopedCryptoEngine::ScopedCryptoEngine() : owner_(CryptoEngine::Initialize()) {}

ScopedCryptoEngine::~ScopedCryptoEngine() {
    if (owner_) {
        CryptoEngine::Shutdown();
    }
}

// ============================================================================
// ExtractSignedXml
// ============================================================================

SignedXmlParts ExtractSignedXml(const std::string& xml) {
    if (!CryptoEngine::IsInitialized()) {
        throw WitnessError(ErrorCode::CryptoEngine, "Crypto engine is not initialized");
    }
    if (xml.empty() || xml.size() > static_cast<size_t>(INT_MAX)) {
        Fail(ErrorCode::MalformedXml, "XML could not be parsed: invalid document size");
    }

    DocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, nullptr,
                             XML_PARSE_NONET));
    if (!doc || !xmlDocGetRootElement(doc.get())) {
        Fail(ErrorCode::MalformedXml, "XML could not be parsed");
    }

    xmlNodePtr root = xmlDocGetRootElement(doc.get());
    static const xmlChar* idAttrs[] = {
        BAD_CAST "Id", BAD_CAST "ID", BAD_CAST "id", nullptr
    };
    xmlSecAddIDs(doc.get(), root, idAttrs);

    xmlNodePtr signatureNode = xmlSecFindNode(root, xmlSecNodeSignature, xmlSecDSigNs);
    if (!signatureNode) {
        Fail(ErrorCode::MalformedXml, "Signature node not found");
    }
    xmlNodePtr signedInfoNode = xmlSecFindChild(signatureNode, xmlSecNodeSignedInfo, xmlSecDSigNs);
    if (!signedInfoNode) {
        Fail(ErrorCode::MalformedXml, "SignedInfo node not found");
    }

    size_t references = CountReferences(signedInfoNode);
    if (references != 1) {
        Fail(ErrorCode::ReferenceCount,
             "XML must contain exactly one reference, found " + std::to_string(references));
    }
    xmlNodePtr referenceNode = xmlSecFindChild(signedInfoNode, xmlSecNodeReference, xmlSecDSigNs);

    KeysMngrPtr keysMngr(xmlSecKeysMngrCreate());
    if (!keysMngr || xmlSecCryptoAppDefaultKeysMngrInit(keysMngr.get()) < 0) {
        Fail(ErrorCode::CryptoEngine, "Failed to initialize keys manager");
    }

    SignedXmlParts parts;
    parts.signedPayload = ApplyReferenceTransforms(keysMngr.get(), referenceNode);
    parts.signedInfo = CanonicalizeSignedInfo(doc.get(), signedInfoNode);
    parts.publicKey = ResolvePublicKey(keysMngr.get(), signatureNode);
    parts.signatureBase64 = ReadSignatureValue(signatureNode);

    LOG_DEBUG(util::LogCategory::XML) << "Extracted signature: payload "
        << parts.signedPayload.size() << " bytes, SignedInfo "
        << parts.signedInfo.size() << " bytes, "
        << parts.publicKey.modulus.NumBits() << "-bit key";

    return parts;
}

} // namespace xml
} // namespace xmlwitness

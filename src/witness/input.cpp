// XMLWITNESS - Circuit Input Generation Implementation
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include "xmlwitness/witness/input.h"
#include "xmlwitness/core/base64.h"
#include "xmlwitness/crypto/field.h"
#include "xmlwitness/util/logging.h"
#include "xmlwitness/witness/errors.h"
#include "xmlwitness/witness/offsets.h"
#include "xmlwitness/witness/partial_sha.h"
#include "xmlwitness/witness/verifier.h"
#include "xmlwitness/xml/dsig.h"

#include <algorithm>

namespace xmlwitness {

namespace {

using util::JSONValue;

JSONValue BytesToJSON(const Byte* data, size_t len) {
    JSONValue::Array arr;
    arr.reserve(len);
    for (size_t i = 0; i < len; ++i) {
        arr.emplace_back(std::to_string(data[i]));
    }
    return JSONValue(std::move(arr));
}

size_t ReadSize(const util::ConfigManager& config, const std::string& key,
                const std::string& section, size_t defaultValue) {
    if (!config.HasKey(key, section)) {
        return defaultValue;
    }
    auto value = config.TryGetUInt(key, section);
    if (!value) {
        throw WitnessError(ErrorCode::InvalidParameters,
            "Config value " + section + "." + key + " is not a non-negative integer");
    }
    return static_cast<size_t>(*value);
}

std::vector<BigNum> ChunkOrThrow(const BigNum& value, const InputGenerationParams& params,
                                 const char* what) {
    if (value.NumBits() > params.rsaKeyBitsPerChunk * params.rsaKeyNumChunks) {
        LOG_WARN(util::LogCategory::WITNESS) << what << " exceeds the limb capacity";
        throw WitnessError(ErrorCode::InvalidParameters,
            std::string(what) + " of " + std::to_string(value.NumBits()) +
            " bits does not fit in " + std::to_string(params.rsaKeyNumChunks) +
            " chunks of " + std::to_string(params.rsaKeyBitsPerChunk) + " bits");
    }
    return SplitIntoChunks(value, params.rsaKeyBitsPerChunk, params.rsaKeyNumChunks);
}

} // anonymous namespace

// ============================================================================
// InputGenerationParams
// ============================================================================

void InputGenerationParams::Validate() const {
    if (!field::IsFieldElement(nullifierSeed)) {
        throw WitnessError(ErrorCode::InvalidSeed,
                           "Nullifier seed is larger than the max field size");
    }
    if (maxInputLength == 0 || maxInputLength % 64 != 0) {
        throw WitnessError(ErrorCode::InvalidParameters,
            "maxInputLength must be a positive multiple of 64, got " +
            std::to_string(maxInputLength));
    }
    if (rsaKeyBitsPerChunk == 0 || rsaKeyBitsPerChunk > MAX_RSA_BITS_PER_CHUNK) {
        throw WitnessError(ErrorCode::InvalidParameters,
            "rsaKeyBitsPerChunk must be in 1.." + std::to_string(MAX_RSA_BITS_PER_CHUNK));
    }
    if (rsaKeyNumChunks == 0) {
        throw WitnessError(ErrorCode::InvalidParameters, "rsaKeyNumChunks must be at least 1");
    }
    if (anchor.empty()) {
        throw WitnessError(ErrorCode::InvalidParameters, "Anchor selector must not be empty");
    }
}

InputGenerationParams InputGenerationParams::FromConfig(const util::ConfigManager& config,
                                                        const std::string& section) {
    namespace keys = util::ConfigKeys;
    InputGenerationParams params;

    auto seed = config.TryGetString(keys::NULLIFIER_SEED, section);
    if (!seed) {
        throw WitnessError(ErrorCode::InvalidParameters,
                           "Config value " + section + "." + keys::NULLIFIER_SEED + " is required");
    }
    try {
        params.nullifierSeed = BigNum::FromDecimal(*seed);
    } catch (const std::invalid_argument&) {
        throw WitnessError(ErrorCode::InvalidParameters,
                           "Nullifier seed is not a decimal integer: " + *seed);
    }

    params.revealStart = config.TryGetString(keys::REVEAL_START, section);
    params.revealEnd = config.TryGetString(keys::REVEAL_END, section);
    params.maxInputLength = ReadSize(config, keys::MAX_INPUT_LENGTH, section,
                                     DEFAULT_MAX_INPUT_LENGTH);
    params.rsaKeyBitsPerChunk = ReadSize(config, keys::RSA_BITS_PER_CHUNK, section,
                                         DEFAULT_RSA_BITS_PER_CHUNK);
    params.rsaKeyNumChunks = ReadSize(config, keys::RSA_NUM_CHUNKS, section,
                                      DEFAULT_RSA_NUM_CHUNKS);
    params.anchor = config.GetString(keys::ANCHOR, DEFAULT_ANCHOR, section);
    return params;
}

// ============================================================================
// Witness
// ============================================================================

util::JSONValue Witness::ToJSON() const {
    JSONValue json;
    json["dataPadded"] = BytesToJSON(dataPadded.data(), dataPadded.size());
    json["dataPaddedLength"] = static_cast<uint64_t>(dataPaddedLength);
    json["signedInfo"] = BytesToJSON(signedInfo.data(), signedInfo.size());
    json["precomputedSHA"] = BytesToJSON(precomputedSha.data(), precomputedSha.size());
    json["dataHashIndex"] = static_cast<uint64_t>(dataHashIndex);
    json["certificateDataNodeIndex"] = static_cast<uint64_t>(certificateDataNodeIndex);
    json["documentTypeLength"] = static_cast<uint64_t>(documentTypeLength);
    json["signature"] = JSONValue::FromStrings(ChunksToDecimal(signature));
    json["pubKey"] = JSONValue::FromStrings(ChunksToDecimal(pubKey));
    json["isRevealEnabled"] = isRevealEnabled ? 1 : 0;
    json["revealStartIndex"] = static_cast<uint64_t>(revealStartIndex);
    json["revealEndIndex"] = static_cast<uint64_t>(revealEndIndex);
    json["nullifierSeed"] = nullifierSeed.ToDecimal();
    return json;
}

// ============================================================================
// GenerateInput
// ============================================================================

Witness GenerateInput(const std::string& xml, const InputGenerationParams& params) {
    util::ScopedLogTimer timer(util::LogCategory::WITNESS, "GenerateInput");

    // Rejects an out-of-field seed before any XML is touched
    params.Validate();

    xml::SignedXmlParts parts = xml::ExtractSignedXml(xml);

    // Pad to whichever is larger: the circuit capacity or the whole payload
    const size_t payloadLength = parts.signedPayload.size();
    const size_t bodyShaLength = ((payloadLength + 63 + 65) / 64) * 64;
    PaddedMessage padded = Sha256Pad(parts.signedPayload,
                                     std::max(params.maxInputLength, bodyShaLength));

    PartialShaResult partial = GeneratePartialSha(padded.data, padded.paddedLength,
                                                  params.anchor, params.maxInputLength);

    BigNum signature;
    try {
        signature = BigNum::FromBytes(DecodeBase64(parts.signatureBase64));
    } catch (const std::invalid_argument& e) {
        throw WitnessError(ErrorCode::MalformedXml,
                           std::string("SignatureValue is not valid base64: ") + e.what());
    }

    Witness witness;
    witness.dataHashIndex = FindDataHash(parts.signedPayload, parts.signedInfo);
    VerifySignedInfo(parts.signedInfo, signature, parts.publicKey);

    DocumentOffsets offsets = ResolveOffsets(partial.remainder, params.anchor,
                                             params.revealStart, params.revealEnd);

    witness.signature = ChunkOrThrow(signature, params, "Signature");
    witness.pubKey = ChunkOrThrow(parts.publicKey.modulus, params, "Public key modulus");

    witness.dataPadded = std::move(partial.remainder);
    witness.dataPaddedLength = partial.remainderLength;
    witness.signedInfo = std::move(parts.signedInfo);
    witness.precomputedSha = partial.precomputedSha;
    witness.certificateDataNodeIndex = offsets.certificateDataNodeIndex;
    witness.documentTypeLength = offsets.documentTypeLength;
    witness.isRevealEnabled = offsets.isRevealEnabled;
    witness.revealStartIndex = offsets.revealStartIndex;
    witness.revealEndIndex = offsets.revealEndIndex;
    witness.nullifierSeed = params.nullifierSeed;

    LOG_DEBUG(util::LogCategory::WITNESS)
        << "Witness assembled: payload " << payloadLength << " bytes, "
        << witness.dataPaddedLength << " bytes left for the circuit";
    return witness;
}

} // namespace xmlwitness

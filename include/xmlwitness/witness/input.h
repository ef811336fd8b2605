// XMLWITNESS - Circuit Input Generation
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// Turns a signed XML document into the fixed-shape witness consumed by the
// hash-and-RSA circuit.

#ifndef XMLWITNESS_WITNESS_INPUT_H
#define XMLWITNESS_WITNESS_INPUT_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "xmlwitness/core/types.h"
#include "xmlwitness/crypto/bignum.h"
#include "xmlwitness/util/config.h"
#include "xmlwitness/util/json.h"

namespace xmlwitness {

// ============================================================================
// Parameters
// ============================================================================

/// Caller-supplied knobs of witness generation
struct InputGenerationParams {
    static constexpr size_t DEFAULT_MAX_INPUT_LENGTH = 64 * 20;
    static constexpr size_t DEFAULT_RSA_BITS_PER_CHUNK = 121;
    static constexpr size_t DEFAULT_RSA_NUM_CHUNKS = 17;
    static constexpr size_t MAX_RSA_BITS_PER_CHUNK = 4096;
    static constexpr const char* DEFAULT_ANCHOR = "<CertificateData>";

    /// Must be below the circuit field modulus
    BigNum nullifierSeed;

    std::optional<std::string> revealStart;
    std::optional<std::string> revealEnd;

    /// Circuit SHA capacity in bytes (multiple of 64)
    size_t maxInputLength{DEFAULT_MAX_INPUT_LENGTH};

    size_t rsaKeyBitsPerChunk{DEFAULT_RSA_BITS_PER_CHUNK};
    size_t rsaKeyNumChunks{DEFAULT_RSA_NUM_CHUNKS};

    /// Element the partial hash is split at
    std::string anchor{DEFAULT_ANCHOR};

    /// Check all fields; the seed is checked first.
    /// @throws WitnessError(InvalidSeed) or WitnessError(InvalidParameters)
    void Validate() const;

    /// Read parameters from a config section; missing keys keep defaults,
    /// except the nullifier seed which is required.
    /// @throws WitnessError(InvalidParameters) on missing or malformed values
    static InputGenerationParams FromConfig(const util::ConfigManager& config,
                                            const std::string& section =
                                                util::ConfigKeys::WITNESS_SECTION);
};

// ============================================================================
// Witness
// ============================================================================

/// Everything the circuit receives as input. Immutable once assembled.
struct Witness {
    /// Remainder after the precomputed blocks, maxInputLength bytes
    ByteVector dataPadded;
    size_t dataPaddedLength{0};

    /// Canonical SignedInfo (unpadded)
    ByteVector signedInfo;

    /// SHA-256 midstate before dataPadded
    Hash256 precomputedSha;

    size_t dataHashIndex{0};
    size_t certificateDataNodeIndex{0};
    size_t documentTypeLength{0};

    /// Little-endian limbs of the signature and the modulus
    std::vector<BigNum> signature;
    std::vector<BigNum> pubKey;

    bool isRevealEnabled{false};
    size_t revealStartIndex{0};
    size_t revealEndIndex{0};

    BigNum nullifierSeed;

    /// Circuit input JSON: byte and limb arrays as decimal strings,
    /// indices as numbers, the seed as a decimal string
    util::JSONValue ToJSON() const;
};

/**
 * Build the witness for a signed XML document.
 *
 * Requires xml::CryptoEngine to be initialized.
 *
 * @throws WitnessError on any failure (see ErrorCode)
 */
Witness GenerateInput(const std::string& xml, const InputGenerationParams& params);

} // namespace xmlwitness

#endif // XMLWITNESS_WITNESS_INPUT_H

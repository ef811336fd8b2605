// XMLWITNESS - Document Offsets
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License
//
// Circuits cannot search strings, so every position they need is located on
// the host by plain byte scanning of the remainder buffer and passed in as an
// index.

#ifndef XMLWITNESS_WITNESS_OFFSETS_H
#define XMLWITNESS_WITNESS_OFFSETS_H

#include <cstddef>
#include <optional>
#include <string>

#include "xmlwitness/core/types.h"

namespace xmlwitness {

/// Positions inside the remainder buffer
struct DocumentOffsets {
    /// Offset of the anchor element
    size_t certificateDataNodeIndex{0};

    /// Length of the name of the anchor's first child element
    size_t documentTypeLength{0};

    /// Both reveal markers were supplied
    bool isRevealEnabled{false};

    /// Reveal window, relative to the anchor (0 when disabled)
    size_t revealStartIndex{0};
    size_t revealEndIndex{0};
};

/**
 * Locate the anchor, the document type token and the optional reveal window.
 *
 * The reveal window is computed only when both markers are present and
 * non-empty. revealEnd is searched from just past the end of revealStart.
 *
 * @throws WitnessError with ErrorCode::AnchorNotFound, DocumentTypeNotFound,
 *         RevealStartNotFound or RevealEndNotFound
 */
DocumentOffsets ResolveOffsets(const ByteVector& remainder,
                               const std::string& anchor,
                               const std::optional<std::string>& revealStart,
                               const std::optional<std::string>& revealEnd);

} // namespace xmlwitness

#endif // XMLWITNESS_WITNESS_OFFSETS_H

// XMLWITNESS - Document Offsets Implementation
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include "xmlwitness/witness/offsets.h"
#include "xmlwitness/util/logging.h"
#include "xmlwitness/witness/errors.h"

#include <algorithm>

namespace xmlwitness {

namespace {

/// Length of the element name that follows "<anchor><"
size_t DocumentTypeLength(const ByteVector& data, size_t tokenStart) {
    size_t space = FindBytes(data, " ", tokenStart);
    size_t close = FindBytes(data, ">", tokenStart);
    if (space == NPOS && close == NPOS) {
        throw WitnessError(ErrorCode::DocumentTypeNotFound,
                           "Document type terminator not found after anchor");
    }
    // NPOS is the largest size_t, so a missing candidate never wins
    return std::min(space, close) - tokenStart;
}

} // anonymous namespace

DocumentOffsets ResolveOffsets(const ByteVector& remainder,
                               const std::string& anchor,
                               const std::optional<std::string>& revealStart,
                               const std::optional<std::string>& revealEnd) {
    DocumentOffsets offsets;

    const size_t anchorIndex = FindBytes(remainder, anchor);
    if (anchor.empty() || anchorIndex == NPOS) {
        throw WitnessError(ErrorCode::AnchorNotFound,
                           "Anchor " + anchor + " not found in remaining data");
    }
    offsets.certificateDataNodeIndex = anchorIndex;

    // Skip the anchor and the '<' opening its first child
    offsets.documentTypeLength = DocumentTypeLength(remainder, anchorIndex + anchor.size() + 1);

    const bool hasStart = revealStart && !revealStart->empty();
    const bool hasEnd = revealEnd && !revealEnd->empty();
    if (hasStart != hasEnd) {
        LOG_DEBUG(util::LogCategory::WITNESS)
            << "Only one reveal marker supplied; reveal disabled";
    }

    if (hasStart && hasEnd) {
        size_t startPos = FindBytes(remainder, *revealStart, anchorIndex);
        if (startPos == NPOS) {
            throw WitnessError(ErrorCode::RevealStartNotFound,
                               "Reveal start not found in document: " + *revealStart);
        }
        offsets.revealStartIndex = startPos - anchorIndex;

        size_t endPos = FindBytes(remainder, *revealEnd, startPos + revealStart->size() + 1);
        if (endPos == NPOS) {
            throw WitnessError(ErrorCode::RevealEndNotFound,
                               "Reveal end not found in document: " + *revealEnd);
        }
        offsets.revealEndIndex = endPos - anchorIndex;
        offsets.isRevealEnabled = true;
    }

    LOG_DEBUG(util::LogCategory::WITNESS)
        << "Offsets: anchor=" << offsets.certificateDataNodeIndex
        << " typeLength=" << offsets.documentTypeLength
        << " reveal=" << (offsets.isRevealEnabled ? 1 : 0)
        << " [" << offsets.revealStartIndex << ", " << offsets.revealEndIndex << ")";
    return offsets;
}

} // namespace xmlwitness

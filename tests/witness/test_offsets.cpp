// XMLWITNESS - Document Offsets Tests
// Copyright (c) 2024 XMLWITNESS Developers
// MIT License

#include <gtest/gtest.h>

#include "xmlwitness/witness/errors.h"
#include "xmlwitness/witness/offsets.h"

#include <optional>
#include <string>

namespace xmlwitness {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class OffsetsTest : public ::testing::Test {
protected:
    static constexpr const char* ANCHOR = "<CertificateData>";

    ErrorCode FailureCode(const std::string& data,
                          const std::optional<std::string>& start = std::nullopt,
                          const std::optional<std::string>& end = std::nullopt) {
        try {
            ResolveOffsets(ToBytes(data), ANCHOR, start, end);
        } catch (const WitnessError& e) {
            return e.Code();
        }
        ADD_FAILURE() << "ResolveOffsets did not throw";
        return ErrorCode::CryptoEngine;
    }
};

// ============================================================================
// Anchor and Document Type
// ============================================================================

TEST_F(OffsetsTest, TypeEndsAtSpace) {
    std::string data = "abc<CertificateData><X509Data Type=\"PAN\"></X509Data>";
    DocumentOffsets offsets = ResolveOffsets(ToBytes(data), ANCHOR, std::nullopt, std::nullopt);
    EXPECT_EQ(offsets.certificateDataNodeIndex, 3u);
    EXPECT_EQ(offsets.documentTypeLength, 8u);
    EXPECT_FALSE(offsets.isRevealEnabled);
}

TEST_F(OffsetsTest, TypeEndsAtCloseBracket) {
    std::string data = "<CertificateData><Aadhaar><Name/></Aadhaar>";
    DocumentOffsets offsets = ResolveOffsets(ToBytes(data), ANCHOR, std::nullopt, std::nullopt);
    EXPECT_EQ(offsets.certificateDataNodeIndex, 0u);
    EXPECT_EQ(offsets.documentTypeLength, 7u);
}

TEST_F(OffsetsTest, NearestTerminatorWins) {
    // Only a '>' follows, no space anywhere after the anchor
    std::string data = "x y <CertificateData><PAN>";
    DocumentOffsets offsets = ResolveOffsets(ToBytes(data), ANCHOR, std::nullopt, std::nullopt);
    EXPECT_EQ(offsets.documentTypeLength, 3u);
}

TEST_F(OffsetsTest, FirstAnchorOccurrenceIsUsed) {
    std::string data = "<CertificateData><A>1</A></CertificateData><CertificateData><B>";
    DocumentOffsets offsets = ResolveOffsets(ToBytes(data), ANCHOR, std::nullopt, std::nullopt);
    EXPECT_EQ(offsets.certificateDataNodeIndex, 0u);
    EXPECT_EQ(offsets.documentTypeLength, 1u);
}

TEST_F(OffsetsTest, MissingAnchorThrows) {
    EXPECT_EQ(FailureCode("<Certificate><PAN/></Certificate>"), ErrorCode::AnchorNotFound);
}

TEST_F(OffsetsTest, MissingTerminatorThrows) {
    EXPECT_EQ(FailureCode("<CertificateData><PAN"), ErrorCode::DocumentTypeNotFound);
}

// ============================================================================
// Reveal Window
// ============================================================================

TEST_F(OffsetsTest, RevealIndicesAreRelativeToAnchor) {
    std::string data = "padding<CertificateData><PAN name=\"Ann Lee\" dob=\"1990\"/>";
    DocumentOffsets offsets = ResolveOffsets(ToBytes(data), ANCHOR,
                                             std::string("name=\""), std::string("\""));
    EXPECT_TRUE(offsets.isRevealEnabled);
    EXPECT_EQ(offsets.certificateDataNodeIndex, 7u);
    EXPECT_EQ(offsets.revealStartIndex, 22u);
    // Closing quote of the name value
    EXPECT_EQ(offsets.revealEndIndex, 22u + 6 + 7);
}

TEST_F(OffsetsTest, RevealSearchStartsAtAnchor) {
    // The earlier name=" before the anchor is ignored
    std::string data = "<P name=\"x\"/><CertificateData><PAN name=\"y\"/>";
    DocumentOffsets offsets = ResolveOffsets(ToBytes(data), ANCHOR,
                                             std::string("name=\""), std::string("\""));
    EXPECT_EQ(offsets.revealStartIndex, 22u);
}

TEST_F(OffsetsTest, RevealEndSkipsOneByteAfterStart) {
    // An end marker immediately after the start marker is not matched
    std::string data = "<CertificateData><PAN v=\"\"ab\"/>";
    DocumentOffsets offsets = ResolveOffsets(ToBytes(data), ANCHOR,
                                             std::string("v=\""), std::string("\""));
    EXPECT_EQ(offsets.revealStartIndex, 22u);
    EXPECT_EQ(offsets.revealEndIndex, 28u);
}

TEST_F(OffsetsTest, OneMarkerDisablesReveal) {
    std::string data = "<CertificateData><PAN name=\"y\"/>";
    DocumentOffsets offsets = ResolveOffsets(ToBytes(data), ANCHOR,
                                             std::string("name=\""), std::nullopt);
    EXPECT_FALSE(offsets.isRevealEnabled);
    EXPECT_EQ(offsets.revealStartIndex, 0u);

    offsets = ResolveOffsets(ToBytes(data), ANCHOR, std::string(""), std::string("\""));
    EXPECT_FALSE(offsets.isRevealEnabled);
}

TEST_F(OffsetsTest, MissingRevealStartThrows) {
    EXPECT_EQ(FailureCode("<CertificateData><PAN/>", std::string("dob=\""), std::string("\"")),
              ErrorCode::RevealStartNotFound);
}

TEST_F(OffsetsTest, MissingRevealEndThrows) {
    EXPECT_EQ(FailureCode("<CertificateData><PAN dob=\"1990/>", std::string("dob=\""),
                          std::string("\"")),
              ErrorCode::RevealEndNotFound);
}

} // namespace test
} // namespace xmlwitness

/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <passtrack/tle.hpp>

#include <sstream>
#include <string>

namespace passtrack {
namespace {

constexpr const char* ISS_NAME = "ISS (ZARYA)";
constexpr const char* ISS_LINE1 = "1 25544U 98067A   25235.75642456  .00011222  00000+0  20339-3 0  9993";
constexpr const char* ISS_LINE2 = "2 25544  51.6355 332.1708 0003307 260.2831  99.7785 15.50129787525648";

// NOAA 19 TLE from Celestrak
constexpr const char* NOAA19_TLE =
    "NOAA 19\n"
    "1 33591U 09005A   25333.78204194  .00000054  00000+0  52635-4 0  9999\n"
    "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889866318\n";

std::string issTLE() {
    return std::string(ISS_NAME) + "\n" + ISS_LINE1 + "\n" + ISS_LINE2;
}

// Expect parseTLE to fail with the given error
void expectParseError(const std::string& text, TleParseError expected,
                      const ValidationOptions& options = {}) {
    try {
        parseTLE(text, options);
        FAIL() << "Expected TleParseException for input: " << text;
    } catch (const TleParseException& e) {
        EXPECT_EQ(e.error(), expected) << e.what();
    }
}

// ============================================================================
// Successful parsing
// ============================================================================

TEST(TleParseTest, ParsesISSExample) {
    auto tle = parseTLE(issTLE());
    EXPECT_EQ(tle.getName(), "ISS (ZARYA)");
    EXPECT_EQ(tle.getLine1(), ISS_LINE1);
    EXPECT_EQ(tle.getLine2(), ISS_LINE2);
    EXPECT_EQ(tle.getLine1().size(), 69u);
    EXPECT_EQ(tle.getLine2().size(), 69u);
}

TEST(TleParseTest, TrailingNewlineAccepted) {
    auto tle = parseTLE(NOAA19_TLE);
    EXPECT_EQ(tle.getName(), "NOAA 19");
    EXPECT_EQ(tle.getNoradID(), 33591);
}

TEST(TleParseTest, WindowsLineEndings) {
    std::string text = std::string(ISS_NAME) + "\r\n" + ISS_LINE1 + "\r\n" + ISS_LINE2 + "\r\n";
    auto tle = parseTLE(text);
    EXPECT_EQ(tle.getName(), ISS_NAME);
    EXPECT_EQ(tle.getLine1(), ISS_LINE1);
    EXPECT_EQ(tle.getLine2(), ISS_LINE2);
}

TEST(TleParseTest, SurroundingWhitespaceIsTrimmed) {
    std::string text = "  ISS (ZARYA)  \n\t" + std::string(ISS_LINE1) + "   \n   " + ISS_LINE2 + "\t";
    auto tle = parseTLE(text);
    EXPECT_EQ(tle.getName(), ISS_NAME);
    EXPECT_EQ(tle.getLine1(), ISS_LINE1);
    EXPECT_EQ(tle.getLine2(), ISS_LINE2);
}

TEST(TleParseTest, UnicodeWhitespaceIsTrimmed) {
    const std::string nbsp = "\xC2\xA0";
    const std::string ideographic = "\xE3\x80\x80";
    std::string text = ideographic + ISS_NAME + nbsp + "\n"
        + nbsp + ISS_LINE1 + nbsp + "\n"
        + ISS_LINE2 + ideographic + "\n";
    auto tle = parseTLE(text);
    EXPECT_EQ(tle.getName(), ISS_NAME);
    EXPECT_EQ(tle.getLine1(), ISS_LINE1);
    EXPECT_EQ(tle.getLine2(), ISS_LINE2);
}

TEST(TleTrimTest, Trim) {
    EXPECT_EQ(trim("  abc \t"), "abc");
    EXPECT_EQ(trim("\xC2\xA0\xE2\x80\x89" "a b" "\xE2\x80\xAF"), "a b");
    EXPECT_EQ(trim("\xC2\xA0 \xE3\x80\x80"), "");
    EXPECT_EQ(trim(""), "");
    // Only whole whitespace characters are removed
    EXPECT_EQ(trim("\xC3\xA9"), "\xC3\xA9");
}

TEST(TleParseTest, ExtraLinesIgnored) {
    auto tle = parseTLE(issTLE() + "\nsomething else\nand more");
    EXPECT_EQ(tle.getLine2(), ISS_LINE2);
}

TEST(TleParseTest, EmptyNameAllowed) {
    auto tle = parseTLE(std::string("\n") + ISS_LINE1 + "\n" + ISS_LINE2);
    EXPECT_TRUE(tle.getName().empty());
}

TEST(TleParseTest, NoradID) {
    EXPECT_EQ(parseTLE(issTLE()).getNoradID(), 25544);
}

TEST(TleParseTest, ToStringPreservesLines) {
    auto tle = parseTLE(issTLE());
    EXPECT_EQ(tle.toString(), issTLE() + "\n");
    EXPECT_EQ(parseTLE(tle.toString()), tle);
}

// ============================================================================
// InsufficientLines
// ============================================================================

TEST(TleParseTest, EmptyInput) {
    expectParseError("", TleParseError::InsufficientLines);
}

TEST(TleParseTest, OneLine) {
    expectParseError(ISS_NAME, TleParseError::InsufficientLines);
}

TEST(TleParseTest, TwoLines) {
    expectParseError(std::string(ISS_LINE1) + "\n" + ISS_LINE2, TleParseError::InsufficientLines);
}

TEST(TleParseTest, TwoLinesWithTrailingNewline) {
    expectParseError(std::string(ISS_LINE1) + "\n" + ISS_LINE2 + "\n", TleParseError::InsufficientLines);
}

// ============================================================================
// Length errors
// ============================================================================

TEST(TleParseTest, Line1TooShort) {
    std::string line1 = std::string(ISS_LINE1).substr(0, 68);
    expectParseError(std::string(ISS_NAME) + "\n" + line1 + "\n" + ISS_LINE2,
                     TleParseError::InvalidTle1Length);
}

TEST(TleParseTest, Line1TooLong) {
    expectParseError(std::string(ISS_NAME) + "\n" + ISS_LINE1 + "0\n" + ISS_LINE2,
                     TleParseError::InvalidTle1Length);
}

TEST(TleParseTest, Line2TooShort) {
    std::string line2 = std::string(ISS_LINE2).substr(0, 60);
    expectParseError(std::string(ISS_NAME) + "\n" + ISS_LINE1 + "\n" + line2,
                     TleParseError::InvalidTle2Length);
}

TEST(TleParseTest, Line1CheckedBeforeLine2) {
    expectParseError(std::string(ISS_NAME) + "\nshort\nalso short", TleParseError::InvalidTle1Length);
}

TEST(TleParseTest, EmptyLineInsideRecord) {
    // The blank line becomes line 1
    expectParseError(std::string(ISS_NAME) + "\n\n" + ISS_LINE1 + "\n" + ISS_LINE2,
                     TleParseError::InvalidTle1Length);
}

TEST(TleParseTest, WhitespaceDoesNotRescueWrongLength) {
    std::string line1 = "  " + std::string(ISS_LINE1).substr(0, 67) + "  ";
    expectParseError(std::string(ISS_NAME) + "\n" + line1 + "\n" + ISS_LINE2,
                     TleParseError::InvalidTle1Length);
}

TEST(TleDataTest, ConstructorValidatesLengths) {
    EXPECT_THROW(TleData(ISS_NAME, "1 25544U", ISS_LINE2), TleParseException);
    EXPECT_THROW(TleData(ISS_NAME, ISS_LINE1, "2 25544"), TleParseException);
    EXPECT_NO_THROW(TleData(ISS_NAME, ISS_LINE1, ISS_LINE2));
}

TEST(TleDataTest, ExceptionIsInvalidArgument) {
    EXPECT_THROW(parseTLE(""), std::invalid_argument);
}

// ============================================================================
// Checksums
// ============================================================================

TEST(TleChecksumTest, CalculateChecksum) {
    EXPECT_EQ(calculateChecksum(ISS_LINE1), 3);
    EXPECT_EQ(calculateChecksum(ISS_LINE2), 8);
}

TEST(TleChecksumTest, MinusCountsAsOne) {
    EXPECT_EQ(calculateChecksum("-"), 1);
    EXPECT_EQ(calculateChecksum("1-2-"), 5);
    EXPECT_EQ(calculateChecksum("ABC +."), 0);
}

TEST(TleChecksumTest, ValidChecksumsPass) {
    ValidationOptions options{.verifyChecksums = true};
    EXPECT_NO_THROW(parseTLE(issTLE(), options));
    EXPECT_NO_THROW(parseTLE(NOAA19_TLE, options));
}

TEST(TleChecksumTest, BadChecksumIgnoredByDefault) {
    std::string line1 = std::string(ISS_LINE1);
    line1.back() = '0';
    EXPECT_NO_THROW(parseTLE(std::string(ISS_NAME) + "\n" + line1 + "\n" + ISS_LINE2));
}

TEST(TleChecksumTest, BadLine1Checksum) {
    std::string line1 = std::string(ISS_LINE1);
    line1.back() = '0';
    expectParseError(std::string(ISS_NAME) + "\n" + line1 + "\n" + ISS_LINE2,
                     TleParseError::InvalidTle1Checksum, {.verifyChecksums = true});
}

TEST(TleChecksumTest, BadLine2Checksum) {
    std::string line2 = std::string(ISS_LINE2);
    line2.back() = '9';
    expectParseError(std::string(ISS_NAME) + "\n" + ISS_LINE1 + "\n" + line2,
                     TleParseError::InvalidTle2Checksum, {.verifyChecksums = true});
}

TEST(TleChecksumTest, LengthCheckedBeforeChecksum) {
    std::string line1 = std::string(ISS_LINE1).substr(0, 68);
    expectParseError(std::string(ISS_NAME) + "\n" + line1 + "\n" + ISS_LINE2,
                     TleParseError::InvalidTle1Length, {.verifyChecksums = true});
}

TEST(TleParseErrorTest, StreamOutput) {
    std::ostringstream s;
    s << TleParseError::InsufficientLines << " " << TleParseError::InvalidTle2Length;
    EXPECT_EQ(s.str(), "InsufficientLines InvalidTle2Length");
}

} // namespace
} // namespace passtrack

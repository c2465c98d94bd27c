/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <passtrack/tle.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <charconv>
#include <sstream>
#include <vector>

using spdlog::debug;

namespace passtrack {

std::ostream& operator<<(std::ostream &os, const TleParseError &error) {
    switch (error) {
        case TleParseError::InsufficientLines:
            os << "InsufficientLines";
            break;
        case TleParseError::InvalidTle1Length:
            os << "InvalidTle1Length";
            break;
        case TleParseError::InvalidTle2Length:
            os << "InvalidTle2Length";
            break;
        case TleParseError::InvalidTle1Checksum:
            os << "InvalidTle1Checksum";
            break;
        case TleParseError::InvalidTle2Checksum:
            os << "InvalidTle2Checksum";
            break;
    }
    return os;
}

constexpr std::string_view ASCII_WHITESPACE = " \t\r\n\v\f";

// UTF-8 encodings of the non-ASCII Unicode White_Space characters
constexpr std::array<std::string_view, 19> UNICODE_WHITESPACE = {
    "\xC2\x85",         // U+0085 next line
    "\xC2\xA0",         // U+00A0 no-break space
    "\xE1\x9A\x80",     // U+1680 ogham space mark
    "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83",
    "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86", "\xE2\x80\x87",
    "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A",    // U+2000 - U+200A
    "\xE2\x80\xA8",     // U+2028 line separator
    "\xE2\x80\xA9",     // U+2029 paragraph separator
    "\xE2\x80\xAF",     // U+202F narrow no-break space
    "\xE2\x81\x9F",     // U+205F medium mathematical space
    "\xE3\x80\x80",     // U+3000 ideographic space
};

// Byte length of the whitespace character at the start of str, or 0
static std::size_t leadingWhitespace(std::string_view str) {
    if (str.empty()) {
        return 0;
    }
    if (ASCII_WHITESPACE.find(str.front()) != std::string_view::npos) {
        return 1;
    }
    for (auto ws : UNICODE_WHITESPACE) {
        if (str.starts_with(ws)) {
            return ws.size();
        }
    }
    return 0;
}

// Byte length of the whitespace character at the end of str, or 0
static std::size_t trailingWhitespace(std::string_view str) {
    if (str.empty()) {
        return 0;
    }
    if (ASCII_WHITESPACE.find(str.back()) != std::string_view::npos) {
        return 1;
    }
    for (auto ws : UNICODE_WHITESPACE) {
        if (str.ends_with(ws)) {
            return ws.size();
        }
    }
    return 0;
}

std::string_view trim(std::string_view str) {
    while (auto n = leadingWhitespace(str)) {
        str.remove_prefix(n);
    }
    while (auto n = trailingWhitespace(str)) {
        str.remove_suffix(n);
    }
    return str;
}

// Split text into lines. A trailing '\r' is dropped from each line and a
// final newline does not start an extra empty line.
static std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    while (!text.empty()) {
        auto pos = text.find('\n');
        std::string_view line = text.substr(0, pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (pos == std::string_view::npos) {
            break;
        }
        text.remove_prefix(pos + 1);
    }
    return lines;
}

TleData::TleData(std::string_view name, std::string_view line1, std::string_view line2)
    : name_(trim(name)), line1_(trim(line1)), line2_(trim(line2)) {

    if (line1_.size() != TLE_LINE_LENGTH) {
        throw TleParseException(TleParseError::InvalidTle1Length,
            "TLE line 1 must be 69 characters long, got " + std::to_string(line1_.size()));
    }

    if (line2_.size() != TLE_LINE_LENGTH) {
        throw TleParseException(TleParseError::InvalidTle2Length,
            "TLE line 2 must be 69 characters long, got " + std::to_string(line2_.size()));
    }
}

int TleData::getNoradID() const {
    std::string_view field = trim(std::string_view(line1_).substr(2, 5));
    int value = -1;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
    if (ec != std::errc() || ptr != field.data() + field.size()) {
        return -1;
    }
    return value;
}

std::string TleData::toString() const {
    std::ostringstream s;
    s << name_ << '\n' << line1_ << '\n' << line2_ << '\n';
    return s.str();
}

TleData parseTLE(std::string_view text, const ValidationOptions& options) {
    auto lines = splitLines(text);

    if (lines.size() < 3) {
        throw TleParseException(TleParseError::InsufficientLines,
            "TLE must contain 3 lines, got " + std::to_string(lines.size()));
    }

    TleData tle(lines[0], lines[1], lines[2]);

    if (options.verifyChecksums) {
        verifyChecksums(tle);
    }

    debug("Parsed TLE for {} ({})", tle.getName(), tle.getNoradID());

    return tle;
}

int calculateChecksum(std::string_view line) {
    int sum = 0;
    for (char c : line.substr(0, TLE_LINE_LENGTH - 1)) {
        if (c >= '0' && c <= '9') {
            sum += (c - '0');
        } else if (c == '-') {
            sum += 1;
        }
    }
    return sum % 10;
}

// The last column must hold the checksum digit of the preceding 68 characters
static bool hasValidChecksum(const std::string& line) {
    char last = line.back();
    if (last < '0' || last > '9') {
        return false;
    }
    return calculateChecksum(line) == (last - '0');
}

void verifyChecksums(const TleData& tle) {
    if (!hasValidChecksum(tle.getLine1())) {
        throw TleParseException(TleParseError::InvalidTle1Checksum,
            "TLE line 1 checksum mismatch, expected " + std::to_string(calculateChecksum(tle.getLine1())));
    }
    if (!hasValidChecksum(tle.getLine2())) {
        throw TleParseException(TleParseError::InvalidTle2Checksum,
            "TLE line 2 checksum mismatch, expected " + std::to_string(calculateChecksum(tle.getLine2())));
    }
}

} // namespace passtrack

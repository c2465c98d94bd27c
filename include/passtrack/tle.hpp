/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __PASSTRACK_TLE_HPP
#define __PASSTRACK_TLE_HPP

#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace passtrack {

// Length of each data line of a NORAD two-line element set
constexpr std::size_t TLE_LINE_LENGTH = 69;

/**
 * Options controlling how strictly input is validated.
 */
struct ValidationOptions {
    bool verifyChecksums = false;   ///< Enforce the mod-10 checksum in column 69
};

/**
 * Reasons a TLE record can be rejected, in the order they are checked.
 */
enum class TleParseError {
    InsufficientLines,
    InvalidTle1Length,
    InvalidTle2Length,
    InvalidTle1Checksum,
    InvalidTle2Checksum
};

std::ostream& operator<<(std::ostream &os, const TleParseError &error);

/**
 * Exception thrown when a TLE record fails structural validation.
 */
class TleParseException : public std::invalid_argument {
public:
    TleParseException(TleParseError error, const std::string& msg)
        : std::invalid_argument(msg), error_(error) {}

    TleParseError error() const { return error_; }

private:
    TleParseError error_;
};

/**
 * Orbital elements for one satellite in three-line TLE form.
 *
 * The constructor trims surrounding whitespace from each line and checks
 * that both data lines are exactly 69 characters, so every TleData that
 * exists is structurally valid. Instances are immutable.
 *
 * Usage:
 *   TleData tle = parseTLE(text);
 *   std::cout << tle.getName() << std::endl;
 */
class TleData {
public:
    /**
     * @throws TleParseException with InvalidTle1Length or InvalidTle2Length
     */
    TleData(std::string_view name, std::string_view line1, std::string_view line2);

    const std::string& getName() const { return name_; }
    const std::string& getLine1() const { return line1_; }
    const std::string& getLine2() const { return line2_; }

    /**
     * NORAD catalog number from columns 3-7 of line 1, or -1 if those
     * columns are not numeric.
     */
    int getNoradID() const;

    /**
     * The record as three newline-terminated lines.
     */
    std::string toString() const;

    bool operator==(const TleData& other) const = default;

private:
    std::string name_;
    std::string line1_;
    std::string line2_;
};

/**
 * Parse a three-line TLE record (name, line 1, line 2).
 *
 * Lines beyond the third are ignored. Checks run in a fixed order and the
 * first failure is reported.
 *
 * @param text Newline separated TLE text
 * @param options Checksums are only verified if requested
 * @return The validated TLE
 * @throws TleParseException describing the first failed check
 */
TleData parseTLE(std::string_view text, const ValidationOptions& options = {});

/**
 * NORAD mod-10 checksum over the first 68 characters of a TLE line.
 * Digits count their value, '-' counts as 1, everything else as 0.
 */
int calculateChecksum(std::string_view line);

/**
 * Check the trailing checksum digit of both data lines.
 * @throws TleParseException with InvalidTle1Checksum or InvalidTle2Checksum
 */
void verifyChecksums(const TleData& tle);

// Strip leading and trailing whitespace, including UTF-8 encoded Unicode spaces
std::string_view trim(std::string_view str);

} // namespace passtrack

#endif

/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __PASSTRACK_JOB_HPP
#define __PASSTRACK_JOB_HPP

#include <passtrack/tle.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace passtrack {

using time_point = std::chrono::system_clock::time_point;

/**
 * Reasons a job can be rejected.
 */
enum class JobValidationError {
    InvalidTimeWindow,
    InvalidRxFrequency,
    InvalidTxFrequency,
    DuplicateID
};

std::ostream& operator<<(std::ostream &os, const JobValidationError &error);

/**
 * Exception thrown when a job violates one of its invariants.
 */
class JobValidationException : public std::invalid_argument {
public:
    JobValidationException(JobValidationError error, const std::string& msg)
        : std::invalid_argument(msg), error_(error) {}

    JobValidationError error() const { return error_; }

private:
    JobValidationError error_;
};

/**
 * A request to track one satellite pass.
 *
 * A job carries the pass window (AOS to LOS), the orbital elements of the
 * satellite, the downlink and uplink frequencies in Hertz and an optional
 * payload to transmit during the pass. Without an uplink payload the
 * station only receives.
 *
 * Jobs are validated on construction and immutable afterwards. A changed
 * schedule is a new job. Runtime status is tracked by JobLifecycle, and
 * id uniqueness by JobRegistry.
 */
class Job {
public:
    /**
     * Checks, in order: start < end, rx frequency finite and positive,
     * tx frequency finite and positive, then TLE checksums if requested.
     *
     * @throws JobValidationException on the first violated invariant
     * @throws TleParseException if checksum verification is enabled and fails
     */
    Job(uint64_t id,
        std::string satelliteID,
        time_point start,
        time_point end,
        TleData tle,
        double rxFrequency,
        double txFrequency,
        std::optional<std::vector<uint8_t>> uplink = std::nullopt,
        const ValidationOptions& options = {});

    uint64_t getID() const { return id_; }
    const std::string& getSatelliteID() const { return satelliteID_; }
    time_point getStart() const { return start_; }
    time_point getEnd() const { return end_; }
    const TleData& getTLE() const { return tle_; }
    double getRxFrequency() const { return rxFrequency_; }
    double getTxFrequency() const { return txFrequency_; }
    const std::optional<std::vector<uint8_t>>& getUplink() const { return uplink_; }

    /** True if the job transmits as well as receives */
    bool hasUplink() const { return uplink_.has_value(); }

    std::chrono::seconds getDuration() const;

    /** True if the instant falls within [start, end) */
    bool contains(time_point tp) const;

    /** True if the two windows share any instant */
    bool overlaps(const Job& other) const;

    /**
     * Print a human readable summary of the job to a stream.
     */
    void printInfo(std::ostream &os) const;

private:
    uint64_t id_;
    std::string satelliteID_;
    time_point start_;
    time_point end_;
    TleData tle_;
    double rxFrequency_;
    double txFrequency_;
    std::optional<std::vector<uint8_t>> uplink_;
};

} // namespace passtrack

#endif

/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <passtrack/job.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <format>

#include <date/date.h>

using spdlog::debug;

namespace passtrack {

std::ostream& operator<<(std::ostream &os, const JobValidationError &error) {
    switch (error) {
        case JobValidationError::InvalidTimeWindow:
            os << "InvalidTimeWindow";
            break;
        case JobValidationError::InvalidRxFrequency:
            os << "InvalidRxFrequency";
            break;
        case JobValidationError::InvalidTxFrequency:
            os << "InvalidTxFrequency";
            break;
        case JobValidationError::DuplicateID:
            os << "DuplicateID";
            break;
    }
    return os;
}

// Frequencies must be finite and strictly positive
static bool isValidFrequency(double hz) {
    return std::isfinite(hz) && hz > 0.0;
}

Job::Job(uint64_t id,
         std::string satelliteID,
         time_point start,
         time_point end,
         TleData tle,
         double rxFrequency,
         double txFrequency,
         std::optional<std::vector<uint8_t>> uplink,
         const ValidationOptions& options)
    : id_(id),
      satelliteID_(std::move(satelliteID)),
      start_(start),
      end_(end),
      tle_(std::move(tle)),
      rxFrequency_(rxFrequency),
      txFrequency_(txFrequency),
      uplink_(std::move(uplink)) {

    if (start_ >= end_) {
        throw JobValidationException(JobValidationError::InvalidTimeWindow,
            "Job " + std::to_string(id_) + ": start must be before end");
    }

    if (!isValidFrequency(rxFrequency_)) {
        throw JobValidationException(JobValidationError::InvalidRxFrequency,
            "Job " + std::to_string(id_) + ": rx frequency must be a positive number of Hz");
    }

    if (!isValidFrequency(txFrequency_)) {
        throw JobValidationException(JobValidationError::InvalidTxFrequency,
            "Job " + std::to_string(id_) + ": tx frequency must be a positive number of Hz");
    }

    if (options.verifyChecksums) {
        verifyChecksums(tle_);
    }

    debug("Validated job {} for {} ({} uplink bytes)", id_, satelliteID_,
        uplink_.has_value() ? uplink_->size() : 0);
}

std::chrono::seconds Job::getDuration() const {
    return std::chrono::duration_cast<std::chrono::seconds>(end_ - start_);
}

bool Job::contains(time_point tp) const {
    return tp >= start_ && tp < end_;
}

bool Job::overlaps(const Job& other) const {
    return start_ < other.end_ && other.start_ < end_;
}

void Job::printInfo(std::ostream &os) const {
    using std::chrono::floor;
    using std::chrono::seconds;

    os << "Job " << getID() << std::endl;
    os << "  Satellite: " << getSatelliteID() << std::endl;
    os << "  Start (AOS): " << date::format("%F %T UTC", floor<seconds>(getStart())) << std::endl;
    os << "  End (LOS): " << date::format("%F %T UTC", floor<seconds>(getEnd())) << std::endl;
    os << "  Duration: " << getDuration().count() << " s" << std::endl;
    os << "  TLE: " << getTLE().getName() << " (" << getTLE().getNoradID() << ")" << std::endl;
    os << "  Downlink: " << std::format("{:.3f} MHz", getRxFrequency() / 1e6) << std::endl;
    os << "  Uplink: " << std::format("{:.3f} MHz", getTxFrequency() / 1e6) << std::endl;
    if (hasUplink()) {
        os << "  Uplink Payload: " << getUplink()->size() << " bytes" << std::endl;
    } else {
        os << "  Uplink Payload: none (receive only)" << std::endl;
    }
    os << std::endl;
}

} // namespace passtrack

/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __PASSTRACK_JSON_HPP
#define __PASSTRACK_JSON_HPP

#include <passtrack/job.hpp>
#include <passtrack/lifecycle.hpp>
#include <passtrack/telemetry.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace passtrack {

/**
 * Exception thrown when a JSON document is malformed or a field is
 * missing or has the wrong type.
 */
class PayloadException : public std::runtime_error {
public:
    explicit PayloadException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Parse an ISO-8601 UTC timestamp such as "2025-09-19T12:00:00Z".
 * Fractional seconds (up to microseconds) and numeric offsets ("+02:00")
 * are accepted.
 * @throws PayloadException if the text is not a valid timestamp or lies
 *         outside the range of time_point
 */
time_point parseTimestamp(std::string_view text);

/**
 * Format a timestamp as ISO-8601 UTC, with fractional seconds only when
 * the instant is not a whole second.
 */
std::string formatTimestamp(time_point tp);

/**
 * Parse a job submission.
 *
 * Example:
 *   {
 *     "id": 12345,
 *     "satellite_id": "ISS (ZARYA)",
 *     "start": "2025-09-19T12:00:00Z",
 *     "end": "2025-09-19T12:15:00Z",
 *     "tle": { "tle0": "ISS (ZARYA)", "tle1": "1 25544U ...", "tle2": "2 25544 ..." },
 *     "rx_frequency": 145800000,
 *     "tx_frequency": 437500000,
 *     "uplink": [72, 101, 108, 108, 111]
 *   }
 *
 * "uplink" may be absent or null for receive-only jobs.
 *
 * @throws PayloadException if the document does not have this shape
 * @throws TleParseException if the TLE is invalid
 * @throws JobValidationException if the job violates an invariant
 */
Job parseJob(std::string_view json, const ValidationOptions& options = {});

std::string toJSON(const Job &job);

/** {"job_id": ..., "status": "...", "timestamp": "...", "cause": "..."} */
std::string toJSON(const StatusEvent &event);

/** {"ground_station_id": "...", "timestamp": "...", "payload": [...]} */
std::string toJSON(const TelemetryMessage &message);

/**
 * {"id": "...", "timestamp": ..., "temperature": ..., "voltage": ..., "current": ..., "battery_level": ...}
 * Measurements that are NaN or infinite are written as null.
 */
std::string toJSON(const TelemetryRecord &record);

/**
 * Parse a stored telemetry record, keeping its id. A null measurement
 * becomes NaN.
 * @throws PayloadException if the document does not have the expected shape
 */
TelemetryRecord parseTelemetryRecord(std::string_view json);

} // namespace passtrack

#endif

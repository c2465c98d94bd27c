/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __PASSTRACK_TELEMETRY_HPP
#define __PASSTRACK_TELEMETRY_HPP

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace passtrack {

using time_point = std::chrono::system_clock::time_point;

/**
 * Source of unique identifiers for telemetry records.
 */
class IdGenerator {
public:
    virtual ~IdGenerator() = default;
    virtual std::string next() = 0;
};

/**
 * Generates random (version 4) UUID strings, e.g.
 * "3f1c2d9e-8a4b-4c6d-9e0f-1a2b3c4d5e6f". Thread-safe.
 */
class RandomIdGenerator : public IdGenerator {
public:
    RandomIdGenerator();

    /** Deterministic sequence, for reproducible runs */
    explicit RandomIdGenerator(uint64_t seed);

    // Non-copyable, non-movable (due to mutex)
    RandomIdGenerator(const RandomIdGenerator&) = delete;
    RandomIdGenerator& operator=(const RandomIdGenerator&) = delete;
    RandomIdGenerator(RandomIdGenerator&&) = delete;
    RandomIdGenerator& operator=(RandomIdGenerator&&) = delete;

    std::string next() override;

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
};

/**
 * A raw telemetry frame as received from a ground station.
 * Decoding the payload is left to downstream consumers.
 */
class TelemetryMessage {
public:
    TelemetryMessage(std::string groundStationID, time_point timestamp, std::vector<uint8_t> payload)
        : groundStationID_(std::move(groundStationID)),
          timestamp_(timestamp),
          payload_(std::move(payload)) {}

    const std::string& getGroundStationID() const { return groundStationID_; }
    time_point getTimestamp() const { return timestamp_; }
    const std::vector<uint8_t>& getPayload() const { return payload_; }

private:
    std::string groundStationID_;
    time_point timestamp_;
    std::vector<uint8_t> payload_;
};

/**
 * A decoded telemetry sample.
 *
 * Measurements are stored as given. Range checking is left to analysis.
 */
struct TelemetryRecord {
    std::string id;
    int64_t timestamp;      ///< Seconds since the Unix epoch
    float temperature;
    float voltage;
    float current;
    int32_t batteryLevel;

    /** New sample with a freshly generated id */
    TelemetryRecord(IdGenerator &ids, int64_t timestamp, float temperature,
                    float voltage, float current, int32_t batteryLevel);

    /** Sample with a known id, e.g. when replaying stored data */
    TelemetryRecord(std::string id, int64_t timestamp, float temperature,
                    float voltage, float current, int32_t batteryLevel);
};

} // namespace passtrack

#endif

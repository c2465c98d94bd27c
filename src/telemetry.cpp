/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <passtrack/telemetry.hpp>

#include <array>
#include <format>

namespace passtrack {

RandomIdGenerator::RandomIdGenerator() {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
    engine_.seed(seq);
}

RandomIdGenerator::RandomIdGenerator(uint64_t seed) : engine_(seed) {}

std::string RandomIdGenerator::next() {
    std::array<uint8_t, 16> bytes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t hi = engine_();
        uint64_t lo = engine_();
        for (int i = 0; i < 8; ++i) {
            bytes[i] = static_cast<uint8_t>(hi >> (56 - 8 * i));
            bytes[8 + i] = static_cast<uint8_t>(lo >> (56 - 8 * i));
        }
    }

    // RFC 4122: version 4 in the high nibble of byte 6, variant 10xx in byte 8
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::string id;
    id.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            id += '-';
        }
        id += std::format("{:02x}", bytes[i]);
    }
    return id;
}

TelemetryRecord::TelemetryRecord(IdGenerator &ids, int64_t timestamp, float temperature,
                                 float voltage, float current, int32_t batteryLevel)
    : TelemetryRecord(ids.next(), timestamp, temperature, voltage, current, batteryLevel) {}

TelemetryRecord::TelemetryRecord(std::string id, int64_t timestamp, float temperature,
                                 float voltage, float current, int32_t batteryLevel)
    : id(std::move(id)),
      timestamp(timestamp),
      temperature(temperature),
      voltage(voltage),
      current(current),
      batteryLevel(batteryLevel) {}

} // namespace passtrack

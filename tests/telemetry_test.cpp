/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <passtrack/telemetry.hpp>

#include <chrono>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace passtrack {
namespace {

// Hands out "id-1", "id-2", ...
class SequenceIdGenerator : public IdGenerator {
public:
    std::string next() override {
        return "id-" + std::to_string(++count_);
    }

private:
    int count_ = 0;
};

const std::regex UUID_V4("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

// ============================================================================
// TelemetryMessage
// ============================================================================

TEST(TelemetryMessageTest, WrapsFields) {
    auto now = std::chrono::system_clock::now();
    std::vector<uint8_t> payload{0x00, 0xFF, 0x7E};
    TelemetryMessage message("station-1", now, payload);

    EXPECT_EQ(message.getGroundStationID(), "station-1");
    EXPECT_EQ(message.getTimestamp(), now);
    EXPECT_EQ(message.getPayload(), payload);
}

TEST(TelemetryMessageTest, EmptyPayloadAccepted) {
    TelemetryMessage message("station-1", std::chrono::system_clock::time_point{}, {});
    EXPECT_TRUE(message.getPayload().empty());
}

// ============================================================================
// TelemetryRecord
// ============================================================================

TEST(TelemetryRecordTest, SuppliedIDKept) {
    TelemetryRecord a("replay-1", 1758283200, 21.5f, 3.7f, 0.25f, 87);
    TelemetryRecord b("replay-1", 1758283260, 22.0f, 3.6f, 0.30f, 86);

    EXPECT_EQ(a.id, "replay-1");
    EXPECT_EQ(a.id, b.id);
    EXPECT_EQ(a.timestamp, 1758283200);
    EXPECT_FLOAT_EQ(a.temperature, 21.5f);
    EXPECT_FLOAT_EQ(a.voltage, 3.7f);
    EXPECT_FLOAT_EQ(a.current, 0.25f);
    EXPECT_EQ(a.batteryLevel, 87);
}

TEST(TelemetryRecordTest, GeneratedIDComesFromInjectedSource) {
    SequenceIdGenerator ids;
    TelemetryRecord a(ids, 1, 0.0f, 0.0f, 0.0f, 0);
    TelemetryRecord b(ids, 2, 0.0f, 0.0f, 0.0f, 0);
    EXPECT_EQ(a.id, "id-1");
    EXPECT_EQ(b.id, "id-2");
}

TEST(TelemetryRecordTest, OutOfRangeMeasurementsAccepted) {
    TelemetryRecord record("x", -1, -500.0f, 1e9f, -3.0f, -20);
    EXPECT_FLOAT_EQ(record.temperature, -500.0f);
    EXPECT_EQ(record.batteryLevel, -20);
}

// ============================================================================
// RandomIdGenerator
// ============================================================================

TEST(RandomIdGeneratorTest, ProducesVersion4UUIDs) {
    RandomIdGenerator ids;
    for (int i = 0; i < 100; ++i) {
        auto id = ids.next();
        EXPECT_EQ(id.size(), 36u);
        EXPECT_TRUE(std::regex_match(id, UUID_V4)) << id;
    }
}

TEST(RandomIdGeneratorTest, GeneratedIDsAreDistinct) {
    RandomIdGenerator ids;
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(TelemetryRecord(ids, i, 0.0f, 0.0f, 0.0f, 0).id);
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(RandomIdGeneratorTest, SeededGeneratorsRepeat) {
    RandomIdGenerator a(1234);
    RandomIdGenerator b(1234);
    RandomIdGenerator c(4321);
    auto first = a.next();
    EXPECT_EQ(first, b.next());
    EXPECT_NE(first, c.next());
}

} // namespace
} // namespace passtrack

/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <passtrack/config.hpp>

#include <chrono>

namespace passtrack {
namespace {

TEST(ConfigTest, Defaults) {
    Config config;
    EXPECT_FALSE(config.hasStationID());
    EXPECT_EQ(config.getStationID(), "default");
    EXPECT_FALSE(config.getVerifyChecksums());
    EXPECT_FALSE(config.getValidationOptions().verifyChecksums);
    EXPECT_FALSE(config.getVerbose());
}

TEST(ConfigTest, StationID) {
    Config config;
    config.setStationID("station-1");
    EXPECT_TRUE(config.hasStationID());
    EXPECT_EQ(config.getStationID(), "station-1");

    config.clearStationID();
    EXPECT_FALSE(config.hasStationID());
    EXPECT_EQ(config.getStationID(), "default");
}

TEST(ConfigTest, EmptyStationIDResets) {
    Config config;
    config.setStationID("station-1");
    config.setStationID("");
    EXPECT_FALSE(config.hasStationID());
    EXPECT_EQ(config.getStationID(), "default");
}

TEST(ConfigTest, VerifyChecksums) {
    Config config;
    config.setVerifyChecksums(true);
    EXPECT_TRUE(config.getVerifyChecksums());
    EXPECT_TRUE(config.getValidationOptions().verifyChecksums);
}

TEST(ConfigTest, VerboseAndTime) {
    Config config;
    config.setVerbose(true);
    EXPECT_TRUE(config.getVerbose());

    auto now = std::chrono::system_clock::now();
    config.setTime(now);
    EXPECT_EQ(config.getTime(), now);
}

} // namespace
} // namespace passtrack

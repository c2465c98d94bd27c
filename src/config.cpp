/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <passtrack/config.hpp>

namespace passtrack {

// Jobs are scheduled on this station when none is configured
constexpr const char* DEFAULT_STATION_ID = "default";

bool Config::hasStationID() const {
    return stationID.has_value();
}

void Config::clearStationID() {
    stationID.reset();
}

std::string Config::getStationID() const {
    return stationID.value_or(DEFAULT_STATION_ID);
}

void Config::setStationID(const std::string &newID) {
    if (newID.empty()) {
        stationID.reset();
    } else {
        stationID = newID;
    }
}

bool Config::getVerifyChecksums() const {
    return verifyChecksums;
}

void Config::setVerifyChecksums(bool v) {
    verifyChecksums = v;
}

ValidationOptions Config::getValidationOptions() const {
    return ValidationOptions{.verifyChecksums = verifyChecksums};
}

bool Config::getVerbose() const {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

time_point Config::getTime() const {
    return time;
}

void Config::setTime(const time_point tp) {
    time = tp;
}

}

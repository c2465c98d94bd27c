/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __PASSTRACK_CONFIG_HPP
#define __PASSTRACK_CONFIG_HPP

#include <passtrack/tle.hpp>

#include <string>
#include <optional>
#include <chrono>

namespace passtrack {

using time_point = std::chrono::system_clock::time_point;

class Config {
public:
    Config() = default;
    ~Config() = default;

    bool hasStationID() const;
    void clearStationID();
    std::string getStationID() const;
    void setStationID(const std::string &stationID);

    bool getVerifyChecksums() const;
    void setVerifyChecksums(bool v);

    ValidationOptions getValidationOptions() const;

    bool getVerbose() const;
    void setVerbose(bool v);

    time_point getTime() const;
    void setTime(const time_point tp);

private:
    std::optional<std::string> stationID;
    bool verifyChecksums = false;
    bool verbose = false;
    time_point time;
};

}

#endif

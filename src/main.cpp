/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <passtrack.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <fstream>
#include <format>
#include <chrono>
#include <iostream>
#include <sstream>
#include <vector>

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

/** Read a whole file into a string */
std::string readFile(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

/** Parse a --time argument, reporting bad input as a CLI error */
passtrack::time_point parseTimeOption(const std::string &option, const std::string &timeStr) {
    try {
        return passtrack::parseTimestamp(timeStr);
    } catch (const passtrack::PayloadException &err) {
        throw CLI::ValidationError(option, err.what());
    }
}

void printTLE(const passtrack::TleData &tle) {
    using namespace passtrack;

    std::cout << tle.getName() << std::endl;
    std::cout << "  NORAD ID: " << tle.getNoradID() << std::endl;
    std::cout << "  Line 1: " << tle.getLine1() << std::endl;
    std::cout << "  Line 2: " << tle.getLine2() << std::endl;
    std::cout << std::format("  Checksums: line 1 {} (expected {}), line 2 {} (expected {})",
        tle.getLine1().back(), calculateChecksum(tle.getLine1()),
        tle.getLine2().back(), calculateChecksum(tle.getLine2())) << std::endl;
    std::cout << std::endl;
}

/** Program entry point */
int main(int argc, char* argv[]) {

    passtrack::Config config;
    config.setVerbose(false);
    config.setVerifyChecksums(false);
    config.setTime(std::chrono::system_clock::now());

    // Logs go to stderr so stdout carries only command output
    spdlog::set_default_logger(spdlog::stderr_color_mt("passtrack"));
    spdlog::set_level(spdlog::level::info);

    auto configFile = expandTilde("~/.passtrack.toml");

    CLI::App app{"PassTrack"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_option_function<std::string>("--station",
        [&config](const std::string &id) { config.setStationID(id); },
        "Ground station that runs the jobs (default: " + config.getStationID() + ")");
    app.add_flag_function("--verify-checksums",
        [&config](const int64_t v) { config.setVerifyChecksums(v > 0); },
        "Reject TLE lines whose mod-10 checksum does not match");
    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) {
            config.setVerbose(v > 0);
            spdlog::set_level(v > 0 ? spdlog::level::debug : spdlog::level::info);
        },
        "Display debugging information");

    app.ignore_case();
    app.fallthrough();

    // tle command - validate a three-line TLE file
    auto tleCommand = app.add_subcommand("tle", "Validate a three-line TLE file");

    std::string tleFile;
    tleCommand->add_option("file", tleFile, "File containing name, line 1 and line 2")->required();

    // job command - validate job submissions
    auto jobCommand = app.add_subcommand("job", "Validate job submission JSON files");

    std::vector<std::string> jobFiles;
    jobCommand->add_option("file", jobFiles, "Job JSON file(s)")->required();

    // run command - drive jobs through their lifecycle
    auto runCommand = app.add_subcommand("run", "Submit, schedule and advance jobs, printing status events");

    std::vector<std::string> runFiles;
    runCommand->add_option("file", runFiles, "Job JSON file(s)")->required();
    runCommand->add_option_function<std::string>("--time",
        [&config](const std::string &timeStr) { config.setTime(parseTimeOption("--time", timeStr)); },
        "Time to advance the jobs to (format: 2025-09-19T12:00:00Z, default: now)");

    // telemetry command - build a telemetry record
    auto telemetryCommand = app.add_subcommand("telemetry", "Build a telemetry record and print it as JSON");

    std::optional<std::string> telemetryID;
    int64_t telemetryTimestamp = 0;
    float temperature = 0.0f;
    float voltage = 0.0f;
    float current = 0.0f;
    int32_t batteryLevel = 0;
    telemetryCommand->add_option("--id", telemetryID, "Record id (default: a new random UUID)");
    telemetryCommand->add_option("--timestamp", telemetryTimestamp, "Sample time in seconds since the Unix epoch")->required();
    telemetryCommand->add_option("--temperature", temperature, "Temperature");
    telemetryCommand->add_option("--voltage", voltage, "Voltage");
    telemetryCommand->add_option("--current", current, "Current");
    telemetryCommand->add_option("--battery", batteryLevel, "Battery level");

    // Command callbacks

    tleCommand->final_callback([&config, &tleFile](void) {
        try {
            auto tle = passtrack::parseTLE(readFile(tleFile), config.getValidationOptions());
            printTLE(tle);
        } catch (const passtrack::TleParseException &err) {
            std::cerr << err.error() << ": " << err.what() << std::endl;
            std::exit(1);
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    jobCommand->final_callback([&config, &jobFiles](void) {
        try {
            for (const auto &file : jobFiles) {
                auto job = passtrack::parseJob(readFile(file), config.getValidationOptions());
                job.printInfo(std::cerr);
                std::cout << passtrack::toJSON(job) << std::endl;
            }
        } catch (const passtrack::TleParseException &err) {
            std::cerr << err.error() << ": " << err.what() << std::endl;
            std::exit(1);
        } catch (const passtrack::JobValidationException &err) {
            std::cerr << err.error() << ": " << err.what() << std::endl;
            std::exit(1);
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    runCommand->final_callback([&config, &runFiles](void) {
        try {
            passtrack::Scheduler scheduler;
            scheduler.setListener([](const passtrack::StatusEvent &event) {
                std::cout << passtrack::toJSON(event) << std::endl;
            });

            auto now = config.getTime();
            for (const auto &file : runFiles) {
                auto job = scheduler.submit(passtrack::parseJob(readFile(file), config.getValidationOptions()), now);
                scheduler.schedule(job->getID(), config.getStationID(), now);
            }
            scheduler.advance(now);
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    telemetryCommand->final_callback([&](void) {
        try {
            if (telemetryID.has_value()) {
                passtrack::TelemetryRecord record(*telemetryID, telemetryTimestamp, temperature, voltage, current, batteryLevel);
                std::cout << passtrack::toJSON(record) << std::endl;
            } else {
                passtrack::RandomIdGenerator ids;
                passtrack::TelemetryRecord record(ids, telemetryTimestamp, temperature, voltage, current, batteryLevel);
                std::cout << passtrack::toJSON(record) << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        std::exit(1);
    }

    return 0;
}

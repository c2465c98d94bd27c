/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <passtrack/json.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <chrono>
#include <cmath>
#include <limits>
#include <sstream>

#include <date/date.h>

namespace passtrack {

using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

time_point parseTimestamp(std::string_view text) {
    using namespace std::chrono;

    // time_point counts nanoseconds in 64 bits (about 1677 to 2262), so
    // parse at a coarser precision and range-check before converting
    const auto earliest = std::chrono::ceil<microseconds>(time_point::min());
    const auto latest = std::chrono::floor<microseconds>(time_point::max());

    // "Z" suffix first, then numeric UTC offsets
    for (const char* format : {"%FT%TZ", "%FT%T%Ez"}) {
        std::istringstream in{std::string(text)};
        date::sys_time<microseconds> tp;
        in >> date::parse(format, tp);
        if (in.fail() || in.peek() != std::char_traits<char>::eof()) {
            continue;
        }
        if (tp < earliest || tp > latest) {
            throw PayloadException("Timestamp out of range: " + std::string(text));
        }
        return time_point_cast<time_point::duration>(tp);
    }
    throw PayloadException("Invalid timestamp (expected ISO-8601 UTC, e.g. 2025-09-19T12:00:00Z): " + std::string(text));
}

std::string formatTimestamp(time_point tp) {
    using namespace std::chrono;

    auto secs = std::chrono::floor<seconds>(tp);
    if (secs == tp) {
        return date::format("%FT%TZ", secs);
    }
    return date::format("%FT%TZ", std::chrono::floor<microseconds>(tp));
}

static rapidjson::Document parseDocument(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw PayloadException(std::string("Failed to parse JSON at offset ")
            + std::to_string(doc.GetErrorOffset()) + ": "
            + rapidjson::GetParseError_En(doc.GetParseError()));
    }

    if (!doc.IsObject()) {
        throw PayloadException("JSON document is not an object");
    }

    return doc;
}

static const rapidjson::Value& requireMember(const rapidjson::Value &obj, const char* name) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) {
        throw PayloadException(std::string("Missing field '") + name + "'");
    }
    return it->value;
}

static std::string requireString(const rapidjson::Value &obj, const char* name) {
    const auto &value = requireMember(obj, name);
    if (!value.IsString()) {
        throw PayloadException(std::string("Field '") + name + "' must be a string");
    }
    return std::string(value.GetString(), value.GetStringLength());
}

static double requireNumber(const rapidjson::Value &obj, const char* name) {
    const auto &value = requireMember(obj, name);
    if (!value.IsNumber()) {
        throw PayloadException(std::string("Field '") + name + "' must be a number");
    }
    return value.GetDouble();
}

static int64_t requireInt64(const rapidjson::Value &obj, const char* name) {
    const auto &value = requireMember(obj, name);
    if (!value.IsInt64()) {
        throw PayloadException(std::string("Field '") + name + "' must be an integer");
    }
    return value.GetInt64();
}

// Measurements that are not finite are stored as null
static float requireMeasurement(const rapidjson::Value &obj, const char* name) {
    const auto &value = requireMember(obj, name);
    if (value.IsNull()) {
        return std::numeric_limits<float>::quiet_NaN();
    }
    if (!value.IsNumber()) {
        throw PayloadException(std::string("Field '") + name + "' must be a number or null");
    }
    return static_cast<float>(value.GetDouble());
}

static std::optional<std::vector<uint8_t>> parseUplink(const rapidjson::Value &obj) {
    auto it = obj.FindMember("uplink");
    if (it == obj.MemberEnd() || it->value.IsNull()) {
        return std::nullopt;
    }
    if (!it->value.IsArray()) {
        throw PayloadException("Field 'uplink' must be an array of bytes");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(it->value.Size());
    for (const auto &b : it->value.GetArray()) {
        if (!b.IsUint() || b.GetUint() > std::numeric_limits<uint8_t>::max()) {
            throw PayloadException("Field 'uplink' must only contain values from 0 to 255");
        }
        bytes.push_back(static_cast<uint8_t>(b.GetUint()));
    }
    return bytes;
}

static void writeString(Writer &writer, const std::string &str) {
    writer.String(str.c_str(), static_cast<rapidjson::SizeType>(str.size()));
}

// JSON has no NaN or Infinity
static void writeMeasurement(Writer &writer, float value) {
    if (std::isfinite(value)) {
        writer.Double(value);
    } else {
        writer.Null();
    }
}

Job parseJob(std::string_view json, const ValidationOptions& options) {
    auto doc = parseDocument(json);

    // Fields are checked in a fixed order
    const auto &idValue = requireMember(doc, "id");
    if (!idValue.IsUint64()) {
        throw PayloadException("Field 'id' must be an unsigned 64-bit integer");
    }
    uint64_t id = idValue.GetUint64();
    std::string satelliteID = requireString(doc, "satellite_id");
    time_point start = parseTimestamp(requireString(doc, "start"));
    time_point end = parseTimestamp(requireString(doc, "end"));

    const auto &tleValue = requireMember(doc, "tle");
    if (!tleValue.IsObject()) {
        throw PayloadException("Field 'tle' must be an object");
    }
    std::string tle0 = requireString(tleValue, "tle0");
    std::string tle1 = requireString(tleValue, "tle1");
    std::string tle2 = requireString(tleValue, "tle2");

    double rxFrequency = requireNumber(doc, "rx_frequency");
    double txFrequency = requireNumber(doc, "tx_frequency");
    auto uplink = parseUplink(doc);

    return Job(id, std::move(satelliteID), start, end,
               TleData(tle0, tle1, tle2),
               rxFrequency, txFrequency, std::move(uplink), options);
}

std::string toJSON(const Job &job) {
    rapidjson::StringBuffer buffer;
    Writer writer(buffer);

    writer.StartObject();
    writer.Key("id");
    writer.Uint64(job.getID());
    writer.Key("satellite_id");
    writeString(writer, job.getSatelliteID());
    writer.Key("start");
    writeString(writer, formatTimestamp(job.getStart()));
    writer.Key("end");
    writeString(writer, formatTimestamp(job.getEnd()));

    writer.Key("tle");
    writer.StartObject();
    writer.Key("tle0");
    writeString(writer, job.getTLE().getName());
    writer.Key("tle1");
    writeString(writer, job.getTLE().getLine1());
    writer.Key("tle2");
    writeString(writer, job.getTLE().getLine2());
    writer.EndObject();

    writer.Key("rx_frequency");
    writer.Double(job.getRxFrequency());
    writer.Key("tx_frequency");
    writer.Double(job.getTxFrequency());

    writer.Key("uplink");
    if (job.hasUplink()) {
        writer.StartArray();
        for (auto b : *job.getUplink()) {
            writer.Uint(b);
        }
        writer.EndArray();
    } else {
        writer.Null();
    }
    writer.EndObject();

    return buffer.GetString();
}

std::string toJSON(const StatusEvent &event) {
    rapidjson::StringBuffer buffer;
    Writer writer(buffer);

    writer.StartObject();
    writer.Key("job_id");
    writer.Uint64(event.jobID);
    writer.Key("status");
    writeString(writer, toString(event.status));
    writer.Key("timestamp");
    writeString(writer, formatTimestamp(event.timestamp));
    if (event.cause.has_value()) {
        writer.Key("cause");
        writeString(writer, *event.cause);
    }
    writer.EndObject();

    return buffer.GetString();
}

std::string toJSON(const TelemetryMessage &message) {
    rapidjson::StringBuffer buffer;
    Writer writer(buffer);

    writer.StartObject();
    writer.Key("ground_station_id");
    writeString(writer, message.getGroundStationID());
    writer.Key("timestamp");
    writeString(writer, formatTimestamp(message.getTimestamp()));
    writer.Key("payload");
    writer.StartArray();
    for (auto b : message.getPayload()) {
        writer.Uint(b);
    }
    writer.EndArray();
    writer.EndObject();

    return buffer.GetString();
}

std::string toJSON(const TelemetryRecord &record) {
    rapidjson::StringBuffer buffer;
    Writer writer(buffer);

    writer.StartObject();
    writer.Key("id");
    writeString(writer, record.id);
    writer.Key("timestamp");
    writer.Int64(record.timestamp);
    writer.Key("temperature");
    writeMeasurement(writer, record.temperature);
    writer.Key("voltage");
    writeMeasurement(writer, record.voltage);
    writer.Key("current");
    writeMeasurement(writer, record.current);
    writer.Key("battery_level");
    writer.Int(record.batteryLevel);
    writer.EndObject();

    return buffer.GetString();
}

TelemetryRecord parseTelemetryRecord(std::string_view json) {
    auto doc = parseDocument(json);

    std::string id = requireString(doc, "id");
    int64_t timestamp = requireInt64(doc, "timestamp");
    float temperature = requireMeasurement(doc, "temperature");
    float voltage = requireMeasurement(doc, "voltage");
    float current = requireMeasurement(doc, "current");
    int64_t batteryLevel = requireInt64(doc, "battery_level");
    if (batteryLevel < std::numeric_limits<int32_t>::min() || batteryLevel > std::numeric_limits<int32_t>::max()) {
        throw PayloadException("Field 'battery_level' is out of range");
    }

    return TelemetryRecord(std::move(id), timestamp, temperature, voltage, current,
                           static_cast<int32_t>(batteryLevel));
}

} // namespace passtrack

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace telemetry_hub::model {

enum class reading_fault : std::uint8_t {
    NONE = 0,
    OUT_OF_RANGE = 1,
    TRUNCATED = 2,
    ABSENT = 3,
};

struct Reading {
    std::string sensor_id;
    double value;
    std::uint64_t timestamp_ms;
    bool valid;
    reading_fault fault;
};

// One decoded frame. Delivered to subscribers as a unit.
struct ReadingBatch {
    std::uint32_t sequence{0};
    std::uint8_t schema_version{0};
    std::uint8_t pdu_id{0};
    std::uint64_t timestamp_ms{0};
    std::vector<Reading> readings{};
};

const char* to_string(reading_fault fault) noexcept;

} // namespace telemetry_hub::model

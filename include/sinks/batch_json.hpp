#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "model/reading.hpp"
#include "schema/schema.hpp"

namespace telemetry_hub::sinks {

// {"sequence", "schema_version", "timestamp_ms", "gap", "readings": [...]}.
// NaN values are written as null.
nlohmann::ordered_json batch_to_json(const model::ReadingBatch& batch, std::uint64_t gap = 0);
std::string serialize_batch(const model::ReadingBatch& batch, std::uint64_t gap = 0);

// Sensor catalog grouped for dashboards: {"version", "groups": {group: {id: {...}}}}.
nlohmann::ordered_json catalog_to_json(const schema::Schema& schema);

}  // namespace telemetry_hub::sinks

#include "sinks/batch_json.hpp"

#include <cmath>
#include <utility>

namespace telemetry_hub::sinks {

nlohmann::ordered_json batch_to_json(const model::ReadingBatch& batch, const std::uint64_t gap) {
  nlohmann::ordered_json out;
  out["sequence"] = batch.sequence;
  out["schema_version"] = batch.schema_version;
  out["pdu"] = batch.pdu_id;
  out["timestamp_ms"] = batch.timestamp_ms;
  out["gap"] = gap;

  auto readings = nlohmann::ordered_json::array();
  for (const auto& reading : batch.readings) {
    nlohmann::ordered_json entry;
    entry["sensor_id"] = reading.sensor_id;
    if (std::isfinite(reading.value)) {
      entry["value"] = reading.value;
    } else {
      entry["value"] = nullptr;
    }
    entry["timestamp_ms"] = reading.timestamp_ms;
    entry["valid"] = reading.valid;
    entry["fault"] = model::to_string(reading.fault);
    readings.push_back(std::move(entry));
  }
  out["readings"] = std::move(readings);
  return out;
}

std::string serialize_batch(const model::ReadingBatch& batch, const std::uint64_t gap) {
  return batch_to_json(batch, gap).dump();
}

nlohmann::ordered_json catalog_to_json(const schema::Schema& schema) {
  nlohmann::ordered_json out;
  out["version"] = schema.version();

  auto groups = nlohmann::ordered_json::object();
  for (const auto& group : schema.groups()) {
    auto members = nlohmann::ordered_json::object();
    for (const auto& id : group.sensor_ids) {
      const auto* definition = schema.lookup(id);
      if (definition == nullptr) {
        continue;
      }
      members[id] = {
          {"name", definition->name},
          {"units", definition->units},
          {"min", definition->min},
          {"max", definition->max},
          {"on_dash", definition->on_dash},
      };
    }
    groups[group.name] = std::move(members);
  }
  out["groups"] = std::move(groups);

  auto pdus = nlohmann::ordered_json::object();
  for (const auto& pdu : schema.pdus()) {
    auto ids = nlohmann::ordered_json::array();
    for (std::size_t i = 0; i < pdu.slots.size(); ++i) {
      ids.push_back(schema.slot(pdu, i).id);
    }
    pdus[pdu.name] = {{"id", pdu.id}, {"sensors", std::move(ids)}};
  }
  out["pdus"] = std::move(pdus);
  return out;
}

}  // namespace telemetry_hub::sinks

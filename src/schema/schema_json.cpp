#include "schema/schema.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace telemetry_hub::schema {
namespace {

using json = nlohmann::ordered_json;

double number_or(const json& object, const char* key, const std::string& sensor_id, const double fallback) {
  const auto it = object.find(key);
  if (it == object.end()) {
    return fallback;
  }
  if (!it->is_number()) {
    throw SchemaError(SchemaError::Kind::INVALID_VALUE, sensor_id, std::string(key) + " must be a number");
  }
  return it->get<double>();
}

std::uint64_t integer_or(const json& object, const char* key, const std::string& sensor_id,
                         const std::uint64_t fallback, const std::uint64_t highest) {
  const auto it = object.find(key);
  if (it == object.end()) {
    return fallback;
  }
  if (!it->is_number_integer()) {
    throw SchemaError(SchemaError::Kind::INVALID_VALUE, sensor_id, std::string(key) + " must be an integer");
  }
  if (!it->is_number_unsigned() || it->get<std::uint64_t>() > highest) {
    throw SchemaError(SchemaError::Kind::INVALID_VALUE, sensor_id,
                      std::string(key) + " must be in range 0.." + std::to_string(highest));
  }
  return it->get<std::uint64_t>();
}

std::uint64_t required_integer(const json& object, const char* key, const std::string& sensor_id,
                               const std::uint64_t highest) {
  if (!object.contains(key)) {
    throw SchemaError(SchemaError::Kind::MISSING_FIELD, sensor_id, std::string(key) + " is required");
  }
  return integer_or(object, key, sensor_id, 0, highest);
}

double required_number(const json& object, const char* key, const std::string& sensor_id) {
  if (!object.contains(key)) {
    throw SchemaError(SchemaError::Kind::MISSING_FIELD, sensor_id, std::string(key) + " is required");
  }
  return number_or(object, key, sensor_id, 0.0);
}

std::string string_or(const json& object, const char* key, const std::string& sensor_id, std::string fallback) {
  const auto it = object.find(key);
  if (it == object.end()) {
    return fallback;
  }
  if (!it->is_string()) {
    throw SchemaError(SchemaError::Kind::INVALID_VALUE, sensor_id, std::string(key) + " must be a string");
  }
  return it->get<std::string>();
}

bool bool_or(const json& object, const char* key, const std::string& sensor_id, const bool fallback) {
  const auto it = object.find(key);
  if (it == object.end()) {
    return fallback;
  }
  if (!it->is_boolean()) {
    throw SchemaError(SchemaError::Kind::INVALID_VALUE, sensor_id, std::string(key) + " must be a boolean");
  }
  return it->get<bool>();
}

EmulationRule parse_rule(const json& node, const SensorDefinition& definition) {
  if (node.is_null()) {
    return rules::Constant{definition.min};
  }
  if (!node.is_object()) {
    throw SchemaError(SchemaError::Kind::INVALID_RULE, definition.id, "emulation must be an object");
  }

  const std::string& id = definition.id;
  const std::string rule = string_or(node, "rule", id, "");
  if (rule == "constant") {
    return rules::Constant{required_number(node, "value", id)};
  }
  if (rule == "sine") {
    return rules::Sine{required_number(node, "amplitude", id), number_or(node, "offset", id, 0.0),
                       required_number(node, "period", id)};
  }
  if (rule == "cosine") {
    return rules::Cosine{required_number(node, "amplitude", id), number_or(node, "offset", id, 0.0),
                         required_number(node, "period", id)};
  }
  if (rule == "linear") {
    return rules::Linear{required_number(node, "slope", id), number_or(node, "intercept", id, 0.0),
                         integer_or(node, "period", id, 0, std::numeric_limits<std::uint64_t>::max())};
  }
  if (rule == "uniform_random") {
    return rules::UniformRandom{required_number(node, "low", id), required_number(node, "high", id)};
  }

  throw SchemaError(SchemaError::Kind::INVALID_RULE, id, "unknown emulation rule '" + rule + "'");
}

SensorDefinition parse_sensor(const std::string& id, const json& node) {
  if (!node.is_object()) {
    throw SchemaError(SchemaError::Kind::PARSE, id, "sensor entry must be an object");
  }

  SensorDefinition definition{};
  definition.id = id;
  definition.name = string_or(node, "name", id, id);
  definition.units = string_or(node, "units", id, "");
  definition.group = string_or(node, "group", id, "Default");
  definition.enable = bool_or(node, "enable", id, true);
  definition.min = required_number(node, "min", id);
  definition.max = required_number(node, "max", id);
  definition.on_dash = bool_or(node, "on_dash", id, false);
  definition.scale = number_or(node, "scale", id, 1.0);
  definition.offset = number_or(node, "offset", id, 0.0);

  const std::string type_name = string_or(node, "type", id, "u16");
  const auto type = parse_field_type(type_name);
  if (!type.has_value()) {
    throw SchemaError(SchemaError::Kind::UNKNOWN_TYPE, id, "unknown field type '" + type_name + "'");
  }
  definition.type = *type;

  const auto emulation_it = node.find("emulation");
  definition.emulation = parse_rule(emulation_it == node.end() ? json{} : *emulation_it, definition);
  return definition;
}

std::vector<PduDefinition> parse_pdus(const json& node) {
  if (!node.is_object()) {
    throw SchemaError(SchemaError::Kind::INVALID_PDU, "", "pdus must be an object keyed by pdu name");
  }

  std::vector<PduDefinition> pdus;
  pdus.reserve(node.size());
  for (const auto& [name, entry] : node.items()) {
    if (!entry.is_object()) {
      throw SchemaError(SchemaError::Kind::INVALID_PDU, "", "pdu '" + name + "' must be an object");
    }
    PduDefinition pdu{};
    pdu.name = name;
    pdu.id = static_cast<std::uint8_t>(required_integer(entry, "id", "", 0xFFU));

    const auto sensors_it = entry.find("sensors");
    if (sensors_it == entry.end() || !sensors_it->is_array()) {
      throw SchemaError(SchemaError::Kind::INVALID_PDU, "", "pdu '" + name + "' needs a sensors array");
    }
    for (const auto& id : *sensors_it) {
      if (!id.is_string()) {
        throw SchemaError(SchemaError::Kind::INVALID_PDU, "", "pdu '" + name + "' sensors must be strings");
      }
      pdu.sensor_ids.push_back(id.get<std::string>());
    }
    pdus.push_back(std::move(pdu));
  }
  return pdus;
}

// Rejects an object that repeats a key. Keys of the sensors object are ids.
class DuplicateKeyCheck {
 public:
  bool operator()(int /*depth*/, const json::parse_event_t event, json& parsed) {
    switch (event) {
      case json::parse_event_t::object_start:
        objects_.push_back(Scope{last_key_, {}});
        break;
      case json::parse_event_t::object_end:
        if (!objects_.empty()) {
          objects_.pop_back();
        }
        break;
      case json::parse_event_t::key:
        last_key_ = parsed.get<std::string>();
        if (!objects_.empty() && !objects_.back().keys.insert(last_key_).second) {
          if (objects_.size() == 2U && objects_.back().owner == "sensors") {
            throw SchemaError(SchemaError::Kind::DUPLICATE_ID, last_key_, "sensor id declared more than once");
          }
          throw SchemaError(SchemaError::Kind::PARSE, "",
                            "key '" + last_key_ + "' repeated in '" + objects_.back().owner + "'");
        }
        break;
      default:
        break;
    }
    return true;
  }

 private:
  struct Scope {
    std::string owner;
    std::set<std::string> keys;
  };

  std::vector<Scope> objects_{};
  std::string last_key_{};
};

}  // namespace

SchemaPtr parse_schema(const std::string& text) {
  json root;
  try {
    root = json::parse(text, DuplicateKeyCheck{});
  } catch (const json::parse_error& ex) {
    throw SchemaError(SchemaError::Kind::PARSE, "", ex.what());
  }

  if (!root.is_object()) {
    throw SchemaError(SchemaError::Kind::PARSE, "", "schema root must be an object");
  }

  const auto version = required_integer(root, "version", "", std::numeric_limits<std::uint32_t>::max());
  const auto start_byte = integer_or(root, "start_byte", "", kDefaultStartByte, 0xFFU);
  const auto max_payload = integer_or(root, "max_payload", "", kDefaultMaxPayload, 0xFFFFU);
  if (max_payload == 0U) {
    throw SchemaError(SchemaError::Kind::INVALID_VALUE, "", "max_payload must be greater than 0");
  }

  const auto sensors_it = root.find("sensors");
  if (sensors_it == root.end() || !sensors_it->is_object()) {
    throw SchemaError(SchemaError::Kind::MISSING_FIELD, "", "sensors must be an object keyed by sensor id");
  }

  std::vector<SensorDefinition> definitions;
  definitions.reserve(sensors_it->size());
  for (const auto& [id, node] : sensors_it->items()) {
    definitions.push_back(parse_sensor(id, node));
  }

  const auto pdus_it = root.find("pdus");
  std::vector<PduDefinition> pdus = pdus_it == root.end() ? std::vector<PduDefinition>{} : parse_pdus(*pdus_it);

  return std::make_shared<const Schema>(static_cast<std::uint32_t>(version), static_cast<std::uint8_t>(start_byte),
                                        static_cast<std::size_t>(max_payload), std::move(definitions),
                                        std::move(pdus));
}

SchemaPtr load_schema_file(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw SchemaError(SchemaError::Kind::PARSE, "", "unable to open schema file: " + path);
  }

  std::ostringstream contents;
  contents << input.rdbuf();
  return parse_schema(contents.str());
}

}  // namespace telemetry_hub::schema

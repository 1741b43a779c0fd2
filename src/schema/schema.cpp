#include "schema/schema.hpp"

#include <cmath>
#include <type_traits>
#include <utility>
#include <variant>

namespace telemetry_hub::schema {
namespace {

std::string describe(const SchemaError::Kind kind, const std::string& sensor_id, const std::string& detail) {
  std::string message = std::string("schema error (") + to_string(kind) + ")";
  if (!sensor_id.empty()) {
    message += " sensor '" + sensor_id + "'";
  }
  return message + ": " + detail;
}

void validate_rule(const SensorDefinition& definition) {
  std::visit(
      [&definition](const auto& rule) {
        using Rule = std::decay_t<decltype(rule)>;
        if constexpr (std::is_same_v<Rule, rules::Sine> || std::is_same_v<Rule, rules::Cosine>) {
          if (!std::isfinite(rule.period) || rule.period <= 0.0) {
            throw SchemaError(SchemaError::Kind::INVALID_RULE, definition.id, "waveform period must be greater than 0");
          }
          if (!std::isfinite(rule.amplitude) || !std::isfinite(rule.offset)) {
            throw SchemaError(SchemaError::Kind::INVALID_RULE, definition.id, "waveform parameters must be finite");
          }
        } else if constexpr (std::is_same_v<Rule, rules::UniformRandom>) {
          if (!std::isfinite(rule.low) || !std::isfinite(rule.high) || rule.low > rule.high) {
            throw SchemaError(SchemaError::Kind::INVALID_RULE, definition.id, "random rule requires low <= high");
          }
        } else if constexpr (std::is_same_v<Rule, rules::Linear>) {
          if (!std::isfinite(rule.slope) || !std::isfinite(rule.intercept)) {
            throw SchemaError(SchemaError::Kind::INVALID_RULE, definition.id, "linear parameters must be finite");
          }
        } else {
          if (!std::isfinite(rule.value)) {
            throw SchemaError(SchemaError::Kind::INVALID_RULE, definition.id, "constant must be finite");
          }
        }
      },
      definition.emulation);
}

}  // namespace

SchemaError::SchemaError(const Kind kind, std::string sensor_id, std::string detail)
    : std::runtime_error(describe(kind, sensor_id, detail)),
      kind_(kind),
      sensor_id_(std::move(sensor_id)),
      detail_(std::move(detail)) {}

const char* to_string(const SchemaError::Kind kind) noexcept {
  switch (kind) {
    case SchemaError::Kind::PARSE:
      return "parse";
    case SchemaError::Kind::MISSING_FIELD:
      return "missing_field";
    case SchemaError::Kind::INVALID_VALUE:
      return "invalid_value";
    case SchemaError::Kind::EMPTY_ID:
      return "empty_id";
    case SchemaError::Kind::DUPLICATE_ID:
      return "duplicate_id";
    case SchemaError::Kind::INVALID_RANGE:
      return "invalid_range";
    case SchemaError::Kind::UNKNOWN_TYPE:
      return "unknown_type";
    case SchemaError::Kind::UNREPRESENTABLE:
      return "unrepresentable";
    case SchemaError::Kind::INVALID_RULE:
      return "invalid_rule";
    case SchemaError::Kind::INVALID_PDU:
      return "invalid_pdu";
  }
  return "unknown";
}

Schema::Schema(const std::uint32_t version, const std::uint8_t start_byte, const std::size_t max_payload,
               std::vector<SensorDefinition> definitions, std::vector<PduDefinition> pdus)
    : version_(version), start_byte_(start_byte), max_payload_(max_payload), definitions_(std::move(definitions)) {
  if (max_payload_ > 0xFFFFU) {
    throw SchemaError(SchemaError::Kind::INVALID_VALUE, "", "max_payload must fit the 16-bit length field");
  }

  index_.reserve(definitions_.size());
  for (std::size_t i = 0; i < definitions_.size(); ++i) {
    const auto& definition = definitions_[i];
    validate_definition(definition);

    if (!index_.emplace(definition.id, i).second) {
      throw SchemaError(SchemaError::Kind::DUPLICATE_ID, definition.id, "sensor id declared more than once");
    }
    if (definition.enable) {
      enabled_.push_back(i);
    }
  }

  if (pdus.empty()) {
    add_pdu(PduLayout{kImplicitPduName, 0, enabled_});
    return;
  }

  for (auto& pdu : pdus) {
    if (pdu.sensor_ids.empty()) {
      throw SchemaError(SchemaError::Kind::INVALID_PDU, "", "pdu '" + pdu.name + "' lists no sensors");
    }
    if (find_pdu(pdu.id) != nullptr) {
      throw SchemaError(SchemaError::Kind::INVALID_PDU, "", "pdu id " + std::to_string(pdu.id) + " used twice");
    }

    std::vector<bool> listed(definitions_.size(), false);
    for (const auto& id : pdu.sensor_ids) {
      const auto it = index_.find(id);
      if (it == index_.end()) {
        throw SchemaError(SchemaError::Kind::INVALID_PDU, id, "pdu '" + pdu.name + "' lists an undeclared sensor");
      }
      if (listed[it->second]) {
        throw SchemaError(SchemaError::Kind::INVALID_PDU, id, "pdu '" + pdu.name + "' lists the sensor twice");
      }
      listed[it->second] = true;
    }

    PduLayout layout{std::move(pdu.name), pdu.id, {}};
    for (const auto index : enabled_) {
      if (listed[index]) {
        layout.slots.push_back(index);
      }
    }
    add_pdu(std::move(layout));
  }
}

void Schema::add_pdu(PduLayout pdu) {
  pdu.payload_size = pdu.bitmap_size();
  for (const auto index : pdu.slots) {
    pdu.payload_size += field_width(definitions_[index].type);
  }
  if (pdu.payload_size > max_payload_) {
    throw SchemaError(SchemaError::Kind::INVALID_VALUE, "",
                      "pdu '" + pdu.name + "' needs " + std::to_string(pdu.payload_size) +
                          " bytes but max_payload is " + std::to_string(max_payload_));
  }
  pdus_.push_back(std::move(pdu));
}

void Schema::validate_definition(const SensorDefinition& definition) const {
  if (definition.id.empty()) {
    throw SchemaError(SchemaError::Kind::EMPTY_ID, "", "sensor id must not be empty");
  }
  if (!std::isfinite(definition.min) || !std::isfinite(definition.max) || definition.min > definition.max) {
    throw SchemaError(SchemaError::Kind::INVALID_RANGE, definition.id, "min must be less than or equal to max");
  }
  if (!std::isfinite(definition.scale) || definition.scale == 0.0 || !std::isfinite(definition.offset)) {
    throw SchemaError(SchemaError::Kind::INVALID_VALUE, definition.id, "scale must be finite and non-zero");
  }
  if (!definition.representable(definition.min) || !definition.representable(definition.max)) {
    throw SchemaError(SchemaError::Kind::UNREPRESENTABLE, definition.id,
                      std::string("[min, max] does not fit a ") + to_string(definition.type) + " slot");
  }
  validate_rule(definition);
}

const SensorDefinition* Schema::lookup(const std::string& id) const noexcept {
  const auto it = index_.find(id);
  if (it == index_.end()) {
    return nullptr;
  }
  return &definitions_[it->second];
}

const PduLayout* Schema::find_pdu(const std::uint8_t id) const noexcept {
  for (const auto& pdu : pdus_) {
    if (pdu.id == id) {
      return &pdu;
    }
  }
  return nullptr;
}

std::vector<SensorGroup> Schema::groups() const {
  std::vector<SensorGroup> groups;
  std::unordered_map<std::string, std::size_t> positions;
  for (const auto index : enabled_) {
    const auto& definition = definitions_[index];
    const auto [it, inserted] = positions.emplace(definition.group, groups.size());
    if (inserted) {
      groups.push_back(SensorGroup{definition.group, {}});
    }
    groups[it->second].sensor_ids.push_back(definition.id);
  }
  return groups;
}

}  // namespace telemetry_hub::schema

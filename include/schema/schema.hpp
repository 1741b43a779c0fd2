#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "schema/sensor_definition.hpp"

namespace telemetry_hub::schema {

class SchemaError : public std::runtime_error {
 public:
  enum class Kind : std::uint8_t {
    PARSE,
    MISSING_FIELD,
    INVALID_VALUE,
    EMPTY_ID,
    DUPLICATE_ID,
    INVALID_RANGE,
    UNKNOWN_TYPE,
    UNREPRESENTABLE,
    INVALID_RULE,
    INVALID_PDU,
  };

  SchemaError(Kind kind, std::string sensor_id, std::string detail);

  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string& sensor_id() const noexcept { return sensor_id_; }
  [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

 private:
  Kind kind_;
  std::string sensor_id_;
  std::string detail_;
};

const char* to_string(SchemaError::Kind kind) noexcept;

struct SensorGroup {
  std::string name;
  std::vector<std::string> sensor_ids;
};

// A named subset of the catalog sent as one frame type.
struct PduDefinition {
  std::string name;
  std::uint8_t id{0};
  std::vector<std::string> sensor_ids{};
};

// Wire layout of one PDU: its enabled sensors in declaration order.
struct PduLayout {
  std::string name;
  std::uint8_t id{0};
  std::vector<std::size_t> slots{};
  std::size_t payload_size{0};

  [[nodiscard]] std::size_t bitmap_size() const noexcept { return (slots.size() + 7U) / 8U; }
};

inline constexpr std::uint8_t kDefaultStartByte = 0x7E;
inline constexpr std::size_t kDefaultMaxPayload = 1024;
inline constexpr const char* kImplicitPduName = "all";

// Immutable sensor catalog. See codec/frame_codec.hpp for the wire layout.
class Schema {
 public:
  // Throws SchemaError when any definition violates the catalog invariants.
  // Without PDU definitions every enabled sensor goes into one PDU with id 0.
  Schema(std::uint32_t version, std::uint8_t start_byte, std::size_t max_payload,
         std::vector<SensorDefinition> definitions, std::vector<PduDefinition> pdus = {});

  [[nodiscard]] std::uint32_t version() const noexcept { return version_; }
  [[nodiscard]] std::uint8_t wire_version() const noexcept { return static_cast<std::uint8_t>(version_ & 0xFFU); }
  [[nodiscard]] std::uint8_t start_byte() const noexcept { return start_byte_; }
  [[nodiscard]] std::size_t max_payload() const noexcept { return max_payload_; }

  [[nodiscard]] const SensorDefinition* lookup(const std::string& id) const noexcept;
  [[nodiscard]] const std::vector<SensorDefinition>& all() const noexcept { return definitions_; }

  // Number of enabled sensors.
  [[nodiscard]] std::size_t enabled_count() const noexcept { return enabled_.size(); }

  [[nodiscard]] const std::vector<PduLayout>& pdus() const noexcept { return pdus_; }
  [[nodiscard]] const PduLayout* find_pdu(std::uint8_t id) const noexcept;
  [[nodiscard]] const PduLayout& default_pdu() const noexcept { return pdus_.front(); }
  [[nodiscard]] const SensorDefinition& slot(const PduLayout& pdu, std::size_t index) const {
    return definitions_.at(pdu.slots.at(index));
  }

  [[nodiscard]] std::vector<SensorGroup> groups() const;

 private:
  void validate_definition(const SensorDefinition& definition) const;
  void add_pdu(PduLayout pdu);

  std::uint32_t version_;
  std::uint8_t start_byte_;
  std::size_t max_payload_;
  std::vector<SensorDefinition> definitions_;
  std::unordered_map<std::string, std::size_t> index_{};
  std::vector<std::size_t> enabled_{};
  std::vector<PduLayout> pdus_{};
};

using SchemaPtr = std::shared_ptr<const Schema>;

// Parses the JSON sensor catalog. Throws SchemaError.
SchemaPtr parse_schema(const std::string& text);
SchemaPtr load_schema_file(const std::string& path);

}  // namespace telemetry_hub::schema

#include "schema/sensor_definition.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

namespace telemetry_hub::schema {

std::size_t field_width(const FieldType type) noexcept {
  switch (type) {
    case FieldType::U8:
    case FieldType::I8:
      return 1;
    case FieldType::U16:
    case FieldType::I16:
      return 2;
    case FieldType::U32:
    case FieldType::I32:
    case FieldType::F32:
      return 4;
    case FieldType::F64:
      return 8;
  }
  return 0;
}

const char* to_string(const FieldType type) noexcept {
  switch (type) {
    case FieldType::U8:
      return "u8";
    case FieldType::I8:
      return "i8";
    case FieldType::U16:
      return "u16";
    case FieldType::I16:
      return "i16";
    case FieldType::U32:
      return "u32";
    case FieldType::I32:
      return "i32";
    case FieldType::F32:
      return "f32";
    case FieldType::F64:
      return "f64";
  }
  return "unknown";
}

std::optional<FieldType> parse_field_type(const std::string_view name) noexcept {
  // Accept the struct-module codes used by older catalogs as aliases.
  if (name == "u8" || name == "B") return FieldType::U8;
  if (name == "i8" || name == "b") return FieldType::I8;
  if (name == "u16" || name == "H") return FieldType::U16;
  if (name == "i16" || name == "h") return FieldType::I16;
  if (name == "u32" || name == "I") return FieldType::U32;
  if (name == "i32" || name == "i") return FieldType::I32;
  if (name == "f32" || name == "f") return FieldType::F32;
  if (name == "f64" || name == "d") return FieldType::F64;
  return std::nullopt;
}

bool is_integral(const FieldType type) noexcept {
  return type != FieldType::F32 && type != FieldType::F64;
}

double raw_lowest(const FieldType type) noexcept {
  switch (type) {
    case FieldType::U8:
    case FieldType::U16:
    case FieldType::U32:
      return 0.0;
    case FieldType::I8:
      return std::numeric_limits<std::int8_t>::lowest();
    case FieldType::I16:
      return std::numeric_limits<std::int16_t>::lowest();
    case FieldType::I32:
      return std::numeric_limits<std::int32_t>::lowest();
    case FieldType::F32:
      return std::numeric_limits<float>::lowest();
    case FieldType::F64:
      return std::numeric_limits<double>::lowest();
  }
  return 0.0;
}

double raw_highest(const FieldType type) noexcept {
  switch (type) {
    case FieldType::U8:
      return std::numeric_limits<std::uint8_t>::max();
    case FieldType::I8:
      return std::numeric_limits<std::int8_t>::max();
    case FieldType::U16:
      return std::numeric_limits<std::uint16_t>::max();
    case FieldType::I16:
      return std::numeric_limits<std::int16_t>::max();
    case FieldType::U32:
      return std::numeric_limits<std::uint32_t>::max();
    case FieldType::I32:
      return std::numeric_limits<std::int32_t>::max();
    case FieldType::F32:
      return std::numeric_limits<float>::max();
    case FieldType::F64:
      return std::numeric_limits<double>::max();
  }
  return 0.0;
}

bool SensorDefinition::raw_in_range(const double raw) const noexcept {
  if (!std::isfinite(raw)) {
    return false;
  }
  double low = to_raw(min);
  double high = to_raw(max);
  if (low > high) {
    std::swap(low, high);
  }
  if (type == FieldType::F32) {
    low = static_cast<float>(low);
    high = static_cast<float>(high);
  }
  return raw >= low && raw <= high;
}

double SensorDefinition::to_raw(const double value) const noexcept {
  const double raw = (value - offset) / scale;
  return is_integral(type) ? std::round(raw) : raw;
}

double SensorDefinition::from_raw(const double raw) const noexcept {
  return (raw * scale) + offset;
}

bool SensorDefinition::representable(const double value) const noexcept {
  if (!std::isfinite(value)) {
    return false;
  }
  const double raw = to_raw(value);
  return raw >= raw_lowest(type) && raw <= raw_highest(type);
}

}  // namespace telemetry_hub::schema

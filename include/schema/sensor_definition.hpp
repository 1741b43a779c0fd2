#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace telemetry_hub::schema {

enum class FieldType : std::uint8_t { U8, I8, U16, I16, U32, I32, F32, F64 };

std::size_t field_width(FieldType type) noexcept;
const char* to_string(FieldType type) noexcept;
std::optional<FieldType> parse_field_type(std::string_view name) noexcept;
bool is_integral(FieldType type) noexcept;

// Lowest and highest raw value a slot of this type can carry.
double raw_lowest(FieldType type) noexcept;
double raw_highest(FieldType type) noexcept;

namespace rules {

struct Constant {
  double value{0.0};
};

struct Sine {
  double amplitude{0.0};
  double offset{0.0};
  double period{1.0};
};

struct Cosine {
  double amplitude{0.0};
  double offset{0.0};
  double period{1.0};
};

// Sawtooth when period > 0, otherwise an unbounded ramp.
struct Linear {
  double slope{0.0};
  double intercept{0.0};
  std::uint64_t period{0};
};

struct UniformRandom {
  double low{0.0};
  double high{0.0};
};

}  // namespace rules

using EmulationRule = std::variant<rules::Constant, rules::Sine, rules::Cosine, rules::Linear, rules::UniformRandom>;

struct SensorDefinition {
  std::string id;
  std::string name;
  std::string units;
  std::string group;
  bool enable{true};
  double min{0.0};
  double max{0.0};
  bool on_dash{false};
  FieldType type{FieldType::U16};
  double scale{1.0};
  double offset{0.0};
  EmulationRule emulation{rules::Constant{}};

  // True when some value in [min, max] encodes to this raw slot value.
  [[nodiscard]] bool raw_in_range(double raw) const noexcept;

  // Physical <-> raw slot value. Integral slots round to the nearest step.
  [[nodiscard]] double to_raw(double value) const noexcept;
  [[nodiscard]] double from_raw(double raw) const noexcept;
  [[nodiscard]] bool representable(double value) const noexcept;
};

}  // namespace telemetry_hub::schema

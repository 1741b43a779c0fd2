#pragma once

#include <cstdint>
#include <random>

#include "codec/frame_codec.hpp"
#include "core/event_counter.hpp"
#include "model/frame.hpp"
#include "schema/schema.hpp"

namespace telemetry_hub::emulation {

// Waveform rules are pure functions of the tick; random rules draw from rng.
double evaluate(const schema::EmulationRule& rule, std::uint64_t tick, std::mt19937_64& rng);

class Emulator {
 public:
  Emulator(schema::SchemaPtr schema, std::uint64_t seed);

  // Evaluates the enabled sensors of this tick's PDU, encodes them and
  // advances the tick counter. PDUs take turns in declaration order.
  model::Frame tick();
  model::Frame tick(std::uint64_t timestamp_ms);

  [[nodiscard]] codec::SensorValues values_at_current_tick();
  [[nodiscard]] const schema::PduLayout& current_pdu() const noexcept;

  void use_schema(schema::SchemaPtr schema) noexcept;
  [[nodiscard]] const schema::SchemaPtr& schema() const noexcept { return schema_; }
  [[nodiscard]] std::uint64_t current_tick() const noexcept { return ticks_.count(); }
  [[nodiscard]] std::uint64_t encode_failures() const noexcept { return encode_failures_; }

 private:
  schema::SchemaPtr schema_;
  std::mt19937_64 rng_;
  core::EventCounter ticks_{};
  std::uint64_t encode_failures_{0};
};

}  // namespace telemetry_hub::emulation

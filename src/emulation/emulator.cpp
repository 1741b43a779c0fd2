#include "emulation/emulator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include "core/timestamp.hpp"

namespace telemetry_hub::emulation {
namespace {

constexpr double kTwoPi = 6.283185307179586476925;

}  // namespace

double evaluate(const schema::EmulationRule& rule, const std::uint64_t tick, std::mt19937_64& rng) {
  const auto x = static_cast<double>(tick);
  return std::visit(
      [x, tick, &rng](const auto& r) -> double {
        using Rule = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<Rule, schema::rules::Constant>) {
          return r.value;
        } else if constexpr (std::is_same_v<Rule, schema::rules::Sine>) {
          return r.offset + (r.amplitude * std::sin(kTwoPi * x / r.period));
        } else if constexpr (std::is_same_v<Rule, schema::rules::Cosine>) {
          return r.offset + (r.amplitude * std::cos(kTwoPi * x / r.period));
        } else if constexpr (std::is_same_v<Rule, schema::rules::Linear>) {
          const std::uint64_t step = r.period > 0U ? tick % r.period : tick;
          return r.intercept + (r.slope * static_cast<double>(step));
        } else {
          std::uniform_real_distribution<double> distribution(r.low, r.high);
          return distribution(rng);
        }
      },
      rule);
}

Emulator::Emulator(schema::SchemaPtr schema, const std::uint64_t seed) : schema_(std::move(schema)), rng_(seed) {
  if (schema_ == nullptr) {
    throw std::invalid_argument("emulator requires a schema");
  }
}

void Emulator::use_schema(schema::SchemaPtr schema) noexcept {
  if (schema != nullptr) {
    schema_ = std::move(schema);
  }
}

const schema::PduLayout& Emulator::current_pdu() const noexcept {
  const auto& pdus = schema_->pdus();
  return pdus[ticks_.count() % pdus.size()];
}

codec::SensorValues Emulator::values_at_current_tick() {
  const auto& pdu = current_pdu();
  codec::SensorValues values;
  values.reserve(pdu.slots.size());
  for (std::size_t i = 0; i < pdu.slots.size(); ++i) {
    const auto& definition = schema_->slot(pdu, i);
    const double raw = evaluate(definition.emulation, ticks_.count(), rng_);
    values.emplace(definition.id, std::clamp(raw, definition.min, definition.max));
  }
  return values;
}

model::Frame Emulator::tick() { return tick(core::unix_timestamp_now_ms()); }

model::Frame Emulator::tick(const std::uint64_t timestamp_ms) {
  const std::uint8_t pdu_id = current_pdu().id;
  auto values = values_at_current_tick();
  const auto sequence = static_cast<std::uint32_t>(ticks_.next());

  while (true) {
    codec::EncodeError error{};
    auto frame = codec::encode_pdu(values, *schema_, pdu_id, sequence, timestamp_ms, &error);
    if (frame.has_value()) {
      return std::move(*frame);
    }

    ++encode_failures_;
    std::cerr << "[emulator] dropping " << error.sensor_id << " from tick " << sequence << ": " << error.detail
              << '\n';
    if (values.erase(error.sensor_id) == 0U) {
      // Not attributable to one sensor: send the envelope with nothing present.
      const model::FrameHeader header{schema_->start_byte(), schema_->wire_version(), pdu_id, sequence,
                                      timestamp_ms, 0};
      return codec::seal_frame(header, {});
    }
  }
}

}  // namespace telemetry_hub::emulation

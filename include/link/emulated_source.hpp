#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "core/timestamp.hpp"
#include "emulation/emulator.hpp"
#include "link/byte_source.hpp"
#include "schema/schema_store.hpp"

namespace telemetry_hub::link {

struct EmulatedOptions {
  std::chrono::milliseconds tick_interval{100};
  std::uint64_t seed{1};
};

// Stands in for the radio link: one emulator frame per tick interval, handed
// out as raw bytes so the framer and decoder see exactly what a live link
// would produce. Follows schema reloads on the next tick.
class EmulatedByteSource final : public ByteSource {
 public:
  EmulatedByteSource(const schema::SchemaStore& store, EmulatedOptions options);

  bool open(const std::atomic<bool>& cancel, LinkError& error) override;
  ReadResult read(std::uint8_t* buffer, std::size_t capacity, std::chrono::milliseconds timeout) override;
  void close() noexcept override;
  [[nodiscard]] std::string describe() const override;

  [[nodiscard]] std::uint64_t frames_emitted() const noexcept { return frames_emitted_; }

 private:
  void refill();

  const schema::SchemaStore& store_;
  EmulatedOptions options_;
  std::unique_ptr<emulation::Emulator> emulator_{};
  std::uint64_t schema_generation_{0};
  std::vector<std::uint8_t> pending_{};
  std::size_t pending_offset_{0};
  core::SteadyClock::time_point next_tick_{};
  std::uint64_t frames_emitted_{0};
};

}  // namespace telemetry_hub::link

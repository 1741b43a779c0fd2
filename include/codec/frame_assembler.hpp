#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "model/frame.hpp"

namespace telemetry_hub::codec {

// Cuts a raw byte stream into envelopes. Garbage, header or payload CRC
// failures and oversize lengths are skipped one byte at a time until the next
// start byte lines up.
class FrameAssembler {
 public:
  struct Stats {
    std::uint64_t frames{0};
    std::uint64_t discarded_bytes{0};
    std::uint64_t crc_failures{0};
    std::uint64_t oversize_lengths{0};
  };

  FrameAssembler(std::uint8_t start_byte, std::size_t max_payload);

  void push(const std::uint8_t* data, std::size_t size);
  std::optional<model::Frame> next();

  // Drops any partially received frame.
  void reset() noexcept;

  [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size() - read_pos_; }
  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }

 private:
  void discard(std::size_t count) noexcept;
  void compact();

  std::uint8_t start_byte_;
  std::size_t max_payload_;
  std::vector<std::uint8_t> buffer_{};
  std::size_t read_pos_{0};
  Stats stats_{};
};

}  // namespace telemetry_hub::codec

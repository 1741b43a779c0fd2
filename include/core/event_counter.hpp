#pragma once

#include <cstdint>

namespace telemetry_hub::core {

// Counts events and flags every Nth one. An interval of zero never fires.
class EventCounter {
 public:
  explicit EventCounter(std::uint64_t interval = 0) noexcept : interval_(interval) {}

  // Returns the index of the event just counted, starting at zero.
  std::uint64_t next() noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] bool due() const noexcept;

 private:
  std::uint64_t interval_;
  std::uint64_t count_{0};
};

}  // namespace telemetry_hub::core

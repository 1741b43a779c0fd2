#pragma once

#include <chrono>

namespace telemetry_hub::link {

// Bounded exponential delay between connect attempts.
class Backoff {
 public:
  Backoff(std::chrono::milliseconds initial, std::chrono::milliseconds ceiling, double multiplier = 2.0);

  // Non-decreasing, never above ceiling().
  std::chrono::milliseconds next();
  void reset() noexcept;

  [[nodiscard]] std::chrono::milliseconds initial() const noexcept { return initial_; }
  [[nodiscard]] std::chrono::milliseconds ceiling() const noexcept { return ceiling_; }
  [[nodiscard]] unsigned attempts() const noexcept { return attempts_; }

 private:
  std::chrono::milliseconds initial_;
  std::chrono::milliseconds ceiling_;
  double multiplier_;
  std::chrono::milliseconds current_{0};
  unsigned attempts_{0};
};

}  // namespace telemetry_hub::link

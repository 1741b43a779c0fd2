#pragma once

#include <chrono>
#include <cstdint>

namespace telemetry_hub::core {

using SteadyClock = std::chrono::steady_clock;

// Wall-clock time stamped into frame headers.
inline std::uint64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

}  // namespace telemetry_hub::core

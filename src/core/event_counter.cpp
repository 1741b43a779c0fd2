#include "core/event_counter.hpp"

namespace telemetry_hub::core {

std::uint64_t EventCounter::next() noexcept { return count_++; }

bool EventCounter::due() const noexcept {
  return interval_ != 0U && count_ != 0U && (count_ % interval_) == 0U;
}

}  // namespace telemetry_hub::core

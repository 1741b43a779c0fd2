#include "link/backoff.hpp"

#include <algorithm>

namespace telemetry_hub::link {

Backoff::Backoff(const std::chrono::milliseconds initial, const std::chrono::milliseconds ceiling,
                 const double multiplier)
    : initial_(std::max(initial, std::chrono::milliseconds(1))),
      ceiling_(std::max(ceiling, initial_)),
      multiplier_(multiplier < 1.0 ? 1.0 : multiplier) {}

std::chrono::milliseconds Backoff::next() {
  if (attempts_ == 0U) {
    current_ = initial_;
  } else if (current_ < ceiling_) {
    const double grown = static_cast<double>(current_.count()) * multiplier_;
    const double capped = std::min(grown, static_cast<double>(ceiling_.count()));
    current_ = std::max(current_, std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(capped)));
  }
  ++attempts_;
  return current_;
}

void Backoff::reset() noexcept {
  current_ = std::chrono::milliseconds(0);
  attempts_ = 0;
}

}  // namespace telemetry_hub::link

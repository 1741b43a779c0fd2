#include "link/emulated_source.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

namespace telemetry_hub::link {

EmulatedByteSource::EmulatedByteSource(const schema::SchemaStore& store, EmulatedOptions options)
    : store_(store), options_(options) {
  if (options_.tick_interval <= std::chrono::milliseconds(0)) {
    options_.tick_interval = std::chrono::milliseconds(1);
  }
}

bool EmulatedByteSource::open(const std::atomic<bool>& cancel, LinkError& error) {
  if (cancel.load()) {
    error = LinkError{LinkErrorKind::CANCELLED, "open cancelled"};
    return false;
  }

  // The tick counter survives reconnects so sequence numbers keep increasing.
  if (emulator_ == nullptr) {
    emulator_ = std::make_unique<emulation::Emulator>(store_.current(), options_.seed);
    schema_generation_ = store_.generation();
  }
  pending_.clear();
  pending_offset_ = 0;
  next_tick_ = core::SteadyClock::now();
  return true;
}

void EmulatedByteSource::refill() {
  if (store_.generation() != schema_generation_) {
    schema_generation_ = store_.generation();
    emulator_->use_schema(store_.current());
    std::cerr << "[link] emulator switched to schema version " << emulator_->schema()->version() << '\n';
  }

  pending_ = emulator_->tick().bytes;
  pending_offset_ = 0;
  ++frames_emitted_;
  next_tick_ += options_.tick_interval;

  // Do not try to catch up after a long pause.
  const auto now = core::SteadyClock::now();
  if (next_tick_ < now) {
    next_tick_ = now;
  }
}

ReadResult EmulatedByteSource::read(std::uint8_t* buffer, const std::size_t capacity,
                                    const std::chrono::milliseconds timeout) {
  ReadResult result{};
  if (emulator_ == nullptr) {
    result.status = ReadStatus::ERROR;
    result.error = LinkError{LinkErrorKind::DROPPED, "emulator not open"};
    return result;
  }

  if (pending_offset_ >= pending_.size()) {
    const auto now = core::SteadyClock::now();
    if (next_tick_ > now) {
      const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(next_tick_ - now);
      if (wait > timeout) {
        std::this_thread::sleep_for(timeout);
        result.status = ReadStatus::TIMEOUT;
        return result;
      }
      std::this_thread::sleep_for(next_tick_ - now);
    }
    refill();
  }

  const std::size_t count = std::min(capacity, pending_.size() - pending_offset_);
  std::memcpy(buffer, pending_.data() + pending_offset_, count);
  pending_offset_ += count;

  result.status = ReadStatus::DATA;
  result.bytes = count;
  return result;
}

void EmulatedByteSource::close() noexcept {
  pending_.clear();
  pending_offset_ = 0;
}

std::string EmulatedByteSource::describe() const {
  return "emulator@" + std::to_string(options_.tick_interval.count()) + "ms";
}

}  // namespace telemetry_hub::link

#pragma once

#include <cstdint>
#include <string>

#include "model/reading.hpp"

namespace telemetry_hub::sinks {

// Carries batches to a client. Runs on its own worker thread, never on the
// publisher's.
class BatchSink {
 public:
  virtual ~BatchSink() = default;

  // gap is the number of batches dropped for this subscriber since the
  // previous delivery.
  virtual bool publish(const model::ReadingBatch& batch, std::uint64_t gap) = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

}  // namespace telemetry_hub::sinks

#pragma once

#include <cstdint>
#include <string>

#include "sinks/batch_sink.hpp"

namespace telemetry_hub::sinks {

class StdoutDebugSink final : public BatchSink {
 public:
  bool publish(const model::ReadingBatch& batch, std::uint64_t gap) override;
  [[nodiscard]] std::string name() const override { return "stdout"; }
};

}  // namespace telemetry_hub::sinks

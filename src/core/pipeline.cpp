#include "core/pipeline.hpp"

#include <iostream>
#include <utility>

namespace telemetry_hub::core {

Pipeline::Pipeline(const schema::SchemaStore& schemas, hub::DistributionHub& hub) : schemas_(schemas), hub_(hub) {}

void Pipeline::on_frame(const model::Frame& frame) {
  const schema::SchemaPtr schema = schemas_.current();

  codec::DecodeError error{};
  auto batch = codec::decode(frame, *schema, &error);
  if (!batch.has_value()) {
    report(error);
    return;
  }

  if (failing_) {
    std::cerr << "[server] decoding recovered at sequence " << batch->sequence << '\n';
    failing_ = false;
  }

  std::uint64_t invalid = 0;
  for (const auto& reading : batch->readings) {
    if (!reading.valid) {
      ++invalid;
    }
  }
  invalid_readings_ += invalid;
  ++frames_decoded_;
  hub_.publish(std::move(*batch));
}

void Pipeline::report(const codec::DecodeError& error) {
  switch (error.kind) {
    case codec::DecodeError::Kind::VERSION_MISMATCH:
      ++version_mismatches_;
      break;
    case codec::DecodeError::Kind::UNKNOWN_PDU:
      ++unknown_pdus_;
      break;
    case codec::DecodeError::Kind::INTEGRITY:
      ++integrity_failures_;
      break;
  }

  if (!failing_) {
    std::cerr << "[server] dropping frames (" << codec::to_string(error.kind) << "): " << error.detail << '\n';
    failing_ = true;
  }
}

PipelineStats Pipeline::stats() const noexcept {
  PipelineStats stats{};
  stats.frames_decoded = frames_decoded_.load();
  stats.integrity_failures = integrity_failures_.load();
  stats.version_mismatches = version_mismatches_.load();
  stats.unknown_pdus = unknown_pdus_.load();
  stats.frames_dropped = stats.integrity_failures + stats.version_mismatches + stats.unknown_pdus;
  stats.invalid_readings = invalid_readings_.load();
  return stats;
}

}  // namespace telemetry_hub::core

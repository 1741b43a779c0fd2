#pragma once

#include <atomic>
#include <cstdint>

#include "codec/frame_codec.hpp"
#include "hub/distribution_hub.hpp"
#include "model/frame.hpp"
#include "schema/schema_store.hpp"

namespace telemetry_hub::core {

struct PipelineStats {
  std::uint64_t frames_decoded{0};
  std::uint64_t frames_dropped{0};
  std::uint64_t integrity_failures{0};
  std::uint64_t version_mismatches{0};
  std::uint64_t unknown_pdus{0};
  std::uint64_t invalid_readings{0};
};

// Decodes each framed envelope against the schema active when the frame
// arrived and publishes the batch. Bad frames are counted and dropped.
class Pipeline {
 public:
  Pipeline(const schema::SchemaStore& schemas, hub::DistributionHub& hub);

  void on_frame(const model::Frame& frame);

  [[nodiscard]] PipelineStats stats() const noexcept;

 private:
  void report(const codec::DecodeError& error);

  const schema::SchemaStore& schemas_;
  hub::DistributionHub& hub_;

  std::atomic<std::uint64_t> frames_decoded_{0};
  std::atomic<std::uint64_t> integrity_failures_{0};
  std::atomic<std::uint64_t> version_mismatches_{0};
  std::atomic<std::uint64_t> unknown_pdus_{0};
  std::atomic<std::uint64_t> invalid_readings_{0};
  bool failing_{false};
};

}  // namespace telemetry_hub::core

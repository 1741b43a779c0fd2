#include "sinks/stdout_debug.hpp"

#include <cstdio>

namespace telemetry_hub::sinks {

bool StdoutDebugSink::publish(const model::ReadingBatch& batch, const std::uint64_t gap) {
  std::size_t invalid = 0;
  for (const auto& reading : batch.readings) {
    if (!reading.valid) {
      ++invalid;
    }
  }

  std::printf("[batch] seq=%u version=%u pdu=%u ts_ms=%llu readings=%zu invalid=%zu gap=%llu", batch.sequence,
              static_cast<unsigned>(batch.schema_version), static_cast<unsigned>(batch.pdu_id),
              static_cast<unsigned long long>(batch.timestamp_ms),
              batch.readings.size(), invalid, static_cast<unsigned long long>(gap));
  if (!batch.readings.empty()) {
    const auto& first = batch.readings.front();
    std::printf(" %s=%.2f", first.sensor_id.c_str(), first.value);
  }
  std::printf("\n");
  return true;
}

}  // namespace telemetry_hub::sinks

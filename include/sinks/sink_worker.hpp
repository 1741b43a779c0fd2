#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <thread>

#include "hub/distribution_hub.hpp"
#include "sinks/batch_sink.hpp"

namespace telemetry_hub::sinks {

struct SinkWorkerStats {
  std::uint64_t delivered{0};
  std::uint64_t failed{0};
  std::uint64_t missed{0};
};

// One subscription drained by one thread at the sink's own pace.
class SinkWorker {
 public:
  SinkWorker(hub::DistributionHub& hub, std::unique_ptr<BatchSink> sink, std::size_t queue_capacity);
  ~SinkWorker();

  SinkWorker(const SinkWorker&) = delete;
  SinkWorker& operator=(const SinkWorker&) = delete;

  void start();
  // Returns once the hub has closed the subscription and the queue is empty.
  void join();
  // Unsubscribes and joins without draining.
  void stop();

  [[nodiscard]] SinkWorkerStats stats() const noexcept;
  [[nodiscard]] const hub::SubscriberHandle& subscription() const noexcept { return subscription_; }

 private:
  void run();
  void deliver(const hub::Delivery& delivery);

  hub::DistributionHub& hub_;
  std::unique_ptr<BatchSink> sink_;
  hub::SubscriberHandle subscription_;
  std::thread thread_{};

  std::uint64_t expected_sequence_{0};
  bool sink_ok_{true};
  bool in_gap_{false};

  std::atomic<std::uint64_t> delivered_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::atomic<std::uint64_t> missed_{0};
};

}  // namespace telemetry_hub::sinks

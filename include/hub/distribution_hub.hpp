#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "model/reading.hpp"

namespace telemetry_hub::hub {

enum class subscriber_state : std::uint8_t {
  CONNECTED = 0,
  SLOW = 1,
  DISCONNECTED = 2,
};

const char* to_string(subscriber_state state) noexcept;

using BatchPtr = std::shared_ptr<const model::ReadingBatch>;

struct Delivery {
  // Per-subscriber counter, advanced on every publish offered to the
  // subscriber. A jump between consecutive pops means batches were dropped.
  std::uint64_t sequence;
  BatchPtr batch;
};

struct HubOptions {
  std::size_t queue_capacity{64};
  // Consecutive publishes that find the queue full before the subscriber is
  // disconnected.
  std::uint32_t max_full_publishes{32};
};

class DistributionHub;

class Subscriber {
 public:
  Subscriber(std::uint64_t id, std::string name, std::size_t capacity, std::uint32_t max_full_publishes);

  Subscriber(const Subscriber&) = delete;
  Subscriber& operator=(const Subscriber&) = delete;

  std::optional<Delivery> try_pop();
  // Waits up to timeout. Returns nullopt on timeout, or once the subscriber is
  // closed and its queue is empty.
  std::optional<Delivery> pop(std::chrono::milliseconds timeout);

  [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
  [[nodiscard]] subscriber_state state() const;
  [[nodiscard]] std::size_t queued() const;
  [[nodiscard]] std::uint64_t dropped() const;
  [[nodiscard]] bool closed() const;

 private:
  friend class DistributionHub;

  // Never blocks on the consumer. Returns false once the subscriber has to be
  // removed from the hub.
  bool offer(const BatchPtr& batch);
  void close(bool drain);

  const std::uint64_t id_;
  const std::string name_;
  const std::size_t capacity_;
  const std::uint32_t max_full_publishes_;

  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<Delivery> queue_{};
  subscriber_state state_{subscriber_state::CONNECTED};
  std::uint64_t next_sequence_{0};
  std::uint32_t consecutive_full_{0};
  std::uint64_t dropped_{0};
  bool closed_{false};
};

using SubscriberHandle = std::shared_ptr<Subscriber>;

struct HubStats {
  std::uint64_t published{0};
  std::uint64_t evicted{0};
  std::size_t subscribers{0};
};

class DistributionHub {
 public:
  explicit DistributionHub(HubOptions options = {});

  SubscriberHandle subscribe(std::string name = {});
  SubscriberHandle subscribe(std::string name, std::size_t queue_capacity);

  // Idempotent.
  void unsubscribe(const SubscriberHandle& handle);

  void publish(model::ReadingBatch batch);
  void publish(const BatchPtr& batch);

  // Closes every subscriber. With drain, queued batches stay poppable.
  void close(bool drain);

  [[nodiscard]] HubStats stats() const;

 private:
  HubOptions options_;
  mutable std::mutex mutex_;
  std::unordered_map<std::uint64_t, SubscriberHandle> subscribers_{};
  std::uint64_t next_id_{1};
  std::uint64_t published_{0};
  std::uint64_t evicted_{0};
  bool closed_{false};
};

}  // namespace telemetry_hub::hub

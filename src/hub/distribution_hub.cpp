#include "hub/distribution_hub.hpp"

#include <iostream>
#include <utility>
#include <vector>

namespace telemetry_hub::hub {

const char* to_string(const subscriber_state state) noexcept {
  switch (state) {
    case subscriber_state::CONNECTED:
      return "connected";
    case subscriber_state::SLOW:
      return "slow";
    case subscriber_state::DISCONNECTED:
      return "disconnected";
  }
  return "unknown";
}

Subscriber::Subscriber(const std::uint64_t id, std::string name, const std::size_t capacity,
                       const std::uint32_t max_full_publishes)
    : id_(id),
      name_(std::move(name)),
      capacity_(capacity == 0U ? 1U : capacity),
      max_full_publishes_(max_full_publishes == 0U ? 1U : max_full_publishes) {}

std::optional<Delivery> Subscriber::try_pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return std::nullopt;
  }
  Delivery delivery = std::move(queue_.front());
  queue_.pop_front();
  return delivery;
}

std::optional<Delivery> Subscriber::pop(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  ready_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
  if (queue_.empty()) {
    return std::nullopt;
  }
  Delivery delivery = std::move(queue_.front());
  queue_.pop_front();
  return delivery;
}

subscriber_state Subscriber::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::size_t Subscriber::queued() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

std::uint64_t Subscriber::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

bool Subscriber::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

bool Subscriber::offer(const BatchPtr& batch) {
  bool keep = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }

    const std::uint64_t sequence = next_sequence_++;
    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
      ++consecutive_full_;
      state_ = subscriber_state::SLOW;
      if (consecutive_full_ >= max_full_publishes_) {
        state_ = subscriber_state::DISCONNECTED;
        closed_ = true;
      }
    } else {
      consecutive_full_ = 0;
      state_ = subscriber_state::CONNECTED;
    }

    if (closed_) {
      keep = false;
    } else {
      queue_.push_back(Delivery{sequence, batch});
    }
  }
  ready_.notify_one();
  return keep;
}

void Subscriber::close(const bool drain) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    state_ = subscriber_state::DISCONNECTED;
    if (!drain) {
      queue_.clear();
    }
  }
  ready_.notify_all();
}

DistributionHub::DistributionHub(HubOptions options) : options_(options) {}

SubscriberHandle DistributionHub::subscribe(std::string name) {
  return subscribe(std::move(name), options_.queue_capacity);
}

SubscriberHandle DistributionHub::subscribe(std::string name, const std::size_t queue_capacity) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::uint64_t id = next_id_++;
  if (name.empty()) {
    name = "subscriber-" + std::to_string(id);
  }

  auto subscriber = std::make_shared<Subscriber>(id, std::move(name), queue_capacity, options_.max_full_publishes);
  if (closed_) {
    subscriber->close(false);
    return subscriber;
  }
  subscribers_.emplace(id, subscriber);
  return subscriber;
}

void DistributionHub::unsubscribe(const SubscriberHandle& handle) {
  if (handle == nullptr) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (subscribers_.erase(handle->id()) > 0U) {
    handle->close(false);
  }
}

void DistributionHub::publish(model::ReadingBatch batch) {
  publish(std::make_shared<const model::ReadingBatch>(std::move(batch)));
}

void DistributionHub::publish(const BatchPtr& batch) {
  if (batch == nullptr) {
    return;
  }

  std::vector<SubscriberHandle> evicted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }

    ++published_;
    for (auto it = subscribers_.begin(); it != subscribers_.end();) {
      if (it->second->offer(batch)) {
        ++it;
        continue;
      }
      evicted.push_back(it->second);
      it = subscribers_.erase(it);
      ++evicted_;
    }
  }

  for (const auto& subscriber : evicted) {
    std::cerr << "[hub] disconnected slow subscriber " << subscriber->name() << " after "
              << subscriber->dropped() << " dropped batches\n";
  }
}

void DistributionHub::close(const bool drain) {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  for (auto& entry : subscribers_) {
    entry.second->close(drain);
  }
  subscribers_.clear();
}

HubStats DistributionHub::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return HubStats{published_, evicted_, subscribers_.size()};
}

}  // namespace telemetry_hub::hub

#include "sinks/sink_worker.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace telemetry_hub::sinks {
namespace {

constexpr std::chrono::milliseconds kPopTimeout{100};

}  // namespace

SinkWorker::SinkWorker(hub::DistributionHub& hub, std::unique_ptr<BatchSink> sink, const std::size_t queue_capacity)
    : hub_(hub), sink_(std::move(sink)) {
  if (sink_ == nullptr) {
    throw std::invalid_argument("sink worker requires a sink");
  }
  subscription_ = hub_.subscribe(sink_->name(), queue_capacity);
}

SinkWorker::~SinkWorker() { stop(); }

void SinkWorker::start() {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::thread([this] { run(); });
}

void SinkWorker::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void SinkWorker::stop() {
  hub_.unsubscribe(subscription_);
  join();
}

SinkWorkerStats SinkWorker::stats() const noexcept {
  return SinkWorkerStats{delivered_.load(), failed_.load(), missed_.load()};
}

void SinkWorker::run() {
  while (true) {
    auto delivery = subscription_->pop(kPopTimeout);
    if (!delivery.has_value()) {
      if (subscription_->closed() && subscription_->queued() == 0U) {
        break;
      }
      continue;
    }
    deliver(*delivery);
  }
}

void SinkWorker::deliver(const hub::Delivery& delivery) {
  const std::uint64_t gap = delivery.sequence > expected_sequence_ ? delivery.sequence - expected_sequence_ : 0U;
  expected_sequence_ = delivery.sequence + 1U;

  if (gap > 0U) {
    missed_ += gap;
    if (!in_gap_) {
      std::cerr << "[hub] " << sink_->name() << " fell behind, " << gap << " batches dropped\n";
      in_gap_ = true;
    }
  } else {
    in_gap_ = false;
  }

  const bool ok = sink_->publish(*delivery.batch, gap);
  if (ok) {
    ++delivered_;
    if (!sink_ok_) {
      std::cerr << "[hub] " << sink_->name() << " publish recovered\n";
      sink_ok_ = true;
    }
    return;
  }

  ++failed_;
  if (sink_ok_) {
    std::cerr << "[hub] " << sink_->name() << " publish failed\n";
    sink_ok_ = false;
  }
}

}  // namespace telemetry_hub::sinks

#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "codec/frame_assembler.hpp"
#include "link/backoff.hpp"
#include "link/byte_source.hpp"
#include "model/frame.hpp"
#include "schema/schema_store.hpp"

namespace telemetry_hub::link {

enum class link_state : std::uint8_t {
  IDLE = 0,
  CONNECTING = 1,
  STREAMING = 2,
  RECONNECTING = 3,
  STOPPED = 4,
};

const char* to_string(link_state state) noexcept;

struct SupervisorOptions {
  std::chrono::milliseconds read_timeout{100};
  // Consecutive read timeouts adding up to this much count as a dropped link.
  std::chrono::milliseconds stall_timeout{3000};
  std::chrono::milliseconds backoff_initial{100};
  std::chrono::milliseconds backoff_max{5000};
};

struct StateChange {
  link_state state{link_state::IDLE};
  // Delay before the next connect attempt; zero when none is pending.
  std::chrono::milliseconds retry_in{0};
  LinkError error{};
};

struct LinkStats {
  std::uint64_t connect_attempts{0};
  std::uint64_t connect_failures{0};
  std::uint64_t drops{0};
  std::uint64_t stalls{0};
  std::uint64_t bytes_read{0};
  codec::FrameAssembler::Stats framing{};
};

using FrameHandler = std::function<void(model::Frame&&)>;
using StateObserver = std::function<void(const StateChange&)>;

// Owns the byte source. Frames go to the handler on the supervisor thread, in
// arrival order.
class LinkSupervisor {
 public:
  LinkSupervisor(std::unique_ptr<ByteSource> source, const schema::SchemaStore& schemas, SupervisorOptions options,
                 FrameHandler on_frame);
  ~LinkSupervisor();

  LinkSupervisor(const LinkSupervisor&) = delete;
  LinkSupervisor& operator=(const LinkSupervisor&) = delete;

  void on_state(StateObserver observer);

  // One state machine transition. Returns how long to wait before the next
  // step.
  std::chrono::milliseconds step();

  void start();
  // Idempotent. Cancels pending connect, read and backoff waits and releases
  // the source.
  void stop();

  [[nodiscard]] link_state state() const noexcept { return state_.load(); }
  [[nodiscard]] LinkStats stats() const;

 private:
  void run();
  std::chrono::milliseconds attempt_open(link_state failure_state);
  std::chrono::milliseconds stream();
  void drop(const LinkError& error);
  void transition(link_state next, std::chrono::milliseconds retry_in = std::chrono::milliseconds(0),
                  const LinkError& error = {});
  void rebuild_framer_if_needed();
  void record_framing_stats();

  std::unique_ptr<ByteSource> source_;
  const schema::SchemaStore& schemas_;
  SupervisorOptions options_;
  FrameHandler on_frame_;
  StateObserver observer_{};

  Backoff backoff_;
  std::unique_ptr<codec::FrameAssembler> framer_{};
  std::uint8_t framer_start_byte_{0};
  std::size_t framer_max_payload_{0};
  codec::FrameAssembler::Stats retired_framing_{};
  std::chrono::milliseconds stalled_for_{0};
  std::array<std::uint8_t, 4096> read_buffer_{};
  LinkErrorKind last_logged_failure_{LinkErrorKind::NONE};

  std::atomic<link_state> state_{link_state::IDLE};
  std::atomic<bool> cancel_{false};
  std::atomic<bool> stopped_{false};
  std::mutex wait_mutex_;
  std::condition_variable wake_;
  std::thread thread_{};

  mutable std::mutex stats_mutex_;
  LinkStats stats_{};
};

}  // namespace telemetry_hub::link

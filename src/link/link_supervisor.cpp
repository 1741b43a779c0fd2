#include "link/link_supervisor.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace telemetry_hub::link {
namespace {

codec::FrameAssembler::Stats sum(const codec::FrameAssembler::Stats& a, const codec::FrameAssembler::Stats& b) {
  codec::FrameAssembler::Stats out{};
  out.frames = a.frames + b.frames;
  out.discarded_bytes = a.discarded_bytes + b.discarded_bytes;
  out.crc_failures = a.crc_failures + b.crc_failures;
  out.oversize_lengths = a.oversize_lengths + b.oversize_lengths;
  return out;
}

// Closes the source when the supervisor thread exits, however it exits.
class SourceGuard {
 public:
  explicit SourceGuard(ByteSource& source) : source_(source) {}
  ~SourceGuard() { source_.close(); }

  SourceGuard(const SourceGuard&) = delete;
  SourceGuard& operator=(const SourceGuard&) = delete;

 private:
  ByteSource& source_;
};

}  // namespace

const char* to_string(const link_state state) noexcept {
  switch (state) {
    case link_state::IDLE:
      return "idle";
    case link_state::CONNECTING:
      return "connecting";
    case link_state::STREAMING:
      return "streaming";
    case link_state::RECONNECTING:
      return "reconnecting";
    case link_state::STOPPED:
      return "stopped";
  }
  return "unknown";
}

LinkSupervisor::LinkSupervisor(std::unique_ptr<ByteSource> source, const schema::SchemaStore& schemas,
                               SupervisorOptions options, FrameHandler on_frame)
    : source_(std::move(source)),
      schemas_(schemas),
      options_(options),
      on_frame_(std::move(on_frame)),
      backoff_(options.backoff_initial, options.backoff_max) {
  if (source_ == nullptr) {
    throw std::invalid_argument("link supervisor requires a byte source");
  }
  if (options_.read_timeout <= std::chrono::milliseconds(0)) {
    options_.read_timeout = std::chrono::milliseconds(1);
  }
}

LinkSupervisor::~LinkSupervisor() { stop(); }

void LinkSupervisor::on_state(StateObserver observer) { observer_ = std::move(observer); }

std::chrono::milliseconds LinkSupervisor::step() {
  switch (state_.load()) {
    case link_state::IDLE:
      transition(link_state::CONNECTING);
      return std::chrono::milliseconds(0);
    case link_state::CONNECTING:
      return attempt_open(link_state::CONNECTING);
    case link_state::RECONNECTING:
      return attempt_open(link_state::RECONNECTING);
    case link_state::STREAMING:
      return stream();
    case link_state::STOPPED:
      break;
  }
  return std::chrono::milliseconds(0);
}

void LinkSupervisor::start() {
  if (stopped_.load() || thread_.joinable()) {
    return;
  }
  thread_ = std::thread([this] { run(); });
}

void LinkSupervisor::stop() {
  if (stopped_.exchange(true)) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    cancel_.store(true);
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }

  source_->close();
  if (framer_ != nullptr) {
    framer_->reset();
  }
  transition(link_state::STOPPED);
  std::cerr << "[link] stopped, released " << source_->describe() << '\n';
}

LinkStats LinkSupervisor::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void LinkSupervisor::run() {
  SourceGuard guard(*source_);
  while (!cancel_.load()) {
    const auto delay = step();
    if (delay > std::chrono::milliseconds(0)) {
      std::unique_lock<std::mutex> lock(wait_mutex_);
      wake_.wait_for(lock, delay, [this] { return cancel_.load(); });
    }
  }
}

std::chrono::milliseconds LinkSupervisor::attempt_open(const link_state failure_state) {
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.connect_attempts;
  }

  LinkError error{};
  if (source_->open(cancel_, error)) {
    backoff_.reset();
    stalled_for_ = std::chrono::milliseconds(0);
    rebuild_framer_if_needed();
    framer_->reset();
    last_logged_failure_ = LinkErrorKind::NONE;
    std::cerr << "[link] streaming from " << source_->describe() << '\n';
    transition(link_state::STREAMING);
    return std::chrono::milliseconds(0);
  }

  if (error.kind == LinkErrorKind::CANCELLED || cancel_.load()) {
    return std::chrono::milliseconds(0);
  }

  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.connect_failures;
  }

  const auto delay = backoff_.next();
  if (error.kind != last_logged_failure_) {
    std::cerr << "[link] open " << source_->describe() << " failed (" << to_string(error.kind) << "): " << error.detail
              << "; retrying with backoff up to " << backoff_.ceiling().count() << " ms\n";
    last_logged_failure_ = error.kind;
  }
  transition(failure_state, delay, error);
  return delay;
}

std::chrono::milliseconds LinkSupervisor::stream() {
  rebuild_framer_if_needed();

  const ReadResult result = source_->read(read_buffer_.data(), read_buffer_.size(), options_.read_timeout);
  switch (result.status) {
    case ReadStatus::DATA: {
      stalled_for_ = std::chrono::milliseconds(0);
      framer_->push(read_buffer_.data(), result.bytes);
      {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.bytes_read += result.bytes;
      }
      while (auto frame = framer_->next()) {
        on_frame_(std::move(*frame));
      }
      record_framing_stats();
      break;
    }
    case ReadStatus::TIMEOUT:
      stalled_for_ += options_.read_timeout;
      if (stalled_for_ >= options_.stall_timeout) {
        {
          std::lock_guard<std::mutex> lock(stats_mutex_);
          ++stats_.stalls;
        }
        drop(LinkError{LinkErrorKind::TIMEOUT, "no data for " + std::to_string(stalled_for_.count()) + " ms"});
      }
      break;
    case ReadStatus::CLOSED:
    case ReadStatus::ERROR:
      drop(result.error);
      break;
  }
  return std::chrono::milliseconds(0);
}

void LinkSupervisor::drop(const LinkError& error) {
  source_->close();
  // A partially buffered frame is never completed with bytes from the next
  // connection.
  framer_->reset();
  record_framing_stats();
  stalled_for_ = std::chrono::milliseconds(0);
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.drops;
  }

  std::cerr << "[link] lost " << source_->describe() << " (" << to_string(error.kind) << "): " << error.detail << '\n';
  transition(link_state::RECONNECTING, std::chrono::milliseconds(0), error);
}

void LinkSupervisor::transition(const link_state next, const std::chrono::milliseconds retry_in,
                                const LinkError& error) {
  state_.store(next);
  if (observer_) {
    observer_(StateChange{next, retry_in, error});
  }
}

void LinkSupervisor::rebuild_framer_if_needed() {
  const auto schema = schemas_.current();
  if (framer_ != nullptr && schema->start_byte() == framer_start_byte_ &&
      schema->max_payload() == framer_max_payload_) {
    return;
  }

  if (framer_ != nullptr) {
    retired_framing_ = sum(retired_framing_, framer_->stats());
    std::cerr << "[link] framing changed, start byte " << static_cast<unsigned>(schema->start_byte())
              << " max payload " << schema->max_payload() << '\n';
  }
  framer_start_byte_ = schema->start_byte();
  framer_max_payload_ = schema->max_payload();
  framer_ = std::make_unique<codec::FrameAssembler>(framer_start_byte_, framer_max_payload_);
}

void LinkSupervisor::record_framing_stats() {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_.framing = sum(retired_framing_, framer_->stats());
}

}  // namespace telemetry_hub::link

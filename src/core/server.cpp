#include "core/server.hpp"

#include <iostream>
#include <utility>

#include "link/emulated_source.hpp"
#include "link/serial_source.hpp"
#include "link/tcp_source.hpp"
#include "sinks/redis_pubsub.hpp"
#include "sinks/stdout_debug.hpp"

namespace telemetry_hub::core {

std::unique_ptr<link::ByteSource> make_byte_source(const HubConfig& config, const schema::SchemaStore& schemas) {
  switch (config.link.mode) {
    case LinkMode::TCP: {
      link::TcpOptions options{};
      options.host = config.link.host;
      options.port = config.link.port;
      options.listen = config.link.listen;
      options.connect_timeout = config.link.connect_timeout;
      return std::make_unique<link::TcpByteSource>(options);
    }
    case LinkMode::SERIAL: {
      link::SerialOptions options{};
      options.device = config.link.device;
      options.baud = config.link.baud;
      return std::make_unique<link::SerialByteSource>(options);
    }
    case LinkMode::EMULATED:
      break;
  }

  link::EmulatedOptions options{};
  options.tick_interval = config.emulation.tick_interval;
  options.seed = config.emulation.seed;
  return std::make_unique<link::EmulatedByteSource>(schemas, options);
}

Server::Server(HubConfig config)
    : config_(std::move(config)),
      schemas_(schema::load_schema_file(config_.schema_path)),
      hub_(hub::HubOptions{config_.hub.queue_capacity, config_.hub.max_full_publishes}),
      pipeline_(schemas_, hub_),
      frames_seen_(config_.stats_every_frames) {
  const auto schema = schemas_.current();
  std::cerr << "[schema] loaded version " << schema->version() << " from " << config_.schema_path << " ("
            << schema->enabled_count() << " of " << schema->all().size() << " sensors enabled in "
            << schema->pdus().size() << " pdu(s))\n";

  add_sinks();

  link::SupervisorOptions options{};
  options.read_timeout = config_.link.read_timeout;
  options.stall_timeout = config_.link.stall_timeout;
  options.backoff_initial = config_.link.backoff_initial;
  options.backoff_max = config_.link.backoff_max;
  supervisor_ = std::make_unique<link::LinkSupervisor>(make_byte_source(config_, schemas_), schemas_, options,
                                                       [this](model::Frame&& frame) { handle_frame(frame); });
}

Server::~Server() { shutdown(); }

void Server::add_sinks() {
  if (config_.stdout_debug) {
    workers_.push_back(std::make_unique<sinks::SinkWorker>(hub_, std::make_unique<sinks::StdoutDebugSink>(),
                                                           config_.hub.queue_capacity));
  }

  if (config_.redis.enabled) {
    sinks::RedisPubSubOptions options{};
    options.host = config_.redis.host;
    options.port = config_.redis.port;
    options.unix_socket = config_.redis.unix_socket;
    options.channel = config_.redis.channel;
    options.catalog_key = config_.redis.catalog_key;
    auto sink = std::make_unique<sinks::RedisPubSubSink>(options, &schemas_);

    if (sink->check_connectivity()) {
      std::cerr << "[server] redis connectivity confirmed for " << sink->name() << '\n';
    } else {
      std::cerr << "[server] redis connectivity check failed for " << sink->name() << "; will retry on publish\n";
    }
    workers_.push_back(std::make_unique<sinks::SinkWorker>(hub_, std::move(sink), config_.hub.queue_capacity));
  }
}

void Server::start() {
  if (started_) {
    return;
  }
  started_ = true;

  for (auto& worker : workers_) {
    worker->start();
  }
  supervisor_->start();
  std::cerr << "[server] started: link=" << to_string(config_.link.mode) << " sinks=" << workers_.size() << '\n';
}

void Server::run() {
  start();
  {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    stop_cv_.wait(lock, [this] { return stop_requested_; });
  }
  shutdown();
}

void Server::request_stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();
}

void Server::shutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;

  supervisor_->stop();
  hub_.close(config_.hub.drain_on_shutdown);
  for (auto& worker : workers_) {
    worker->join();
  }
  log_stats();
  std::cerr << "[server] shutdown complete\n";
}

bool Server::reload_schema() { return schemas_.reload(config_.schema_path); }

void Server::handle_frame(const model::Frame& frame) {
  pipeline_.on_frame(frame);
  frames_seen_.next();
  if (frames_seen_.due()) {
    log_stats();
  }
}

void Server::log_stats() const {
  const auto decoded = pipeline_.stats();
  const auto fanout = hub_.stats();
  const auto wire = supervisor_->stats();
  std::cerr << "[server] frames=" << decoded.frames_decoded << " dropped=" << decoded.frames_dropped
            << " invalid_readings=" << decoded.invalid_readings << " published=" << fanout.published
            << " evicted=" << fanout.evicted << " subscribers=" << fanout.subscribers << " link_drops=" << wire.drops
            << " resync_bytes=" << wire.framing.discarded_bytes << " crc_failures=" << wire.framing.crc_failures
            << '\n';
}

}  // namespace telemetry_hub::core

#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

#include "core/config.hpp"
#include "core/event_counter.hpp"
#include "core/pipeline.hpp"
#include "hub/distribution_hub.hpp"
#include "link/byte_source.hpp"
#include "link/link_supervisor.hpp"
#include "schema/schema_store.hpp"
#include "sinks/sink_worker.hpp"

namespace telemetry_hub::core {

std::unique_ptr<link::ByteSource> make_byte_source(const HubConfig& config, const schema::SchemaStore& schemas);

// Link -> decode -> hub -> sink workers. Throws from the constructor when the
// schema file cannot be loaded.
class Server {
 public:
  explicit Server(HubConfig config);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void start();
  // start(), then blocks until request_stop(), then shutdown().
  void run();
  void request_stop();
  // Stops the link first, then closes the hub (draining if configured) and
  // joins the sink workers. Idempotent.
  void shutdown();

  // Keeps the active schema when the file is invalid.
  bool reload_schema();

  [[nodiscard]] hub::DistributionHub& hub() noexcept { return hub_; }
  [[nodiscard]] const schema::SchemaStore& schemas() const noexcept { return schemas_; }
  [[nodiscard]] PipelineStats pipeline_stats() const noexcept { return pipeline_.stats(); }
  [[nodiscard]] link::link_state current_link_state() const noexcept { return supervisor_->state(); }

 private:
  void add_sinks();
  void handle_frame(const model::Frame& frame);
  void log_stats() const;

  HubConfig config_;
  schema::SchemaStore schemas_;
  hub::DistributionHub hub_;
  Pipeline pipeline_;
  EventCounter frames_seen_;
  std::vector<std::unique_ptr<sinks::SinkWorker>> workers_{};
  std::unique_ptr<link::LinkSupervisor> supervisor_{};

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stop_requested_{false};
  bool started_{false};
  bool shut_down_{false};
};

}  // namespace telemetry_hub::core

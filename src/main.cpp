#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "core/server.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;
volatile std::sig_atomic_t g_reload_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

void handle_reload_signal(int /*signal*/) {
  g_reload_requested = 1;
}

}  // namespace

std::string format_config_settings(const telemetry_hub::core::HubConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[server] loaded config from " << config_path
         << " | schema=" << config.schema_path
         << " | link_mode=" << telemetry_hub::core::to_string(config.link.mode);

  switch (config.link.mode) {
    case telemetry_hub::core::LinkMode::TCP:
      output << " | link_address=" << config.link.host << ':' << config.link.port
             << " | link_listen=" << (config.link.listen ? "true" : "false");
      break;
    case telemetry_hub::core::LinkMode::SERIAL:
      output << " | link_device=" << config.link.device << '@' << config.link.baud;
      break;
    case telemetry_hub::core::LinkMode::EMULATED:
      output << " | tick_interval_ms=" << config.emulation.tick_interval.count()
             << " | seed=" << config.emulation.seed;
      break;
  }

  output << " | queue_capacity=" << config.hub.queue_capacity
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false");
  if (config.redis.enabled) {
    output << " | redis_address=";
    if (!config.redis.unix_socket.empty()) {
      output << "unix://" << config.redis.unix_socket;
    } else {
      output << config.redis.host << ':' << config.redis.port;
    }
    output << " | redis_channel=" << config.redis.channel;
  }
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);
  std::signal(SIGHUP, handle_reload_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/hub.yaml";

  telemetry_hub::core::HubConfig config{};
  try {
    config = telemetry_hub::core::load_hub_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  std::unique_ptr<telemetry_hub::core::Server> server;
  try {
    server = std::make_unique<telemetry_hub::core::Server>(config);
  } catch (const std::exception& ex) {
    std::cerr << "schema error: " << ex.what() << '\n';
    return 1;
  }

  // Signal flags are polled here; the main thread blocks in run().
  std::atomic<bool> serving{true};
  std::thread watcher([&server, &serving] {
    while (serving.load() && g_shutdown_requested == 0) {
      if (g_reload_requested != 0) {
        g_reload_requested = 0;
        const bool reloaded = server->reload_schema();
        std::cerr << "[server] reload signal handled, schema " << (reloaded ? "replaced" : "unchanged") << '\n';
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (g_shutdown_requested != 0) {
      std::cerr << "[server] shutdown signal received; exiting cleanly\n";
    }
    server->request_stop();
  });

  int exit_code = 0;
  try {
    server->run();
  } catch (const std::exception& ex) {
    std::cerr << "[server] run failed: " << ex.what() << '\n';
    exit_code = 1;
  }
  serving = false;
  watcher.join();

  return exit_code;
}

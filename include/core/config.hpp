#pragma once

#include <chrono>
#include <cstdint>
#include <istream>
#include <string>

namespace telemetry_hub::core {

enum class LinkMode : std::uint8_t { EMULATED, TCP, SERIAL };

const char* to_string(LinkMode mode) noexcept;

struct LinkConfig {
  LinkMode mode{LinkMode::EMULATED};
  std::string host{"127.0.0.1"};
  std::uint16_t port{19900};
  // tcp mode: wait for the vehicle to connect instead of dialing out.
  bool listen{false};
  std::string device{"/dev/ttyUSB0"};
  std::uint32_t baud{115200};
  std::chrono::milliseconds connect_timeout{1000};
  std::chrono::milliseconds read_timeout{100};
  std::chrono::milliseconds stall_timeout{3000};
  std::chrono::milliseconds backoff_initial{100};
  std::chrono::milliseconds backoff_max{5000};
};

struct EmulationConfig {
  std::chrono::milliseconds tick_interval{100};
  std::uint64_t seed{1};
};

struct QueueConfig {
  std::size_t queue_capacity{64};
  std::uint32_t max_full_publishes{32};
  bool drain_on_shutdown{true};
};

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string channel{"telemetry:batches"};
  std::string catalog_key{"telemetry:catalog"};
  bool enabled{false};
};

struct HubConfig {
  std::string schema_path{"configs/sensors.json"};
  LinkConfig link{};
  EmulationConfig emulation{};
  QueueConfig hub{};
  RedisConfig redis{};
  bool stdout_debug{true};
  std::uint64_t stats_every_frames{100};
};

// Two-space indented "key: value" sections. Throws std::runtime_error naming
// the offending key.
HubConfig load_hub_config(const std::string& path);
HubConfig parse_hub_config(std::istream& input);

}  // namespace telemetry_hub::core

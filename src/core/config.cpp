#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "link/serial_source.hpp"

namespace telemetry_hub::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string lowercase(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& key, const std::string& value) {
  const std::string lower = lowercase(value);
  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
    return false;
  }
  throw std::runtime_error(key + " must be a boolean, got '" + value + "'");
}

long long parse_integer(const std::string& key, const std::string& value, const long long min, const long long max) {
  long long parsed = 0;
  std::size_t consumed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  if (parsed < min || parsed > max) {
    throw std::runtime_error(key + " must be in range " + std::to_string(min) + ".." + std::to_string(max));
  }
  return parsed;
}

std::chrono::milliseconds parse_millis(const std::string& key, const std::string& value) {
  return std::chrono::milliseconds(parse_integer(key, value, 1, 3'600'000));
}

std::uint16_t parse_port(const std::string& key, const std::string& value) {
  return static_cast<std::uint16_t>(parse_integer(key, value, 1, 65535));
}

void parse_host_port(const std::string& key, const std::string& value, std::string& host, std::uint16_t& port) {
  const auto split = value.rfind(':');
  if (split == std::string::npos) {
    host = value;
    return;
  }
  host = value.substr(0, split);
  port = parse_port(key + " port", value.substr(split + 1));
}

void apply_key_value(HubConfig& config, const std::string& key, const std::string& value) {
  if (key == "schema.path") {
    config.schema_path = value;
    return;
  }

  if (key == "link.mode") {
    const std::string mode = lowercase(value);
    if (mode == "emulated") {
      config.link.mode = LinkMode::EMULATED;
    } else if (mode == "tcp") {
      config.link.mode = LinkMode::TCP;
    } else if (mode == "serial") {
      config.link.mode = LinkMode::SERIAL;
    } else {
      throw std::runtime_error("link.mode must be one of emulated, tcp, serial");
    }
    return;
  }

  if (key == "link.address") {
    parse_host_port(key, value, config.link.host, config.link.port);
    if (config.link.host.empty()) {
      throw std::runtime_error("link.address host must not be empty");
    }
    return;
  }

  if (key == "link.listen") {
    config.link.listen = parse_bool(key, value);
    return;
  }

  if (key == "link.device") {
    config.link.device = value;
    return;
  }

  if (key == "link.baud") {
    const auto baud = static_cast<std::uint32_t>(parse_integer(key, value, 1, 4'000'000));
    if (!link::supported_baud(baud)) {
      throw std::runtime_error("link.baud " + value + " is not a supported serial rate");
    }
    config.link.baud = baud;
    return;
  }

  if (key == "link.connect_timeout_ms") {
    config.link.connect_timeout = parse_millis(key, value);
    return;
  }

  if (key == "link.read_timeout_ms") {
    config.link.read_timeout = parse_millis(key, value);
    return;
  }

  if (key == "link.stall_timeout_ms") {
    config.link.stall_timeout = parse_millis(key, value);
    return;
  }

  if (key == "link.backoff_initial_ms") {
    config.link.backoff_initial = parse_millis(key, value);
    return;
  }

  if (key == "link.backoff_max_ms") {
    config.link.backoff_max = parse_millis(key, value);
    return;
  }

  if (key == "emulation.tick_rate_hz") {
    const auto hz = parse_integer(key, value, 1, 1000);
    config.emulation.tick_interval = std::chrono::milliseconds(1000 / hz);
    return;
  }

  if (key == "emulation.seed") {
    config.emulation.seed = static_cast<std::uint64_t>(parse_integer(key, value, 0, 0x7FFFFFFFFFFFFFFFLL));
    return;
  }

  if (key == "hub.queue_capacity") {
    config.hub.queue_capacity = static_cast<std::size_t>(parse_integer(key, value, 1, 1'000'000));
    return;
  }

  if (key == "hub.max_full_publishes") {
    config.hub.max_full_publishes = static_cast<std::uint32_t>(parse_integer(key, value, 1, 1'000'000));
    return;
  }

  if (key == "hub.drain_on_shutdown") {
    config.hub.drain_on_shutdown = parse_bool(key, value);
    return;
  }

  if (key == "redis.address") {
    config.redis.enabled = !value.empty();
    if (value.rfind("unix://", 0) == 0) {
      config.redis.unix_socket = value.substr(std::string("unix://").size());
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    if (!value.empty() && value.front() == '/') {
      config.redis.unix_socket = value;
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    config.redis.unix_socket.clear();
    parse_host_port(key, value, config.redis.host, config.redis.port);
    return;
  }

  if (key == "redis.channel") {
    if (value.empty()) {
      throw std::runtime_error("redis.channel must not be empty");
    }
    config.redis.channel = value;
    return;
  }

  if (key == "redis.catalog_key") {
    config.redis.catalog_key = value;
    return;
  }

  if (key == "server.stdout_debug") {
    config.stdout_debug = parse_bool(key, value);
    return;
  }

  if (key == "server.stats_every_frames") {
    config.stats_every_frames = static_cast<std::uint64_t>(parse_integer(key, value, 0, 1'000'000'000));
  }
}

void validate(const HubConfig& config) {
  if (config.link.backoff_max < config.link.backoff_initial) {
    throw std::runtime_error("link.backoff_max_ms must be greater than or equal to link.backoff_initial_ms");
  }
  if (config.link.stall_timeout < config.link.read_timeout) {
    throw std::runtime_error("link.stall_timeout_ms must be greater than or equal to link.read_timeout_ms");
  }
  if (config.schema_path.empty()) {
    throw std::runtime_error("schema.path must not be empty");
  }
}

}  // namespace

const char* to_string(const LinkMode mode) noexcept {
  switch (mode) {
    case LinkMode::EMULATED:
      return "emulated";
    case LinkMode::TCP:
      return "tcp";
    case LinkMode::SERIAL:
      return "serial";
  }
  return "unknown";
}

HubConfig parse_hub_config(std::istream& input) {
  HubConfig config{};

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }
    if (depth > sections.size()) {
      throw std::runtime_error("config key '" + key + "' is indented " + std::to_string(indent_spaces) +
                               " spaces, deeper than its section allows");
    }

    if (value.empty()) {
      sections.push_back(key);
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate(config);
  return config;
}

HubConfig load_hub_config(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }
  return parse_hub_config(input);
}

}  // namespace telemetry_hub::core

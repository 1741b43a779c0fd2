#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "link/byte_source.hpp"
#include "link/posix_fd.hpp"

struct addrinfo;

namespace telemetry_hub::link {

struct TcpOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{19900};
  // Bind host:port and accept one client per open() instead of connecting.
  bool listen{false};
  // Also bounds how long a listening open() waits for a client.
  std::chrono::milliseconds connect_timeout{1000};
};

class TcpByteSource final : public ByteSource {
 public:
  explicit TcpByteSource(TcpOptions options);

  bool open(const std::atomic<bool>& cancel, LinkError& error) override;
  ReadResult read(std::uint8_t* buffer, std::size_t capacity, std::chrono::milliseconds timeout) override;
  void close() noexcept override;
  [[nodiscard]] std::string describe() const override;

  // Port the listening socket is bound to, 0 when not listening.
  [[nodiscard]] std::uint16_t bound_port() const noexcept { return bound_port_; }

 private:
  bool connect_one(const addrinfo& candidate, const std::atomic<bool>& cancel, LinkError& error);
  bool bind_listener(LinkError& error);
  bool accept_client(const std::atomic<bool>& cancel, LinkError& error);

  TcpOptions options_;
  UniqueFd socket_{};
  UniqueFd listener_{};
  std::uint16_t bound_port_{0};
};

}  // namespace telemetry_hub::link

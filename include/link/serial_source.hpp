#pragma once

#include <cstdint>
#include <string>

#include "link/byte_source.hpp"
#include "link/posix_fd.hpp"

namespace telemetry_hub::link {

struct SerialOptions {
  std::string device{"/dev/ttyUSB0"};
  std::uint32_t baud{115200};
};

// Radio modem on a tty, raw 8N1.
class SerialByteSource final : public ByteSource {
 public:
  explicit SerialByteSource(SerialOptions options);

  bool open(const std::atomic<bool>& cancel, LinkError& error) override;
  ReadResult read(std::uint8_t* buffer, std::size_t capacity, std::chrono::milliseconds timeout) override;
  void close() noexcept override;
  [[nodiscard]] std::string describe() const override;

 private:
  SerialOptions options_;
  UniqueFd port_{};
};

// True for baud rates termios can express.
bool supported_baud(std::uint32_t baud) noexcept;

}  // namespace telemetry_hub::link

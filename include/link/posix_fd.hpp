#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "link/byte_source.hpp"

namespace telemetry_hub::link {

class UniqueFd {
 public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : fd_(fd) {}
  ~UniqueFd();

  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept;
  UniqueFd& operator=(UniqueFd&& other) noexcept;

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
  void reset(int fd = -1) noexcept;

 private:
  int fd_{-1};
};

// poll() then read(). Zero bytes on a readable descriptor is reported as CLOSED.
ReadResult read_with_timeout(int fd, std::uint8_t* buffer, std::size_t capacity, std::chrono::milliseconds timeout);

}  // namespace telemetry_hub::link

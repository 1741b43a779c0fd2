#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace telemetry_hub::link {

enum class LinkErrorKind : std::uint8_t {
  NONE = 0,
  REFUSED = 1,
  DROPPED = 2,
  TIMEOUT = 3,
  CANCELLED = 4,
};

const char* to_string(LinkErrorKind kind) noexcept;

struct LinkError {
  LinkErrorKind kind{LinkErrorKind::NONE};
  std::string detail{};
};

enum class ReadStatus : std::uint8_t { DATA, TIMEOUT, CLOSED, ERROR };

struct ReadResult {
  ReadStatus status{ReadStatus::TIMEOUT};
  std::size_t bytes{0};
  LinkError error{};
};

// Raw byte stream from the vehicle link. Frame boundaries are not preserved.
class ByteSource {
 public:
  virtual ~ByteSource() = default;

  // Bounded by the implementation's connect timeout; returns early when
  // cancel becomes true.
  virtual bool open(const std::atomic<bool>& cancel, LinkError& error) = 0;
  virtual ReadResult read(std::uint8_t* buffer, std::size_t capacity, std::chrono::milliseconds timeout) = 0;
  virtual void close() noexcept = 0;
  [[nodiscard]] virtual std::string describe() const = 0;
};

}  // namespace telemetry_hub::link

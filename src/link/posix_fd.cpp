#include "link/posix_fd.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include <poll.h>
#include <unistd.h>

namespace telemetry_hub::link {

UniqueFd::~UniqueFd() { reset(); }

UniqueFd::UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

UniqueFd& UniqueFd::operator=(UniqueFd&& other) noexcept {
  if (this != &other) {
    reset(std::exchange(other.fd_, -1));
  }
  return *this;
}

void UniqueFd::reset(const int fd) noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = fd;
}

ReadResult read_with_timeout(const int fd, std::uint8_t* buffer, const std::size_t capacity,
                             const std::chrono::milliseconds timeout) {
  ReadResult result{};
  if (fd < 0) {
    result.status = ReadStatus::ERROR;
    result.error = LinkError{LinkErrorKind::DROPPED, "link not open"};
    return result;
  }

  pollfd descriptor{};
  descriptor.fd = fd;
  descriptor.events = POLLIN;

  const int ready = ::poll(&descriptor, 1, static_cast<int>(timeout.count()));
  if (ready == 0) {
    result.status = ReadStatus::TIMEOUT;
    return result;
  }
  if (ready < 0) {
    if (errno == EINTR) {
      result.status = ReadStatus::TIMEOUT;
      return result;
    }
    result.status = ReadStatus::ERROR;
    result.error = LinkError{LinkErrorKind::DROPPED, std::string("poll failed: ") + std::strerror(errno)};
    return result;
  }

  const ssize_t count = ::read(fd, buffer, capacity);
  if (count > 0) {
    result.status = ReadStatus::DATA;
    result.bytes = static_cast<std::size_t>(count);
    return result;
  }
  if (count == 0) {
    result.status = ReadStatus::CLOSED;
    result.error = LinkError{LinkErrorKind::DROPPED, "peer closed the link"};
    return result;
  }
  if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
    result.status = ReadStatus::TIMEOUT;
    return result;
  }

  result.status = ReadStatus::ERROR;
  result.error = LinkError{LinkErrorKind::DROPPED, std::string("read failed: ") + std::strerror(errno)};
  return result;
}

}  // namespace telemetry_hub::link

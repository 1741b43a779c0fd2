#include "link/serial_source.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include <fcntl.h>
#include <termios.h>

namespace telemetry_hub::link {
namespace {

speed_t to_speed(const std::uint32_t baud) noexcept {
  switch (baud) {
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 115200:
      return B115200;
    case 230400:
      return B230400;
    default:
      return B0;
  }
}

}  // namespace

bool supported_baud(const std::uint32_t baud) noexcept { return to_speed(baud) != B0; }

SerialByteSource::SerialByteSource(SerialOptions options) : options_(std::move(options)) {}

bool SerialByteSource::open(const std::atomic<bool>& cancel, LinkError& error) {
  close();
  if (cancel.load()) {
    error = LinkError{LinkErrorKind::CANCELLED, "open cancelled"};
    return false;
  }

  const speed_t speed = to_speed(options_.baud);
  if (speed == B0) {
    error = LinkError{LinkErrorKind::REFUSED, "unsupported baud " + std::to_string(options_.baud)};
    return false;
  }

  UniqueFd fd(::open(options_.device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK));
  if (!fd.valid()) {
    error = LinkError{LinkErrorKind::REFUSED, options_.device + ": " + std::strerror(errno)};
    return false;
  }

  termios tty{};
  if (tcgetattr(fd.get(), &tty) != 0) {
    error = LinkError{LinkErrorKind::REFUSED, std::string("tcgetattr failed: ") + std::strerror(errno)};
    return false;
  }

  cfmakeraw(&tty);
  tty.c_cflag |= static_cast<tcflag_t>(CLOCAL | CREAD);
  tty.c_cflag &= static_cast<tcflag_t>(~CSTOPB);
  tty.c_cflag &= static_cast<tcflag_t>(~CRTSCTS);
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;

  if (cfsetispeed(&tty, speed) != 0 || cfsetospeed(&tty, speed) != 0 || tcsetattr(fd.get(), TCSANOW, &tty) != 0) {
    error = LinkError{LinkErrorKind::REFUSED, std::string("tcsetattr failed: ") + std::strerror(errno)};
    return false;
  }
  if (tcflush(fd.get(), TCIFLUSH) != 0) {
    error = LinkError{LinkErrorKind::REFUSED, std::string("tcflush failed: ") + std::strerror(errno)};
    return false;
  }

  port_ = std::move(fd);
  return true;
}

ReadResult SerialByteSource::read(std::uint8_t* buffer, const std::size_t capacity,
                                  const std::chrono::milliseconds timeout) {
  return read_with_timeout(port_.get(), buffer, capacity, timeout);
}

void SerialByteSource::close() noexcept { port_.reset(); }

std::string SerialByteSource::describe() const {
  return "serial://" + options_.device + "@" + std::to_string(options_.baud);
}

}  // namespace telemetry_hub::link

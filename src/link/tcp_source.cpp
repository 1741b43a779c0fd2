#include "link/tcp_source.hpp"

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace telemetry_hub::link {
namespace {

constexpr int kConnectPollSliceMs = 50;

struct AddrInfoDeleter {
  void operator()(addrinfo* info) const {
    if (info != nullptr) {
      freeaddrinfo(info);
    }
  }
};

constexpr int kListenBacklog = 1;

bool set_nonblocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

std::uint16_t local_port(const int fd) {
  sockaddr_storage address{};
  socklen_t length = sizeof(address);
  if (getsockname(fd, reinterpret_cast<sockaddr*>(&address), &length) != 0) {
    return 0;
  }
  if (address.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<const sockaddr_in*>(&address)->sin_port);
  }
  if (address.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(&address)->sin6_port);
  }
  return 0;
}

}  // namespace

TcpByteSource::TcpByteSource(TcpOptions options) : options_(std::move(options)) {}

bool TcpByteSource::open(const std::atomic<bool>& cancel, LinkError& error) {
  if (options_.listen) {
    socket_.reset();
    if (!listener_.valid() && !bind_listener(error)) {
      return false;
    }
    return accept_client(cancel, error);
  }

  close();

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* raw = nullptr;
  const std::string service = std::to_string(options_.port);
  const int rc = getaddrinfo(options_.host.c_str(), service.c_str(), &hints, &raw);
  std::unique_ptr<addrinfo, AddrInfoDeleter> results(raw);
  if (rc != 0) {
    error = LinkError{LinkErrorKind::REFUSED, std::string("resolve failed: ") + gai_strerror(rc)};
    return false;
  }

  for (const addrinfo* candidate = results.get(); candidate != nullptr; candidate = candidate->ai_next) {
    if (cancel.load()) {
      error = LinkError{LinkErrorKind::CANCELLED, "connect cancelled"};
      return false;
    }
    if (connect_one(*candidate, cancel, error)) {
      return true;
    }
    if (error.kind == LinkErrorKind::CANCELLED) {
      return false;
    }
  }
  return false;
}

bool TcpByteSource::connect_one(const addrinfo& candidate, const std::atomic<bool>& cancel, LinkError& error) {
  UniqueFd fd(::socket(candidate.ai_family, candidate.ai_socktype, candidate.ai_protocol));
  if (!fd.valid()) {
    error = LinkError{LinkErrorKind::REFUSED, std::string("socket failed: ") + std::strerror(errno)};
    return false;
  }
  if (!set_nonblocking(fd.get())) {
    error = LinkError{LinkErrorKind::REFUSED, std::string("fcntl failed: ") + std::strerror(errno)};
    return false;
  }

  if (::connect(fd.get(), candidate.ai_addr, candidate.ai_addrlen) == 0) {
    socket_ = std::move(fd);
    return true;
  }
  if (errno != EINPROGRESS) {
    error = LinkError{LinkErrorKind::REFUSED, std::string("connect failed: ") + std::strerror(errno)};
    return false;
  }

  auto remaining = options_.connect_timeout.count();
  while (remaining > 0) {
    if (cancel.load()) {
      error = LinkError{LinkErrorKind::CANCELLED, "connect cancelled"};
      return false;
    }

    pollfd descriptor{};
    descriptor.fd = fd.get();
    descriptor.events = POLLOUT;
    const int slice = static_cast<int>(remaining < kConnectPollSliceMs ? remaining : kConnectPollSliceMs);
    const int ready = ::poll(&descriptor, 1, slice);
    remaining -= slice;
    if (ready < 0 && errno != EINTR) {
      error = LinkError{LinkErrorKind::REFUSED, std::string("poll failed: ") + std::strerror(errno)};
      return false;
    }
    if (ready <= 0) {
      continue;
    }

    int socket_error = 0;
    socklen_t length = sizeof(socket_error);
    if (getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &socket_error, &length) != 0 || socket_error != 0) {
      error = LinkError{LinkErrorKind::REFUSED,
                        std::string("connect failed: ") + std::strerror(socket_error != 0 ? socket_error : errno)};
      return false;
    }

    socket_ = std::move(fd);
    return true;
  }

  error = LinkError{LinkErrorKind::TIMEOUT, "connect timed out after " +
                                                std::to_string(options_.connect_timeout.count()) + " ms"};
  return false;
}

bool TcpByteSource::bind_listener(LinkError& error) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  addrinfo* raw = nullptr;
  const std::string service = std::to_string(options_.port);
  const char* host = options_.host.empty() ? nullptr : options_.host.c_str();
  const int rc = getaddrinfo(host, service.c_str(), &hints, &raw);
  std::unique_ptr<addrinfo, AddrInfoDeleter> results(raw);
  if (rc != 0) {
    error = LinkError{LinkErrorKind::REFUSED, std::string("resolve failed: ") + gai_strerror(rc)};
    return false;
  }

  error = LinkError{LinkErrorKind::REFUSED, "no address to listen on"};
  for (const addrinfo* candidate = results.get(); candidate != nullptr; candidate = candidate->ai_next) {
    UniqueFd fd(::socket(candidate->ai_family, candidate->ai_socktype, candidate->ai_protocol));
    if (!fd.valid()) {
      error = LinkError{LinkErrorKind::REFUSED, std::string("socket failed: ") + std::strerror(errno)};
      continue;
    }

    const int reuse = 1;
    if (setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0 ||
        ::bind(fd.get(), candidate->ai_addr, candidate->ai_addrlen) != 0 || ::listen(fd.get(), kListenBacklog) != 0 ||
        !set_nonblocking(fd.get())) {
      error = LinkError{LinkErrorKind::REFUSED, std::string("listen failed: ") + std::strerror(errno)};
      continue;
    }

    bound_port_ = local_port(fd.get());
    listener_ = std::move(fd);
    return true;
  }
  return false;
}

bool TcpByteSource::accept_client(const std::atomic<bool>& cancel, LinkError& error) {
  auto remaining = options_.connect_timeout.count();
  while (remaining > 0) {
    if (cancel.load()) {
      error = LinkError{LinkErrorKind::CANCELLED, "accept cancelled"};
      return false;
    }

    pollfd descriptor{};
    descriptor.fd = listener_.get();
    descriptor.events = POLLIN;
    const int slice = static_cast<int>(remaining < kConnectPollSliceMs ? remaining : kConnectPollSliceMs);
    const int ready = ::poll(&descriptor, 1, slice);
    remaining -= slice;
    if (ready < 0 && errno != EINTR) {
      error = LinkError{LinkErrorKind::REFUSED, std::string("poll failed: ") + std::strerror(errno)};
      return false;
    }
    if (ready <= 0) {
      continue;
    }

    UniqueFd client(::accept(listener_.get(), nullptr, nullptr));
    if (!client.valid()) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR || errno == ECONNABORTED) {
        continue;
      }
      error = LinkError{LinkErrorKind::REFUSED, std::string("accept failed: ") + std::strerror(errno)};
      return false;
    }

    socket_ = std::move(client);
    return true;
  }

  error = LinkError{LinkErrorKind::TIMEOUT, "no client connected within " +
                                                std::to_string(options_.connect_timeout.count()) + " ms"};
  return false;
}

ReadResult TcpByteSource::read(std::uint8_t* buffer, const std::size_t capacity,
                               const std::chrono::milliseconds timeout) {
  return read_with_timeout(socket_.get(), buffer, capacity, timeout);
}

void TcpByteSource::close() noexcept {
  socket_.reset();
  listener_.reset();
  bound_port_ = 0;
}

std::string TcpByteSource::describe() const {
  const char* scheme = options_.listen ? "tcp-listen://" : "tcp://";
  return scheme + options_.host + ":" + std::to_string(options_.port);
}

}  // namespace telemetry_hub::link

/**
 * @file TcpClient.cpp
 * @brief Implementation of blocking TCP client primitives.
 */

#include "src/network/inc/TcpClient.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <fmt/core.h>

namespace echobench {

namespace network {

namespace {

/* ----------------------------- Socket Helpers ----------------------------- */

/**
 * Set TCP_NODELAY so small fixed-size requests go out immediately.
 */
inline bool setTcpNoDelay(int fd) noexcept {
  const int FLAG = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &FLAG, sizeof(FLAG)) == 0;
}

/// Frees getaddrinfo results on scope exit.
struct AddrInfoGuard {
  addrinfo* list{nullptr};
  ~AddrInfoGuard() {
    if (list != nullptr) {
      ::freeaddrinfo(list);
    }
  }
};

} // namespace

/* ----------------------------- Endpoint ----------------------------- */

std::string Endpoint::toString() const {
  if (host.find(':') != std::string::npos) {
    return fmt::format("[{}]:{}", host, port);
  }
  return fmt::format("{}:{}", host, port);
}

bool parseEndpoint(std::string_view address, Endpoint& out, std::string& error) noexcept {
  std::string_view host;
  std::uint16_t port = 0;
  if (!helpers::strings::splitHostPort(address, host, port)) {
    error = fmt::format("invalid address '{}': expected host:port with port 1-65535", address);
    return false;
  }

  out.host.assign(host);
  out.port = port;
  return true;
}

/* ----------------------------- Connection ----------------------------- */

ConnectResult connectTcp(const Endpoint& endpoint) noexcept {
  ConnectResult result{};

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  const std::string PORT_STR = fmt::format("{}", endpoint.port);

  AddrInfoGuard addrs;
  const int GAI = ::getaddrinfo(endpoint.host.c_str(), PORT_STR.c_str(), &hints, &addrs.list);
  if (GAI != 0) {
    result.error = fmt::format("cannot resolve {}: {}", endpoint.toString(), ::gai_strerror(GAI));
    return result;
  }

  int lastErr = 0;
  for (addrinfo* ai = addrs.list; ai != nullptr; ai = ai->ai_next) {
    const int FD = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (FD < 0) {
      lastErr = errno;
      continue;
    }

    int rc = 0;
    do {
      rc = ::connect(FD, ai->ai_addr, ai->ai_addrlen);
    } while (rc < 0 && errno == EINTR);

    if (rc == 0) {
      setTcpNoDelay(FD);
      result.fd = FD;
      result.success = true;
      return result;
    }

    lastErr = errno;
    ::close(FD);
  }

  result.error =
      fmt::format("cannot connect to {}: {}", endpoint.toString(), std::strerror(lastErr));
  return result;
}

void closeSocket(int& fd) noexcept {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

/* ----------------------------- Transfer ----------------------------- */

std::string IoResult::describe() const {
  switch (status) {
  case IoStatus::OK:
    return fmt::format("ok ({} bytes)", bytes);
  case IoStatus::PEER_CLOSED:
    return fmt::format("connection closed by peer after {} bytes", bytes);
  case IoStatus::ERROR:
    return std::strerror(err);
  }
  return "unknown";
}

IoResult sendAll(int fd, const char* buf, std::size_t len) noexcept {
  IoResult result{};

  while (result.bytes < len) {
    const ssize_t N = ::send(fd, buf + result.bytes, len - result.bytes, MSG_NOSIGNAL);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      result.status = IoStatus::ERROR;
      result.err = errno;
      return result;
    }
    result.bytes += static_cast<std::size_t>(N);
  }

  return result;
}

IoResult recvExact(int fd, char* buf, std::size_t len) noexcept {
  IoResult result{};

  while (result.bytes < len) {
    const ssize_t N = ::recv(fd, buf + result.bytes, len - result.bytes, MSG_WAITALL);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      result.status = IoStatus::ERROR;
      result.err = errno;
      return result;
    }
    if (N == 0) {
      result.status = IoStatus::PEER_CLOSED;
      return result;
    }
    result.bytes += static_cast<std::size_t>(N);
  }

  return result;
}

} // namespace network

} // namespace echobench

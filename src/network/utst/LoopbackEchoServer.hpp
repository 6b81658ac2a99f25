#ifndef ECHOBENCH_NETWORK_UTST_LOOPBACK_ECHO_SERVER_HPP
#define ECHOBENCH_NETWORK_UTST_LOOPBACK_ECHO_SERVER_HPP
/**
 * @file LoopbackEchoServer.hpp
 * @brief In-process TCP echo server on 127.0.0.1 for unit tests.
 *
 * Binds an ephemeral port, accepts on a background thread and serves each
 * client on its own thread. Modes reproduce the server behaviours the
 * benchmark has to cope with.
 */

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <fmt/core.h>

namespace echobench {
namespace network {
namespace testing {

/// Server behaviour per accepted connection.
enum class ServerMode : std::uint8_t {
  ECHO = 0,            ///< Return every byte unchanged
  SILENT = 1,          ///< Read and discard, never reply; close after hold time
  CLOSE_ON_ACCEPT = 2, ///< Close immediately after accept
  SHORT_REPLY = 3,     ///< Reply with one byte less than received, then close
};

/**
 * @brief Port on 127.0.0.1 with nothing listening (best effort).
 */
inline std::uint16_t unusedLoopbackPort() {
  const int FD = ::socket(AF_INET, SOCK_STREAM, 0);
  if (FD < 0) {
    return 0;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  socklen_t len = sizeof(addr);
  std::uint16_t port = 0;
  if (::bind(FD, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
      ::getsockname(FD, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
    port = ntohs(addr.sin_port);
  }
  ::close(FD);
  return port;
}

class LoopbackEchoServer {
public:
  explicit LoopbackEchoServer(ServerMode mode = ServerMode::ECHO,
                              std::chrono::milliseconds silentHold = std::chrono::milliseconds(1500))
      : mode_(mode), silentHold_(silentHold) {
    listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listenFd_ < 0) {
      return;
    }

    const int FLAG = 1;
    ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &FLAG, sizeof(FLAG));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);

    if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(listenFd_, 128) < 0 ||
        ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
      ::close(listenFd_);
      listenFd_ = -1;
      return;
    }

    port_ = ntohs(addr.sin_port);
    acceptThread_ = std::thread([this]() { acceptLoop(); });
  }

  ~LoopbackEchoServer() { stop(); }

  LoopbackEchoServer(const LoopbackEchoServer&) = delete;
  LoopbackEchoServer& operator=(const LoopbackEchoServer&) = delete;

  [[nodiscard]] bool ok() const noexcept { return listenFd_ >= 0; }
  [[nodiscard]] std::uint16_t port() const noexcept { return port_; }
  [[nodiscard]] std::string address() const { return fmt::format("127.0.0.1:{}", port_); }
  [[nodiscard]] std::size_t accepted() const noexcept { return accepted_.load(); }

  /// Stop accepting, unblock and join every client thread.
  void stop() {
    if (!running_.exchange(false)) {
      return;
    }
    if (listenFd_ >= 0) {
      ::shutdown(listenFd_, SHUT_RDWR);
    }
    if (acceptThread_.joinable()) {
      acceptThread_.join();
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const int FD : clientFds_) {
        ::shutdown(FD, SHUT_RDWR);
      }
    }
    for (std::thread& t : clientThreads_) {
      if (t.joinable()) {
        t.join();
      }
    }
    for (const int FD : clientFds_) {
      ::close(FD);
    }
    if (listenFd_ >= 0) {
      ::close(listenFd_);
    }
  }

private:
  void acceptLoop() {
    while (running_.load()) {
      const int CLIENT = ::accept(listenFd_, nullptr, nullptr);
      if (CLIENT < 0) {
        if (!running_.load()) {
          return;
        }
        continue;
      }
      ++accepted_;

      if (mode_ == ServerMode::CLOSE_ON_ACCEPT) {
        ::close(CLIENT);
        continue;
      }

      std::lock_guard<std::mutex> lock(mutex_);
      clientFds_.push_back(CLIENT);
      clientThreads_.emplace_back([this, CLIENT]() { serve(CLIENT); });
    }
  }

  void serve(int client) {
    char buf[65536];

    if (mode_ == ServerMode::SILENT) {
      const auto DEADLINE = std::chrono::steady_clock::now() + silentHold_;
      while (running_.load() && std::chrono::steady_clock::now() < DEADLINE) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
      ::shutdown(client, SHUT_RDWR);
      return;
    }

    while (running_.load()) {
      const ssize_t N = ::recv(client, buf, sizeof(buf), 0);
      if (N <= 0) {
        break;
      }

      if (mode_ == ServerMode::SHORT_REPLY) {
        if (N > 1) {
          ::send(client, buf, static_cast<std::size_t>(N - 1), MSG_NOSIGNAL);
        }
        break;
      }

      ssize_t sent = 0;
      while (sent < N) {
        const ssize_t W = ::send(client, buf + sent, static_cast<std::size_t>(N - sent), MSG_NOSIGNAL);
        if (W <= 0) {
          return;
        }
        sent += W;
      }
    }
    ::shutdown(client, SHUT_RDWR);
  }

  ServerMode mode_;
  std::chrono::milliseconds silentHold_;
  int listenFd_{-1};
  std::uint16_t port_{0};
  std::atomic<bool> running_{true};
  std::atomic<std::size_t> accepted_{0};
  std::thread acceptThread_;
  std::mutex mutex_;
  std::vector<int> clientFds_;
  std::vector<std::thread> clientThreads_;
};

} // namespace testing
} // namespace network
} // namespace echobench

#endif // ECHOBENCH_NETWORK_UTST_LOOPBACK_ECHO_SERVER_HPP

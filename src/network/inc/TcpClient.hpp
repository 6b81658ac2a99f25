#ifndef ECHOBENCH_NETWORK_TCP_CLIENT_HPP
#define ECHOBENCH_NETWORK_TCP_CLIENT_HPP
/**
 * @file TcpClient.hpp
 * @brief Blocking TCP client primitives for fixed-length request/reply traffic.
 * @note Linux-only. POSIX sockets.
 * @note Thread-safe: Functions are stateless; a given fd must be used by one
 *       thread at a time.
 *
 * Provides endpoint parsing and resolution, connection establishment and
 * "all or nothing" transfer helpers. No timeouts are applied: a peer that
 * stops responding blocks the caller until the connection fails or closes.
 *
 * @warning NOT RT-safe: Blocking socket I/O, DNS resolution.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace echobench {

namespace network {

/* ----------------------------- Endpoint ----------------------------- */

/**
 * @brief Target address split into host and port.
 */
struct Endpoint {
  std::string host{};      ///< Hostname or IP literal (no brackets)
  std::uint16_t port{0};   ///< TCP port (1-65535)

  /// @brief "host:port", bracketing IPv6 literals.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Parse "host:port" or "[v6-host]:port".
 * @param address Address text.
 * @param out     Receives the endpoint on success.
 * @param error   Set to a diagnostic on failure.
 * @return true on success.
 */
[[nodiscard]] bool parseEndpoint(std::string_view address, Endpoint& out,
                                 std::string& error) noexcept;

/* ----------------------------- Connection ----------------------------- */

/**
 * @brief Result of establishing a TCP connection.
 */
struct ConnectResult {
  int fd{-1};          ///< Connected socket (caller owns), -1 on failure
  bool success{false}; ///< True if fd is connected
  std::string error{}; ///< Diagnostic when success is false
};

/**
 * @brief Resolve and connect to an endpoint.
 * @param endpoint Target.
 * @return Connected socket or error.
 *
 * Every address getaddrinfo returns is tried in order; the error of the last
 * attempt is reported if none connects. The socket is created close-on-exec
 * with TCP_NODELAY set.
 */
[[nodiscard]] ConnectResult connectTcp(const Endpoint& endpoint) noexcept;

/**
 * @brief Close a socket and reset the descriptor to -1.
 */
void closeSocket(int& fd) noexcept;

/* ----------------------------- Transfer ----------------------------- */

/**
 * @brief Transfer outcome classification.
 */
enum class IoStatus : std::uint8_t {
  OK = 0,          ///< Full length transferred
  PEER_CLOSED = 1, ///< Orderly shutdown by the peer before completion
  ERROR = 2,       ///< Socket error (errno in IoResult::err)
};

/**
 * @brief Result of a full-length transfer.
 */
struct IoResult {
  IoStatus status{IoStatus::OK};
  int err{0};             ///< errno for IoStatus::ERROR
  std::size_t bytes{0};   ///< Bytes transferred before completion or failure

  [[nodiscard]] bool ok() const noexcept { return status == IoStatus::OK; }

  /// @brief Diagnostic text ("connection reset by peer", "peer closed after 3 bytes").
  [[nodiscard]] std::string describe() const;
};

/**
 * @brief Send exactly len bytes.
 * @return IoStatus::OK once every byte is written.
 * @note EINTR is retried; SIGPIPE is suppressed (MSG_NOSIGNAL).
 */
[[nodiscard]] IoResult sendAll(int fd, const char* buf, std::size_t len) noexcept;

/**
 * @brief Receive exactly len bytes.
 * @return IoStatus::OK once len bytes arrived; PEER_CLOSED if the stream ended
 *         first (a short reply is a failure, not a partial success).
 * @note EINTR is retried.
 */
[[nodiscard]] IoResult recvExact(int fd, char* buf, std::size_t len) noexcept;

} // namespace network

} // namespace echobench

#endif // ECHOBENCH_NETWORK_TCP_CLIENT_HPP

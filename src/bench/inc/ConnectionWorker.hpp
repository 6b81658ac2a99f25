#ifndef ECHOBENCH_BENCH_CONNECTION_WORKER_HPP
#define ECHOBENCH_BENCH_CONNECTION_WORKER_HPP
/**
 * @file ConnectionWorker.hpp
 * @brief One benchmark connection driving a write/read-to-completion loop.
 * @note Linux-only. Blocking TCP socket I/O.
 * @note Thread-safe: A worker instance is used by one thread at a time.
 *
 * A worker owns exactly one TCP connection. Each iteration writes a payload
 * of the configured length (zero bytes terminated by '\n') and blocks until
 * the same number of bytes is echoed back. The first write or read failure
 * ends the worker permanently; there is no reconnect.
 *
 * @warning NOT RT-safe: Socket I/O, allocates buffers.
 */

#include "src/bench/inc/StopSignal.hpp"
#include "src/network/inc/TcpClient.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace echobench {

namespace bench {

/* ----------------------------- WorkerOutcome ----------------------------- */

/**
 * @brief Final result of one worker.
 */
struct WorkerOutcome {
  std::uint32_t workerId{0};          ///< Worker identifier (diagnostics only)
  std::uint64_t requestsCompleted{0}; ///< Successful round trips
  bool failed{false};                 ///< True if the loop ended on an I/O error
  std::string error{};                ///< Failure description when failed

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Payload ----------------------------- */

/**
 * @brief Build the request payload.
 * @param length Payload length (>= 1).
 * @return length bytes: zeros followed by a final '\n'. Empty if length is 0.
 */
[[nodiscard]] std::vector<char> makePayload(std::size_t length);

/* ----------------------------- ConnectionWorker ----------------------------- */

/**
 * @brief Owns one connection and its request/reply loop.
 */
class ConnectionWorker {
public:
  ConnectionWorker(std::uint32_t id, network::Endpoint endpoint, std::size_t payloadLength);
  ~ConnectionWorker();

  ConnectionWorker(const ConnectionWorker&) = delete;
  ConnectionWorker& operator=(const ConnectionWorker&) = delete;
  ConnectionWorker(ConnectionWorker&& other) noexcept;
  ConnectionWorker& operator=(ConnectionWorker&& other) noexcept;

  /**
   * @brief Establish the worker's connection.
   * @param error Set to a diagnostic naming the worker on failure.
   * @return true if connected.
   *
   * Connection failure is a startup precondition failure; callers abort the
   * run instead of continuing without this worker.
   */
  [[nodiscard]] bool connect(std::string& error) noexcept;

  /**
   * @brief Run round trips until stop is set or an I/O error occurs.
   * @param stop Flag checked once before each round trip.
   * @return Outcome with the number of completed round trips.
   *
   * Failures are printed to stderr as they happen, tagged with the worker id.
   * The connection is closed when the loop ends.
   */
  [[nodiscard]] WorkerOutcome run(const StopSignal& stop) noexcept;

  [[nodiscard]] std::uint32_t id() const noexcept { return id_; }
  [[nodiscard]] bool connected() const noexcept { return fd_ >= 0; }

private:
  /// @brief Record a failure on the outcome and emit the diagnostic line.
  /// @note The failure is recorded even if the message cannot be built.
  void fail(WorkerOutcome& outcome, const char* op, const network::IoResult& io) const noexcept;

  std::uint32_t id_{0};
  network::Endpoint endpoint_{};
  std::size_t payloadLength_{0};
  int fd_{-1};
};

} // namespace bench

} // namespace echobench

#endif // ECHOBENCH_BENCH_CONNECTION_WORKER_HPP

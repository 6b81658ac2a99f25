#ifndef ECHOBENCH_BENCH_BENCH_CONFIG_HPP
#define ECHOBENCH_BENCH_BENCH_CONFIG_HPP
/**
 * @file BenchConfig.hpp
 * @brief Resolved configuration for one echo benchmark run.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace echobench {

namespace bench {

/* ----------------------------- Constants ----------------------------- */

/// Default target echo server.
inline constexpr std::string_view DEFAULT_ADDRESS = "127.0.0.1:12345";

/// Default payload length in bytes.
inline constexpr std::size_t DEFAULT_PAYLOAD_LENGTH = 512;

/// Default run duration in seconds.
inline constexpr std::uint64_t DEFAULT_DURATION_SEC = 60;

/// Default number of concurrent connections.
inline constexpr std::uint32_t DEFAULT_CONNECTION_COUNT = 50;

/// Largest accepted payload (16 MiB). Each worker holds two buffers of this size.
inline constexpr std::size_t MAX_PAYLOAD_LENGTH = 16 * 1024 * 1024;

/* ----------------------------- BenchConfig ----------------------------- */

/**
 * @brief Benchmark parameters.
 *
 * Built once from CLI input and read-only afterwards. Workers see only the
 * address and payload length.
 */
struct BenchConfig {
  std::string address{DEFAULT_ADDRESS};            ///< Target "host:port"
  std::size_t payloadLength{DEFAULT_PAYLOAD_LENGTH}; ///< Bytes per request (last is '\n')
  std::uint64_t durationSec{DEFAULT_DURATION_SEC};   ///< Timed interval
  std::uint32_t connectionCount{DEFAULT_CONNECTION_COUNT}; ///< Workers / sockets

  /**
   * @brief Check invariants.
   * @param error Set to the first violated constraint.
   * @return true if the configuration can be run.
   *
   * payloadLength must be 1..MAX_PAYLOAD_LENGTH, durationSec and
   * connectionCount must be non-zero, and address must be host:port.
   */
  [[nodiscard]] bool validate(std::string& error) const noexcept;

  /// @brief Validation without a diagnostic.
  [[nodiscard]] bool isValid() const noexcept;

  /// @brief One-line description.
  [[nodiscard]] std::string toString() const;
};

} // namespace bench

} // namespace echobench

#endif // ECHOBENCH_BENCH_BENCH_CONFIG_HPP

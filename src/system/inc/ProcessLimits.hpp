#ifndef ECHOBENCH_SYSTEM_PROCESS_LIMITS_HPP
#define ECHOBENCH_SYSTEM_PROCESS_LIMITS_HPP
/**
 * @file ProcessLimits.hpp
 * @brief Open-file-descriptor ceiling queries and adjustment (Linux).
 * @note Linux-only. Uses getrlimit(2)/setrlimit(2).
 * @note Thread-safe: Queries are stateless. Adjustment changes process-wide
 *       state and is meant to run once, before worker threads exist.
 *
 * Every benchmark connection holds one socket for the whole run, so the
 * RLIMIT_NOFILE soft limit must cover the connection count plus the standard
 * streams before any connection is opened.
 */

#include <cstddef> // std::size_t
#include <cstdint> // std::uint64_t
#include <string>  // std::string

namespace echobench {

namespace system {

/* ----------------------------- Constants ----------------------------- */

/// Value indicating unlimited resource limit.
inline constexpr std::uint64_t RLIMIT_UNLIMITED_VALUE = static_cast<std::uint64_t>(-1);

/// Descriptors kept free for stdin, stdout and stderr.
inline constexpr std::uint64_t RESERVED_FDS = 3;

/* ----------------------------- RlimitValue ----------------------------- */

/**
 * @brief Single resource limit value pair (soft/hard).
 */
struct RlimitValue {
  std::uint64_t soft{0}; ///< Current (soft) limit
  std::uint64_t hard{0}; ///< Maximum (hard) limit
  bool unlimited{false}; ///< True if soft limit is RLIM_INFINITY

  /// @brief Check if soft limit can be increased to target value.
  /// @param value Desired limit value.
  /// @return True if value <= hard limit.
  [[nodiscard]] bool canIncreaseTo(std::uint64_t value) const noexcept;

  /// @brief Check if limit allows at least the specified value.
  /// @param value Required minimum value.
  /// @return True if soft >= value or unlimited.
  [[nodiscard]] bool hasAtLeast(std::uint64_t value) const noexcept;
};

/* ----------------------------- FdCapacityResult ----------------------------- */

/**
 * @brief Outcome of ensuring enough descriptors for a connection count.
 */
struct FdCapacityResult {
  std::uint64_t required{0}; ///< Descriptors needed (connections + RESERVED_FDS)
  RlimitValue before{};      ///< RLIMIT_NOFILE prior to adjustment
  RlimitValue after{};       ///< RLIMIT_NOFILE after adjustment
  bool raised{false};        ///< True if the soft limit was changed
  bool success{false};       ///< True if the soft limit now covers `required`
  std::string error{};       ///< Diagnostic when success is false

  /// @brief Human-readable summary.
  /// @note NOT RT-safe: Allocates for string building.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- ResourceLimiter ----------------------------- */

/**
 * @brief Capability that makes room for a number of simultaneous connections.
 *
 * Injected into the benchmark driver so tests can substitute the process-wide
 * rlimit change.
 */
class ResourceLimiter {
public:
  virtual ~ResourceLimiter() = default;

  /**
   * @brief Ensure the process can hold `connections` open sockets.
   * @param connections Number of simultaneous connections planned.
   * @return Result with success=false and an error message when impossible.
   */
  [[nodiscard]] virtual FdCapacityResult ensureCapacity(std::uint64_t connections) noexcept = 0;
};

/**
 * @brief ResourceLimiter backed by RLIMIT_NOFILE.
 */
class RlimitResourceLimiter final : public ResourceLimiter {
public:
  [[nodiscard]] FdCapacityResult ensureCapacity(std::uint64_t connections) noexcept override;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Query a single resource limit.
 * @param resource RLIMIT_* constant (e.g., RLIMIT_NOFILE).
 * @return RlimitValue with soft/hard limits (zeroed if the query fails).
 * @note RT-safe: Single syscall.
 */
[[nodiscard]] RlimitValue getRlimit(int resource) noexcept;

/**
 * @brief Descriptors required to hold `connections` sockets.
 * @return connections + RESERVED_FDS, saturating at RLIMIT_UNLIMITED_VALUE.
 */
[[nodiscard]] std::uint64_t requiredFdCount(std::uint64_t connections) noexcept;

/**
 * @brief Raise the RLIMIT_NOFILE soft limit to cover `connections` sockets.
 * @param connections Number of simultaneous connections planned.
 * @return Adjustment result.
 * @note NOT RT-safe: Allocates for error messages.
 *
 * The soft limit is only ever raised, never lowered, and never beyond the
 * hard limit. A hard limit below the requirement is a failure whose message
 * names the hard limit.
 */
[[nodiscard]] FdCapacityResult ensureFdCapacity(std::uint64_t connections) noexcept;

/**
 * @brief Format limit count for display.
 * @param value Limit value.
 * @return "unlimited" or the decimal value.
 * @note NOT RT-safe: Allocates for string building.
 */
[[nodiscard]] std::string formatLimit(std::uint64_t value);

} // namespace system

} // namespace echobench

#endif // ECHOBENCH_SYSTEM_PROCESS_LIMITS_HPP

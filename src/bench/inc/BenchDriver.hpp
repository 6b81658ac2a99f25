#ifndef ECHOBENCH_BENCH_BENCH_DRIVER_HPP
#define ECHOBENCH_BENCH_BENCH_DRIVER_HPP
/**
 * @file BenchDriver.hpp
 * @brief Fan-out/fan-in orchestration of one timed echo benchmark run.
 * @note Linux-only.
 * @note Thread-safe: state() may be read from any thread; run() is called
 *       once from a single thread.
 *
 * Run sequence (IDLE -> RUNNING -> STOPPING -> DONE):
 *  1. Ensure descriptor capacity through the injected ResourceLimiter.
 *  2. Connect every worker. Any connect failure aborts the run.
 *  3. Spawn one thread per worker, all sharing one StopSignal.
 *  4. Sleep for the configured duration, then trigger the stop signal once.
 *  5. Join every worker and reduce the outcomes into one AggregateResult.
 *
 * Workers never touch shared aggregate state; each writes only its own
 * outcome slot, which the driver reads after the join.
 *
 * @warning NOT RT-safe: Spawns threads, socket I/O, allocates.
 */

#include "src/bench/inc/BenchConfig.hpp"
#include "src/bench/inc/ConnectionWorker.hpp"
#include "src/system/inc/ProcessLimits.hpp"

#include <atomic>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace echobench {

namespace bench {

/* ----------------------------- DriverState ----------------------------- */

/**
 * @brief Driver lifecycle.
 */
enum class DriverState : std::uint8_t {
  IDLE = 0,     ///< Constructed, not yet run
  RUNNING = 1,  ///< Workers spawned, timed interval in progress
  STOPPING = 2, ///< Stop signalled, joining workers
  DONE = 3,     ///< Finished (successfully or not)
};

/// @brief Convert state to string.
[[nodiscard]] const char* toString(DriverState state) noexcept;

/* ----------------------------- AggregateResult ----------------------------- */

/**
 * @brief Run-wide totals.
 */
struct AggregateResult {
  std::uint64_t totalRequests{0};  ///< Sum of completed round trips
  std::uint64_t totalErrors{0};    ///< Number of workers that failed
  double requestsPerSecond{0.0};   ///< totalRequests / configured duration
  double elapsedSec{0.0};          ///< Measured spawn-to-join wall time
  std::size_t workerCount{0};      ///< Outcomes reduced
  bool success{false};             ///< False if a fatal startup error aborted the run
  std::string error{};             ///< Fatal startup diagnostic

  /// @brief Human-readable summary.
  /// @note NOT RT-safe: Allocates for string building.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Fold worker outcomes into totals.
 * @param outcomes    Worker outcomes, any order.
 * @param durationSec Configured run duration used for the rate.
 * @return Aggregate with success=true (elapsedSec left at 0).
 *
 * The rate divides by the configured duration, not by measured time. A zero
 * duration yields a zero rate.
 */
[[nodiscard]] AggregateResult reduceOutcomes(std::span<const WorkerOutcome> outcomes,
                                             std::uint64_t durationSec) noexcept;

/* ----------------------------- BenchDriver ----------------------------- */

/**
 * @brief Runs one benchmark.
 */
class BenchDriver {
public:
  /**
   * @param config  Run parameters (copied).
   * @param limiter Descriptor capacity capability; must outlive run().
   */
  BenchDriver(BenchConfig config, system::ResourceLimiter& limiter);

  BenchDriver(const BenchDriver&) = delete;
  BenchDriver& operator=(const BenchDriver&) = delete;

  /**
   * @brief Execute the run. Blocks for at least the configured duration.
   * @return Aggregate on success; success=false with error on a fatal
   *         startup failure (invalid config, capacity, connect, spawn).
   *
   * A driver runs once; later calls return an error without side effects.
   */
  [[nodiscard]] AggregateResult run() noexcept;

  [[nodiscard]] DriverState state() const noexcept {
    return state_.load(std::memory_order_acquire);
  }

  /// @brief Per-worker outcomes of the completed run (empty before DONE).
  [[nodiscard]] const std::vector<WorkerOutcome>& outcomes() const noexcept { return outcomes_; }

  [[nodiscard]] const BenchConfig& config() const noexcept { return config_; }

private:
  /// @brief End a run that never started benchmarking.
  AggregateResult abort(std::string error) noexcept;

  BenchConfig config_;
  system::ResourceLimiter& limiter_;
  std::atomic<DriverState> state_{DriverState::IDLE};
  std::atomic<bool> started_{false};
  std::vector<WorkerOutcome> outcomes_{};
};

/**
 * @brief Convenience: run a benchmark with the process RLIMIT_NOFILE limiter.
 */
[[nodiscard]] AggregateResult runEchoBench(const BenchConfig& config) noexcept;

} // namespace bench

} // namespace echobench

#endif // ECHOBENCH_BENCH_BENCH_DRIVER_HPP

#ifndef ECHOBENCH_BENCH_STOP_SIGNAL_HPP
#define ECHOBENCH_BENCH_STOP_SIGNAL_HPP
/**
 * @file StopSignal.hpp
 * @brief One-shot broadcast stop flag shared by the driver and its workers.
 * @note Thread-safe: Lock-free atomic flag, any number of concurrent readers.
 *
 * The flag moves from false to true once and never resets. Workers poll it
 * once per round trip, so a worker blocked in I/O notices the stop only after
 * that transfer completes.
 */

#include <atomic>
#include <memory>

namespace echobench {

namespace bench {

/* ----------------------------- StopSignal ----------------------------- */

/**
 * @brief Shared stop flag. Owned jointly through std::shared_ptr.
 */
class StopSignal {
public:
  StopSignal() noexcept = default;
  StopSignal(const StopSignal&) = delete;
  StopSignal& operator=(const StopSignal&) = delete;

  /// @brief Current flag value. Non-blocking.
  [[nodiscard]] bool read() const noexcept { return stopped_.load(std::memory_order_relaxed); }

  /**
   * @brief Set the flag.
   * @return true if this call performed the false -> true transition.
   *
   * Repeated calls leave the flag set and return false.
   */
  bool trigger() noexcept { return !stopped_.exchange(true, std::memory_order_relaxed); }

private:
  std::atomic<bool> stopped_{false};
};

/* ----------------------------- StopHandle ----------------------------- */

/**
 * @brief Non-owning capability to trigger a StopSignal.
 *
 * Lets the holder signal the flag without keeping it alive. Triggering after
 * every owner has released the flag is a no-op.
 */
class StopHandle {
public:
  StopHandle() noexcept = default;
  explicit StopHandle(const std::shared_ptr<StopSignal>& signal) noexcept : signal_(signal) {}

  /**
   * @brief Trigger the flag if it still exists.
   * @return true if the flag was alive (whether or not it was already set).
   */
  bool trigger() const noexcept {
    if (const std::shared_ptr<StopSignal> SIGNAL = signal_.lock()) {
      SIGNAL->trigger();
      return true;
    }
    return false;
  }

  /// @brief True while at least one owner holds the flag.
  [[nodiscard]] bool alive() const noexcept { return !signal_.expired(); }

private:
  std::weak_ptr<StopSignal> signal_{};
};

} // namespace bench

} // namespace echobench

#endif // ECHOBENCH_BENCH_STOP_SIGNAL_HPP

/**
 * @file BenchDriver.cpp
 * @brief Implementation of the benchmark driver.
 */

#include "src/bench/inc/BenchDriver.hpp"

#include "src/bench/inc/StopSignal.hpp"
#include "src/network/inc/TcpClient.hpp"

#include <chrono>
#include <memory>
#include <new>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/core.h>

namespace echobench {

namespace bench {

namespace {

/// Join every joinable thread.
inline void joinAll(std::vector<std::thread>& threads) noexcept {
  for (std::thread& t : threads) {
    if (t.joinable()) {
      t.join();
    }
  }
}

} // namespace

/* ----------------------------- DriverState ----------------------------- */

const char* toString(DriverState state) noexcept {
  switch (state) {
  case DriverState::IDLE:
    return "idle";
  case DriverState::RUNNING:
    return "running";
  case DriverState::STOPPING:
    return "stopping";
  case DriverState::DONE:
    return "done";
  }
  return "unknown";
}

/* ----------------------------- AggregateResult Methods ----------------------------- */

std::string AggregateResult::toString() const {
  if (!success) {
    return fmt::format("Benchmark: FAILED ({})", error);
  }

  return fmt::format("Benchmark: {} requests, {} errors, {:.2f} req/s from {} workers "
                     "(elapsed {:.2f}s)",
                     totalRequests, totalErrors, requestsPerSecond, workerCount, elapsedSec);
}

AggregateResult reduceOutcomes(std::span<const WorkerOutcome> outcomes,
                               std::uint64_t durationSec) noexcept {
  AggregateResult result{};

  for (const WorkerOutcome& o : outcomes) {
    result.totalRequests += o.requestsCompleted;
    result.totalErrors += o.failed ? 1U : 0U;
  }

  result.workerCount = outcomes.size();
  if (durationSec > 0) {
    result.requestsPerSecond =
        static_cast<double>(result.totalRequests) / static_cast<double>(durationSec);
  }
  result.success = true;
  return result;
}

/* ----------------------------- BenchDriver ----------------------------- */

BenchDriver::BenchDriver(BenchConfig config, system::ResourceLimiter& limiter)
    : config_(std::move(config)), limiter_(limiter) {}

AggregateResult BenchDriver::abort(std::string error) noexcept {
  outcomes_.clear();
  state_.store(DriverState::DONE, std::memory_order_release);

  AggregateResult result{};
  result.error = std::move(error);
  return result;
}

AggregateResult BenchDriver::run() noexcept {
  if (started_.exchange(true)) {
    AggregateResult result{};
    result.error = "benchmark driver has already run";
    return result;
  }

  std::string error;
  if (!config_.validate(error)) {
    return abort(fmt::format("invalid configuration: {}", error));
  }

  const system::FdCapacityResult CAPACITY = limiter_.ensureCapacity(config_.connectionCount);
  if (!CAPACITY.success) {
    return abort(CAPACITY.error);
  }

  network::Endpoint endpoint;
  if (!network::parseEndpoint(config_.address, endpoint, error)) {
    return abort(error);
  }

  const std::size_t COUNT = config_.connectionCount;
  std::vector<ConnectionWorker> workers;
  std::vector<std::thread> threads;

  // Every connection is up before the clock starts
  try {
    workers.reserve(COUNT);
    threads.reserve(COUNT);
    outcomes_.assign(COUNT, WorkerOutcome{});

    for (std::size_t i = 0; i < COUNT; ++i) {
      workers.emplace_back(static_cast<std::uint32_t>(i), endpoint, config_.payloadLength);
      if (!workers.back().connect(error)) {
        return abort(error);
      }
    }
  } catch (const std::bad_alloc&) {
    return abort(fmt::format("cannot allocate state for {} workers", COUNT));
  }

  auto stop = std::make_shared<StopSignal>();
  const auto START = std::chrono::steady_clock::now();
  state_.store(DriverState::RUNNING, std::memory_order_release);

  std::string spawnError;
  try {
    for (std::size_t i = 0; i < COUNT; ++i) {
      threads.emplace_back([stop, &worker = workers[i], &slot = outcomes_[i]]() {
        slot = worker.run(*stop);
      });
    }
  } catch (const std::system_error& e) {
    spawnError = fmt::format("cannot spawn worker thread {}: {}", threads.size(), e.what());
  }

  // Workers own the flag from here; the driver keeps only the trigger
  const StopHandle HANDLE{stop};
  stop.reset();

  if (!spawnError.empty()) {
    HANDLE.trigger();
    joinAll(threads);
    return abort(std::move(spawnError));
  }

  std::this_thread::sleep_for(
      std::chrono::seconds(static_cast<std::chrono::seconds::rep>(config_.durationSec)));

  state_.store(DriverState::STOPPING, std::memory_order_release);
  HANDLE.trigger();
  joinAll(threads);

  const auto END = std::chrono::steady_clock::now();

  AggregateResult result = reduceOutcomes(outcomes_, config_.durationSec);
  result.elapsedSec = std::chrono::duration<double>(END - START).count();

  state_.store(DriverState::DONE, std::memory_order_release);
  return result;
}

AggregateResult runEchoBench(const BenchConfig& config) noexcept {
  system::RlimitResourceLimiter limiter;
  BenchDriver driver(config, limiter);
  return driver.run();
}

} // namespace bench

} // namespace echobench

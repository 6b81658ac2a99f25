#ifndef ECHOBENCH_BENCH_BENCH_REPORT_HPP
#define ECHOBENCH_BENCH_BENCH_REPORT_HPP
/**
 * @file BenchReport.hpp
 * @brief Plain-text summary of a completed benchmark run.
 */

#include "src/bench/inc/BenchConfig.hpp"
#include "src/bench/inc/BenchDriver.hpp"

#include <string>

namespace echobench {

namespace bench {

/**
 * @brief Render the run summary.
 * @param config Configuration the run used.
 * @param result Aggregate of the run.
 * @return Multi-line summary, newline-terminated.
 *
 * Layout:
 * @code
 * Benchmarking: 127.0.0.1:12345
 * 50 clients, running 512 bytes, 60 sec.
 *
 * Error: 0
 * Speed: 41234.50 request/sec
 * @endcode
 */
[[nodiscard]] std::string formatSummary(const BenchConfig& config, const AggregateResult& result);

/**
 * @brief Write the summary to stdout.
 */
void printSummary(const BenchConfig& config, const AggregateResult& result);

} // namespace bench

} // namespace echobench

#endif // ECHOBENCH_BENCH_BENCH_REPORT_HPP

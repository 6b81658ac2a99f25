/**
 * @file BenchReport.cpp
 * @brief Run summary formatting.
 */

#include "src/bench/inc/BenchReport.hpp"

#include <fmt/core.h>

namespace echobench {

namespace bench {

std::string formatSummary(const BenchConfig& config, const AggregateResult& result) {
  std::string out;
  out.reserve(192);

  out += fmt::format("Benchmarking: {}\n", config.address);
  out += fmt::format("{} clients, running {} bytes, {} sec.\n", config.connectionCount,
                     config.payloadLength, config.durationSec);
  out += "\n";
  out += fmt::format("Error: {}\n", result.totalErrors);
  out += fmt::format("Speed: {:.2f} request/sec\n", result.requestsPerSecond);

  return out;
}

void printSummary(const BenchConfig& config, const AggregateResult& result) {
  fmt::print("{}", formatSummary(config, result));
}

} // namespace bench

} // namespace echobench

/**
 * @file echo-bench.cpp
 * @brief Concurrent TCP echo load generator.
 *
 * Opens N persistent connections to an echo server, runs a fixed-length
 * write/read loop on each for a fixed duration and prints the aggregate
 * request rate and error count.
 *
 * Exit codes: 0=run completed, 1=invalid usage, 2=fatal startup failure
 */

#include "src/bench/inc/BenchCli.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

#ifndef ECHOBENCH_VERSION
#define ECHOBENCH_VERSION "0.0.0"
#endif

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  std::vector<std::string_view> argList;
  argList.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0U);
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  return echobench::bench::runCommandLine(argv[0], argList, ECHOBENCH_VERSION);
}

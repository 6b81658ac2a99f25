#ifndef ECHOBENCH_BENCH_BENCH_CLI_HPP
#define ECHOBENCH_BENCH_BENCH_CLI_HPP
/**
 * @file BenchCli.hpp
 * @brief Command-line front end for the echo benchmark.
 *
 * Maps argv tokens to a BenchConfig and a run outcome to a process exit code.
 * Nothing falls back to a default on bad input: unparsable or out-of-range
 * values are usage errors.
 *
 * Exit codes: 0=run completed (per-worker errors included), 1=invalid usage,
 * 2=fatal startup failure.
 */

#include "src/bench/inc/BenchConfig.hpp"
#include "src/helpers/inc/Args.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace echobench {

namespace bench {

/* ----------------------------- Constants ----------------------------- */

inline constexpr int EXIT_COMPLETED = 0; ///< Run completed, summary printed
inline constexpr int EXIT_USAGE = 1;     ///< Invalid command line
inline constexpr int EXIT_FATAL = 2;     ///< Startup failure, no summary

/// Tool description for --help.
inline constexpr std::string_view CLI_DESCRIPTION =
    "Echo benchmark: drive N concurrent connections against a TCP echo server\n"
    "and report requests/sec and errors.\n\n"
    "Exit codes: 0=run completed, 1=invalid usage, 2=fatal startup failure";

/// Argument keys.
enum CliArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_VERSION = 1,
  ARG_ADDRESS = 2,
  ARG_LENGTH = 3,
  ARG_DURATION = 4,
  ARG_NUMBER = 5,
};

/* ----------------------------- CliRequest ----------------------------- */

/**
 * @brief What the command line asks for.
 */
enum class CliAction : std::uint8_t {
  RUN = 0,         ///< Run the benchmark with config
  HELP = 1,        ///< Print usage and exit
  VERSION = 2,     ///< Print version and exit
  USAGE_ERROR = 3, ///< Reject the command line with error
};

/**
 * @brief Parsed command line.
 */
struct CliRequest {
  CliAction action{CliAction::RUN};
  BenchConfig config{}; ///< Defaults overlaid with the given flags (RUN only)
  std::string error{};  ///< Diagnostic for USAGE_ERROR
};

/* ----------------------------- API ----------------------------- */

/// @brief Flag table for echo-bench.
[[nodiscard]] helpers::args::ArgMap buildArgMap();

/**
 * @brief Turn argument tokens (argv without the program name) into a request.
 *
 * --help wins over --version, which wins over everything else. Otherwise the
 * numeric flags are parsed strictly and the resulting config is validated.
 */
[[nodiscard]] CliRequest parseCommandLine(std::span<const std::string_view> argList,
                                          const helpers::args::ArgMap& map);

/**
 * @brief Full tool behaviour: parse, run, print, map to an exit code.
 * @param progName Program name shown in usage text.
 * @param argList  Argument tokens without the program name.
 * @param version  Version string printed by --version.
 * @return EXIT_COMPLETED, EXIT_USAGE or EXIT_FATAL.
 *
 * Diagnostics go to stderr, usage text and the summary to stdout. Blocks for
 * the configured duration when running.
 */
[[nodiscard]] int runCommandLine(std::string_view progName,
                                 std::span<const std::string_view> argList,
                                 std::string_view version);

} // namespace bench

} // namespace echobench

#endif // ECHOBENCH_BENCH_BENCH_CLI_HPP

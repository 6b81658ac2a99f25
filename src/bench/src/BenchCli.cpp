/**
 * @file BenchCli.cpp
 * @brief echo-bench argument mapping and exit-code policy.
 */

#include "src/bench/inc/BenchCli.hpp"

#include "src/bench/inc/BenchDriver.hpp"
#include "src/bench/inc/BenchReport.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <string>
#include <utility>

#include <fmt/core.h>

namespace echobench {

namespace bench {

namespace args = helpers::args;

namespace {

/// Parse an unsigned flag value into target if the flag was given.
template <typename T>
bool applyUnsigned(const args::ParsedArgs& pargs, CliArgKey key, std::string_view flag,
                   T& target, std::string& error) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end()) {
    return true;
  }

  const std::string_view VALUE = IT->second[0];
  if (!helpers::strings::parseUnsigned(VALUE, target)) {
    error = fmt::format("invalid value '{}' for {}: expected an unsigned integer", VALUE, flag);
    return false;
  }
  return true;
}

CliRequest usageError(std::string error) {
  CliRequest req{};
  req.action = CliAction::USAGE_ERROR;
  req.error = std::move(error);
  return req;
}

} // namespace

/* ----------------------------- API ----------------------------- */

args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", "-h", 0, false, "Print this help."};
  map[ARG_VERSION] = {"--version", "-V", 0, false, "Print version and exit."};
  map[ARG_ADDRESS] = {"--address", "-a", 1, false,
                      "Target echo server address. Default: 127.0.0.1:12345", "<address>"};
  map[ARG_LENGTH] = {"--length", "-l", 1, false, "Test message length. Default: 512", "<length>"};
  map[ARG_DURATION] = {"--duration", "-t", 1, false, "Test duration in seconds. Default: 60",
                       "<duration>"};
  map[ARG_NUMBER] = {"--number", "-c", 1, false, "Test connection number. Default: 50",
                     "<number>"};
  return map;
}

CliRequest parseCommandLine(std::span<const std::string_view> argList, const args::ArgMap& map) {
  args::ParsedArgs pargs;
  std::string error;
  if (!args::parseArgs(argList, map, pargs, error)) {
    return usageError(std::move(error));
  }

  CliRequest req{};
  if (pargs.count(ARG_HELP) != 0) {
    req.action = CliAction::HELP;
    return req;
  }
  if (pargs.count(ARG_VERSION) != 0) {
    req.action = CliAction::VERSION;
    return req;
  }

  if (pargs.count(ARG_ADDRESS) != 0) {
    req.config.address = std::string(pargs[ARG_ADDRESS][0]);
  }

  if (!applyUnsigned(pargs, ARG_LENGTH, "--length", req.config.payloadLength, error) ||
      !applyUnsigned(pargs, ARG_DURATION, "--duration", req.config.durationSec, error) ||
      !applyUnsigned(pargs, ARG_NUMBER, "--number", req.config.connectionCount, error)) {
    return usageError(std::move(error));
  }

  if (!req.config.validate(error)) {
    return usageError(std::move(error));
  }

  return req;
}

int runCommandLine(std::string_view progName, std::span<const std::string_view> argList,
                   std::string_view version) {
  const args::ArgMap ARG_MAP = buildArgMap();
  const CliRequest REQ = parseCommandLine(argList, ARG_MAP);

  switch (REQ.action) {
  case CliAction::HELP:
    args::printUsage(progName, CLI_DESCRIPTION, ARG_MAP);
    return EXIT_COMPLETED;
  case CliAction::VERSION:
    fmt::print("echo-bench {}\n", version);
    return EXIT_COMPLETED;
  case CliAction::USAGE_ERROR:
    fmt::print(stderr, "Error: {}\n\n", REQ.error);
    args::printUsage(progName, CLI_DESCRIPTION, ARG_MAP);
    return EXIT_USAGE;
  case CliAction::RUN:
    break;
  }

  const AggregateResult RESULT = runEchoBench(REQ.config);
  if (!RESULT.success) {
    fmt::print(stderr, "Fatal: {}\n", RESULT.error);
    return EXIT_FATAL;
  }

  printSummary(REQ.config, RESULT);
  return EXIT_COMPLETED;
}

} // namespace bench

} // namespace echobench

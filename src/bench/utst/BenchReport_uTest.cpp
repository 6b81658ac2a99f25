/**
 * @file BenchReport_uTest.cpp
 * @brief Unit tests for echobench::bench::formatSummary.
 */

#include "src/bench/inc/BenchReport.hpp"

#include <gtest/gtest.h>

#include <string>

using echobench::bench::AggregateResult;
using echobench::bench::BenchConfig;
using echobench::bench::formatSummary;

/** @test Summary layout for a clean run. */
TEST(BenchReportTest, CleanRun) {
  BenchConfig cfg{};
  cfg.address = "127.0.0.1:12345";
  cfg.connectionCount = 50;
  cfg.payloadLength = 512;
  cfg.durationSec = 60;

  AggregateResult result{};
  result.success = true;
  result.totalRequests = 2474070;
  result.requestsPerSecond = 41234.5;

  EXPECT_EQ(formatSummary(cfg, result), "Benchmarking: 127.0.0.1:12345\n"
                                        "50 clients, running 512 bytes, 60 sec.\n"
                                        "\n"
                                        "Error: 0\n"
                                        "Speed: 41234.50 request/sec\n");
}

/** @test Error count and fractional rate are reported. */
TEST(BenchReportTest, WithErrors) {
  BenchConfig cfg{};
  cfg.address = "[::1]:7";
  cfg.connectionCount = 3;
  cfg.payloadLength = 1;
  cfg.durationSec = 3;

  AggregateResult result{};
  result.success = true;
  result.totalErrors = 2;
  result.requestsPerSecond = 1.0 / 3.0;

  const std::string OUT = formatSummary(cfg, result);
  EXPECT_NE(OUT.find("Benchmarking: [::1]:7\n"), std::string::npos);
  EXPECT_NE(OUT.find("3 clients, running 1 bytes, 3 sec.\n"), std::string::npos);
  EXPECT_NE(OUT.find("Error: 2\n"), std::string::npos);
  EXPECT_NE(OUT.find("Speed: 0.33 request/sec\n"), std::string::npos);
}

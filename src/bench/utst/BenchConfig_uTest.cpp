/**
 * @file BenchConfig_uTest.cpp
 * @brief Unit tests for echobench::bench::BenchConfig.
 */

#include "src/bench/inc/BenchConfig.hpp"

#include <gtest/gtest.h>

#include <string>

using echobench::bench::BenchConfig;
using echobench::bench::DEFAULT_ADDRESS;
using echobench::bench::DEFAULT_CONNECTION_COUNT;
using echobench::bench::DEFAULT_DURATION_SEC;
using echobench::bench::DEFAULT_PAYLOAD_LENGTH;
using echobench::bench::MAX_PAYLOAD_LENGTH;

/** @test Defaults match the documented CLI defaults and are valid. */
TEST(BenchConfigTest, Defaults) {
  const BenchConfig CFG{};

  EXPECT_EQ(CFG.address, DEFAULT_ADDRESS);
  EXPECT_EQ(CFG.address, "127.0.0.1:12345");
  EXPECT_EQ(CFG.payloadLength, DEFAULT_PAYLOAD_LENGTH);
  EXPECT_EQ(CFG.payloadLength, 512U);
  EXPECT_EQ(CFG.durationSec, DEFAULT_DURATION_SEC);
  EXPECT_EQ(CFG.durationSec, 60U);
  EXPECT_EQ(CFG.connectionCount, DEFAULT_CONNECTION_COUNT);
  EXPECT_EQ(CFG.connectionCount, 50U);
  EXPECT_TRUE(CFG.isValid());
}

/** @test A one-byte payload (just the newline) is valid. */
TEST(BenchConfigTest, SingleBytePayloadValid) {
  BenchConfig cfg{};
  cfg.payloadLength = 1;
  EXPECT_TRUE(cfg.isValid());
}

/** @test Zero-length payload is rejected. */
TEST(BenchConfigTest, ZeroPayloadRejected) {
  BenchConfig cfg{};
  cfg.payloadLength = 0;

  std::string error;
  EXPECT_FALSE(cfg.validate(error));
  EXPECT_NE(error.find("payload length"), std::string::npos);
}

/** @test Oversized payload is rejected. */
TEST(BenchConfigTest, OversizedPayloadRejected) {
  BenchConfig cfg{};
  cfg.payloadLength = MAX_PAYLOAD_LENGTH + 1;
  EXPECT_FALSE(cfg.isValid());

  cfg.payloadLength = MAX_PAYLOAD_LENGTH;
  EXPECT_TRUE(cfg.isValid());
}

/** @test Zero duration is rejected. */
TEST(BenchConfigTest, ZeroDurationRejected) {
  BenchConfig cfg{};
  cfg.durationSec = 0;

  std::string error;
  EXPECT_FALSE(cfg.validate(error));
  EXPECT_NE(error.find("duration"), std::string::npos);
}

/** @test Zero connections is rejected. */
TEST(BenchConfigTest, ZeroConnectionsRejected) {
  BenchConfig cfg{};
  cfg.connectionCount = 0;

  std::string error;
  EXPECT_FALSE(cfg.validate(error));
  EXPECT_NE(error.find("connection count"), std::string::npos);
}

/** @test Address must be host:port. */
TEST(BenchConfigTest, MalformedAddressRejected) {
  BenchConfig cfg{};
  cfg.address = "127.0.0.1";

  std::string error;
  EXPECT_FALSE(cfg.validate(error));
  EXPECT_NE(error.find("127.0.0.1"), std::string::npos);
}

/** @test toString names every field. */
TEST(BenchConfigTest, ToString) {
  BenchConfig cfg{};
  cfg.address = "10.0.0.1:7";
  cfg.connectionCount = 4;
  cfg.payloadLength = 64;
  cfg.durationSec = 3;

  const std::string OUTPUT = cfg.toString();
  EXPECT_NE(OUTPUT.find("10.0.0.1:7"), std::string::npos);
  EXPECT_NE(OUTPUT.find("4 clients"), std::string::npos);
  EXPECT_NE(OUTPUT.find("64 bytes"), std::string::npos);
  EXPECT_NE(OUTPUT.find("3 sec"), std::string::npos);
}

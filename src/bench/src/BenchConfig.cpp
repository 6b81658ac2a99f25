/**
 * @file BenchConfig.cpp
 * @brief BenchConfig validation.
 */

#include "src/bench/inc/BenchConfig.hpp"

#include "src/network/inc/TcpClient.hpp"

#include <fmt/core.h>

namespace echobench {

namespace bench {

bool BenchConfig::validate(std::string& error) const noexcept {
  if (payloadLength == 0) {
    error = "payload length must be at least 1 byte (the last byte is the newline terminator)";
    return false;
  }
  if (payloadLength > MAX_PAYLOAD_LENGTH) {
    error = fmt::format("payload length {} exceeds maximum {}", payloadLength, MAX_PAYLOAD_LENGTH);
    return false;
  }
  if (durationSec == 0) {
    error = "duration must be at least 1 second";
    return false;
  }
  if (connectionCount == 0) {
    error = "connection count must be at least 1";
    return false;
  }

  network::Endpoint endpoint;
  return network::parseEndpoint(address, endpoint, error);
}

bool BenchConfig::isValid() const noexcept {
  std::string ignored;
  return validate(ignored);
}

std::string BenchConfig::toString() const {
  return fmt::format("{} clients -> {}, {} bytes, {} sec", connectionCount, address,
                     payloadLength, durationSec);
}

} // namespace bench

} // namespace echobench

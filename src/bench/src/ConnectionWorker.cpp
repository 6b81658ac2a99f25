/**
 * @file ConnectionWorker.cpp
 * @brief Implementation of the per-connection echo loop.
 */

#include "src/bench/inc/ConnectionWorker.hpp"

#include <exception>
#include <new>
#include <utility>

#include <fmt/core.h>

namespace echobench {

namespace bench {

/* ----------------------------- WorkerOutcome Methods ----------------------------- */

std::string WorkerOutcome::toString() const {
  if (failed) {
    return fmt::format("worker {}: {} requests, FAILED ({})", workerId, requestsCompleted, error);
  }
  return fmt::format("worker {}: {} requests", workerId, requestsCompleted);
}

/* ----------------------------- Payload ----------------------------- */

std::vector<char> makePayload(std::size_t length) {
  std::vector<char> payload(length, '\0');
  if (!payload.empty()) {
    payload.back() = '\n';
  }
  return payload;
}

/* ----------------------------- ConnectionWorker ----------------------------- */

ConnectionWorker::ConnectionWorker(std::uint32_t id, network::Endpoint endpoint,
                                   std::size_t payloadLength)
    : id_(id), endpoint_(std::move(endpoint)), payloadLength_(payloadLength) {}

ConnectionWorker::~ConnectionWorker() { network::closeSocket(fd_); }

ConnectionWorker::ConnectionWorker(ConnectionWorker&& other) noexcept
    : id_(other.id_), endpoint_(std::move(other.endpoint_)),
      payloadLength_(other.payloadLength_), fd_(std::exchange(other.fd_, -1)) {}

ConnectionWorker& ConnectionWorker::operator=(ConnectionWorker&& other) noexcept {
  if (this != &other) {
    network::closeSocket(fd_);
    id_ = other.id_;
    endpoint_ = std::move(other.endpoint_);
    payloadLength_ = other.payloadLength_;
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

bool ConnectionWorker::connect(std::string& error) noexcept {
  network::closeSocket(fd_);

  network::ConnectResult conn = network::connectTcp(endpoint_);
  if (!conn.success) {
    error = fmt::format("worker {}: {}", id_, conn.error);
    return false;
  }

  fd_ = conn.fd;
  return true;
}

void ConnectionWorker::fail(WorkerOutcome& outcome, const char* op,
                            const network::IoResult& io) const noexcept {
  outcome.failed = true;
  try {
    outcome.error = fmt::format("{} error: {}", op, io.describe());
  } catch (const std::bad_alloc&) {
    outcome.error.clear();
    return;
  }

  try {
    fmt::print(stderr, "worker {} {}\n", id_, outcome.error);
  } catch (const std::exception&) {
    // stderr unwritable; the outcome still carries the message
  }
}

WorkerOutcome ConnectionWorker::run(const StopSignal& stop) noexcept {
  WorkerOutcome outcome{};
  outcome.workerId = id_;

  if (fd_ < 0) {
    outcome.failed = true;
    outcome.error = "not connected";
    return outcome;
  }

  std::vector<char> out;
  std::vector<char> in;
  try {
    out = makePayload(payloadLength_);
    in.resize(payloadLength_);
  } catch (const std::bad_alloc&) {
    outcome.failed = true;
    outcome.error = fmt::format("cannot allocate {} byte buffers", payloadLength_);
    network::closeSocket(fd_);
    return outcome;
  }

  while (!stop.read()) {
    const network::IoResult SENT = network::sendAll(fd_, out.data(), out.size());
    if (!SENT.ok()) {
      fail(outcome, "write", SENT);
      break;
    }

    const network::IoResult RCVD = network::recvExact(fd_, in.data(), in.size());
    if (!RCVD.ok()) {
      fail(outcome, "read", RCVD);
      break;
    }

    ++outcome.requestsCompleted;
  }

  network::closeSocket(fd_);
  return outcome;
}

} // namespace bench

} // namespace echobench

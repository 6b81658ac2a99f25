/**
 * @file ProcessLimits.cpp
 * @brief Implementation of descriptor ceiling queries and adjustment.
 */

#include "src/system/inc/ProcessLimits.hpp"

#include <sys/resource.h> // getrlimit, setrlimit, RLIMIT_NOFILE

#include <cerrno>
#include <cstring>

#include <fmt/core.h>

namespace echobench {

namespace system {

namespace {

/* ----------------------------- Limit Helpers ----------------------------- */

/// Convert rlim_t to uint64_t, mapping RLIM_INFINITY to our sentinel.
inline std::uint64_t convertLimit(rlim_t value) noexcept {
  if (value == RLIM_INFINITY) {
    return RLIMIT_UNLIMITED_VALUE;
  }
  return static_cast<std::uint64_t>(value);
}

/// Read a limit, reporting syscall failure.
inline bool readLimit(int resource, RlimitValue& out, int& err) noexcept {
  struct rlimit lim{};
  if (::getrlimit(resource, &lim) != 0) {
    err = errno;
    return false;
  }
  out.soft = convertLimit(lim.rlim_cur);
  out.hard = convertLimit(lim.rlim_max);
  out.unlimited = (lim.rlim_cur == RLIM_INFINITY);
  return true;
}

} // namespace

/* ----------------------------- RlimitValue Methods ----------------------------- */

bool RlimitValue::canIncreaseTo(std::uint64_t value) const noexcept {
  if (hard == RLIMIT_UNLIMITED_VALUE) {
    return true;
  }
  return value <= hard;
}

bool RlimitValue::hasAtLeast(std::uint64_t value) const noexcept {
  if (unlimited || soft == RLIMIT_UNLIMITED_VALUE) {
    return true;
  }
  return soft >= value;
}

/* ----------------------------- FdCapacityResult Methods ----------------------------- */

std::string FdCapacityResult::toString() const {
  if (!success) {
    return fmt::format("NOFILE: FAILED ({})", error);
  }

  return fmt::format("NOFILE: required={} soft={}{} hard={}", required, formatLimit(after.soft),
                     raised ? fmt::format(" (raised from {})", formatLimit(before.soft)) : "",
                     formatLimit(after.hard));
}

/* ----------------------------- RlimitResourceLimiter ----------------------------- */

FdCapacityResult RlimitResourceLimiter::ensureCapacity(std::uint64_t connections) noexcept {
  return ensureFdCapacity(connections);
}

/* ----------------------------- API ----------------------------- */

RlimitValue getRlimit(int resource) noexcept {
  RlimitValue result{};
  int err = 0;
  if (!readLimit(resource, result, err)) {
    return RlimitValue{};
  }
  return result;
}

std::uint64_t requiredFdCount(std::uint64_t connections) noexcept {
  if (connections > RLIMIT_UNLIMITED_VALUE - RESERVED_FDS) {
    return RLIMIT_UNLIMITED_VALUE;
  }
  return connections + RESERVED_FDS;
}

FdCapacityResult ensureFdCapacity(std::uint64_t connections) noexcept {
  FdCapacityResult result{};
  result.required = requiredFdCount(connections);

  int err = 0;
  if (!readLimit(RLIMIT_NOFILE, result.before, err)) {
    result.error = fmt::format("getrlimit(RLIMIT_NOFILE) failed: {}", std::strerror(err));
    return result;
  }
  result.after = result.before;

  if (result.before.hasAtLeast(result.required)) {
    result.success = true;
    return result;
  }

  if (!result.before.canIncreaseTo(result.required)) {
    result.error = fmt::format("the hard limit of this process is only {} (need {} descriptors)",
                               formatLimit(result.before.hard), result.required);
    return result;
  }

  struct rlimit lim{};
  lim.rlim_cur = static_cast<rlim_t>(result.required);
  lim.rlim_max = (result.before.hard == RLIMIT_UNLIMITED_VALUE)
                     ? RLIM_INFINITY
                     : static_cast<rlim_t>(result.before.hard);
  if (::setrlimit(RLIMIT_NOFILE, &lim) != 0) {
    result.error = fmt::format("setrlimit(RLIMIT_NOFILE, {}) failed: {}", result.required,
                               std::strerror(errno));
    return result;
  }

  if (!readLimit(RLIMIT_NOFILE, result.after, err)) {
    result.error = fmt::format("getrlimit(RLIMIT_NOFILE) failed: {}", std::strerror(err));
    return result;
  }

  result.raised = true;
  result.success = result.after.hasAtLeast(result.required);
  if (!result.success) {
    result.error = fmt::format("soft limit is {} after raising to {}",
                               formatLimit(result.after.soft), result.required);
  }
  return result;
}

std::string formatLimit(std::uint64_t value) {
  if (value == RLIMIT_UNLIMITED_VALUE) {
    return "unlimited";
  }
  return fmt::format("{}", value);
}

} // namespace system

} // namespace echobench

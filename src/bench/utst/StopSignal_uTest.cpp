/**
 * @file StopSignal_uTest.cpp
 * @brief Unit tests for echobench::bench::StopSignal and StopHandle.
 */

#include "src/bench/inc/StopSignal.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using echobench::bench::StopHandle;
using echobench::bench::StopSignal;

/* ----------------------------- StopSignal Tests ----------------------------- */

/** @test A new signal reads false. */
TEST(StopSignalTest, InitiallyClear) {
  const StopSignal SIGNAL;
  EXPECT_FALSE(SIGNAL.read());
}

/** @test Only the first trigger performs the transition; the flag stays set. */
TEST(StopSignalTest, TriggerIsIdempotent) {
  StopSignal signal;

  EXPECT_TRUE(signal.trigger());
  EXPECT_TRUE(signal.read());

  EXPECT_FALSE(signal.trigger());
  EXPECT_FALSE(signal.trigger());
  EXPECT_TRUE(signal.read());
}

/** @test Concurrent readers all observe the trigger. */
TEST(StopSignalTest, ReadersObserveTrigger) {
  auto signal = std::make_shared<StopSignal>();
  std::atomic<int> stopped{0};

  std::vector<std::thread> readers;
  for (int i = 0; i < 8; ++i) {
    readers.emplace_back([signal, &stopped]() {
      while (!signal->read()) {
        std::this_thread::yield();
      }
      ++stopped;
    });
  }

  signal->trigger();
  for (std::thread& t : readers) {
    t.join();
  }

  EXPECT_EQ(stopped.load(), 8);
}

/* ----------------------------- StopHandle Tests ----------------------------- */

/** @test A handle triggers the flag it was created from. */
TEST(StopHandleTest, TriggersSharedFlag) {
  auto signal = std::make_shared<StopSignal>();
  const StopHandle HANDLE{signal};

  EXPECT_TRUE(HANDLE.alive());
  EXPECT_TRUE(HANDLE.trigger());
  EXPECT_TRUE(signal->read());

  // Second trigger still reaches a live flag, state unchanged
  EXPECT_TRUE(HANDLE.trigger());
  EXPECT_TRUE(signal->read());
}

/** @test A handle does not keep the flag alive. */
TEST(StopHandleTest, DoesNotExtendLifetime) {
  auto signal = std::make_shared<StopSignal>();
  const StopHandle HANDLE{signal};
  EXPECT_EQ(signal.use_count(), 1);

  signal.reset();

  EXPECT_FALSE(HANDLE.alive());
  EXPECT_FALSE(HANDLE.trigger());
}

/** @test A default handle is inert. */
TEST(StopHandleTest, DefaultInert) {
  const StopHandle HANDLE;
  EXPECT_FALSE(HANDLE.alive());
  EXPECT_FALSE(HANDLE.trigger());
}

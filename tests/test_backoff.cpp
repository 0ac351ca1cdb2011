#include <gtest/gtest.h>

#include <chrono>
#include <random>

#include "util/backoff.hpp"

namespace hookhub {

using namespace std::chrono_literals;

TEST(BackoffTest, DoublesUpToMaxWithoutJitter) {
  JitteredExponentialBackoff backoff({100ms, 1000ms, 0ms});
  std::mt19937 rng(7);
  EXPECT_EQ(backoff.NextDelay(rng), 100ms);
  EXPECT_EQ(backoff.NextDelay(rng), 200ms);
  EXPECT_EQ(backoff.NextDelay(rng), 400ms);
  EXPECT_EQ(backoff.NextDelay(rng), 800ms);
  EXPECT_EQ(backoff.NextDelay(rng), 1000ms);
  EXPECT_EQ(backoff.NextDelay(rng), 1000ms);
  EXPECT_EQ(backoff.attempt(), 6);
}

TEST(BackoffTest, ResetStartsOver) {
  JitteredExponentialBackoff backoff({100ms, 1000ms, 0ms});
  std::mt19937 rng(7);
  backoff.NextDelay(rng);
  backoff.NextDelay(rng);
  backoff.Reset();
  EXPECT_EQ(backoff.attempt(), 0);
  EXPECT_EQ(backoff.NextDelay(rng), 100ms);
}

TEST(BackoffTest, JitterStaysInRange) {
  JitteredExponentialBackoff backoff({100ms, 100ms, 50ms});
  std::mt19937 rng(42);
  for (int i = 0; i < 100; ++i) {
    const auto delay = backoff.NextDelay(rng);
    EXPECT_GE(delay, 100ms);
    EXPECT_LE(delay, 150ms);
  }
}

TEST(BackoffTest, ManyAttemptsDoNotOverflow) {
  JitteredExponentialBackoff backoff({1000ms, 30000ms, 0ms});
  std::mt19937 rng(1);
  std::chrono::milliseconds last{0};
  for (int i = 0; i < 200; ++i) {
    last = backoff.NextDelay(rng);
  }
  EXPECT_EQ(last, 30000ms);
}

} // namespace hookhub

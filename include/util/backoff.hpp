#pragma once

#include <algorithm>
#include <chrono>
#include <random>

namespace hookhub {

struct ExponentialBackoffOptions {
  std::chrono::milliseconds initial_delay{1000};
  std::chrono::milliseconds max_delay{30000};
  std::chrono::milliseconds jitter{250};
};

// Delay doubles per attempt up to max_delay, plus uniform jitter in
// [0, jitter].
class JitteredExponentialBackoff {
public:
  explicit JitteredExponentialBackoff(ExponentialBackoffOptions options = {})
      : options_(options) {}

  void UpdateOptions(ExponentialBackoffOptions options) { options_ = options; }

  void Reset() { attempt_ = 0; }

  int attempt() const { return attempt_; }

  template <typename Rng> std::chrono::milliseconds NextDelay(Rng &rng) {
    const auto initial = std::max<long long>(0, options_.initial_delay.count());
    const auto maximum =
        std::max<long long>(initial, options_.max_delay.count());
    long long base = initial;
    for (int i = 0; i < attempt_ && base < maximum; ++i) {
      base *= 2;
    }
    base = std::min(base, maximum);
    if (attempt_ < 62) {
      ++attempt_;
    }

    long long extra = 0;
    if (options_.jitter.count() > 0) {
      std::uniform_int_distribution<long long> dist(0, options_.jitter.count());
      extra = dist(rng);
    }
    return std::chrono::milliseconds(base + extra);
  }

private:
  ExponentialBackoffOptions options_;
  int attempt_{0};
};

} // namespace hookhub

#pragma once
// hmb/core/timer.h
//
// Timing utilities.
// Provides:
//  - Stopwatch: a simple monotonic wall-clock timer.
//  - Deadline: a point in time after which a wait should give up
//    (an unset deadline never expires).

#include "hmb/core/types.h"

#include <chrono>

namespace hmb {

class Stopwatch {
 public:
  using Clock = std::chrono::steady_clock;

  Stopwatch() : start_(Clock::now()) {}

  void Reset() { start_ = Clock::now(); }

  u64 ElapsedNanos() const {
    return static_cast<u64>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start_).count());
  }

  double ElapsedMillis() const { return static_cast<double>(ElapsedNanos()) / 1e6; }
  double ElapsedSeconds() const { return static_cast<double>(ElapsedNanos()) / 1e9; }

 private:
  Clock::time_point start_;
};

class Deadline {
 public:
  using Clock = Stopwatch::Clock;

  // Never expires.
  Deadline() = default;

  static Deadline After(Clock::duration d) {
    Deadline out;
    out.at_ = Clock::now() + d;
    out.set_ = true;
    return out;
  }

  bool IsSet() const noexcept { return set_; }

  bool Expired() const { return set_ && Clock::now() >= at_; }

  // Time left, clamped at zero. Returns `cap` when the deadline is unset.
  Clock::duration Remaining(Clock::duration cap) const {
    if (!set_) return cap;
    const auto now = Clock::now();
    if (now >= at_) return Clock::duration::zero();
    const auto left = at_ - now;
    return left < cap ? left : cap;
  }

 private:
  Clock::time_point at_{};
  bool set_ = false;
};

}  // namespace hmb

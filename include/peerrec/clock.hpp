#pragma once

#include <peerrec/internal.hpp>

#include <cstdint>

namespace peerrec {

/**
 * Injectable clock interface.
 * Production code uses RealClock; tests inject testing::FakeClock.
 */
class Clock {
 public:
  virtual ~Clock() = default;
  virtual uint64_t NowMicros() const = 0;       // Monotonic
  virtual int64_t WallClockMillis() const = 0;  // Wall clock
};

class RealClock : public Clock {
 public:
  uint64_t NowMicros() const override { return internal::NowMicros(); }
  int64_t WallClockMillis() const override { return internal::WallClockMillis(); }
};

// Process-wide real clock, used when no clock is injected.
inline const Clock* SystemClock() {
  static const RealClock clock;
  return &clock;
}

}  // namespace peerrec

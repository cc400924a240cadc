#include "FrameClock.h"

namespace {
// Tolerates timestamp jitter from containers that report rounded milliseconds.
constexpr double kTimestampSlack = 1e-6;
} // namespace

FrameClock::FrameClock(double targetFps) {
  interval_ = targetFps > 0.0 ? 1.0 / targetFps : 0.0;
}

bool FrameClock::TryBegin(double timestampSec) {
  if (inFlight_) {
    ++skipped_;
    return false;
  }
  if (hasLast_) {
    if (timestampSec == lastTimestamp_ ||
        timestampSec - lastTimestamp_ < interval_ - kTimestampSlack) {
      ++skipped_;
      return false;
    }
  }
  inFlight_ = true;
  hasLast_ = true;
  lastTimestamp_ = timestampSec;
  ++admitted_;
  return true;
}

void FrameClock::Retire() {
  inFlight_ = false;
}

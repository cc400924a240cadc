#pragma once

// FrameClock: admits at most one render per target frame interval.
// A render that cannot start is skipped, never queued: TryBegin refuses while a
// previous render is still in flight, for a timestamp that was already rendered,
// and for timestamps less than one interval after the last admitted one.
class FrameClock {
public:
  explicit FrameClock(double targetFps);

  bool TryBegin(double timestampSec);

  // Marks the in-flight render as finished.
  void Retire();

  bool InFlight() const { return inFlight_; }
  double Interval() const { return interval_; }
  int Admitted() const { return admitted_; }
  int Skipped() const { return skipped_; }

private:
  double interval_ = 0.0;
  double lastTimestamp_ = 0.0;
  bool hasLast_ = false;
  bool inFlight_ = false;
  int admitted_ = 0;
  int skipped_ = 0;
};

#pragma once

namespace boolstab {

// Source of "now", in seconds.
//
// Signals never read time on their own: callers pass `now` explicitly or let a
// SignalRegistry read it from an injected Clock. Only differences between
// readings are meaningful; the epoch is implementation-defined.
class Clock {
public:
  virtual ~Clock() = default;
  virtual double now_seconds() const = 0;
};

// Monotonic clock backed by std::chrono::steady_clock.
class SteadyClock : public Clock {
public:
  double now_seconds() const override;
};

// Clock that only moves when told to. Intended for tests and offline replay.
class ManualClock : public Clock {
public:
  explicit ManualClock(double start_seconds = 0.0);

  double now_seconds() const override { return now_; }

  // Jump to an absolute time (may move backwards).
  void set(double t_seconds);

  // Move forward by dt >= 0 seconds.
  void advance(double dt_seconds);

private:
  double now_{0.0};
};

} // namespace boolstab

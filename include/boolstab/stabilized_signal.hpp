#pragma once

#include "boolstab/buffer_mode.hpp"
#include "boolstab/thresholds.hpp"

#include <optional>
#include <string>

namespace boolstab {

// Boolean value stabilized by count and duration thresholds.
//
// The committed value() only changes when a different value has been
// reported on `count` consecutive report() calls AND the first of those
// reports is at least `duration` seconds old. Both requirements must hold,
// so a burst of reports in a single instant cannot satisfy a duration
// requirement and a single long-held report cannot satisfy a count
// requirement.
//
// Behavior of report(new_value, now, force_immediate):
// - new_value == value(): any pending candidate is dropped, value unchanged.
// - force_immediate, or the buffer mode does not stabilize this direction:
//   new_value is committed at once.
// - Otherwise new_value becomes (or continues as) the pending candidate.
//   Switching to a different candidate restarts both count and duration.
//
// Thresholds and buffer mode are plain mutable configuration. Changing them
// never touches value() and never commits a pending candidate on its own; the
// next report() sees the new settings.
//
// Not thread-safe: callers sharing a signal across threads must serialize
// report() calls, and reports must arrive in order.
class StabilizedSignal {
public:
  explicit StabilizedSignal(std::string name, bool initial_value = false,
                            const SignalConfig& config = SignalConfig{});

  const std::string& name() const { return name_; }
  bool value() const { return value_; }

  std::optional<bool> pending_value() const { return pending_value_; }
  int pending_count() const { return pending_count_; }
  std::optional<double> pending_since() const { return pending_since_; }
  bool is_pending() const { return pending_value_.has_value(); }

  // Seconds since the pending candidate was first proposed, or 0 if there
  // is none. Never negative, even if `now` is earlier than pending_since().
  double pending_duration(double now) const;

  // Process one observation and return the committed value afterwards.
  // Throws std::invalid_argument if `now` is not finite.
  bool report(bool new_value, double now, bool force_immediate = false);

  // Drop any pending candidate. If new_value is given, also commit it
  // directly, bypassing all thresholds.
  void reset(std::optional<bool> new_value = std::nullopt);

  BufferMode buffer_mode() const { return config_.buffer_mode; }
  void set_buffer_mode(BufferMode mode) { config_.buffer_mode = mode; }

  const ThresholdSet& thresholds() const { return config_.thresholds; }
  const SignalConfig& config() const { return config_; }

  int count_threshold_for(Transition dir) const {
    return resolve_count_threshold(config_.thresholds, dir);
  }
  double duration_threshold_for(Transition dir) const {
    return resolve_duration_threshold(config_.thresholds, dir);
  }

  // Setters validate before assigning; on InvalidConfigurationError the
  // previous configuration is kept.
  void set_thresholds(const ThresholdSet& t);
  void set_count_threshold(int count);
  void set_duration_threshold(double seconds);
  void set_count_threshold_override(Transition dir, std::optional<int> count);
  void set_duration_threshold_override(Transition dir, std::optional<double> seconds);

private:
  void clear_pending();

  std::string name_;
  bool value_{false};
  SignalConfig config_;

  std::optional<bool> pending_value_;
  int pending_count_{0};
  std::optional<double> pending_since_;
};

// One-line human-readable summary (name, value, pending state, configuration).
std::string to_string(const StabilizedSignal& s);

} // namespace boolstab

#pragma once

#include "boolstab/buffer_mode.hpp"

#include <optional>
#include <string>

namespace boolstab {

// Count/duration requirements a pending candidate must satisfy before it is
// committed.
//
// The symmetric base fields always hold concrete values. The per-direction
// overrides are optional; resolving a threshold for a direction yields the
// override if present, else the base. Absence of an override therefore never
// leaves a direction without a threshold.
struct ThresholdSet {
  int count_threshold{1};
  double duration_threshold{0.0};  // seconds

  std::optional<int> count_threshold_false_to_true;
  std::optional<int> count_threshold_true_to_false;
  std::optional<double> duration_threshold_false_to_true;
  std::optional<double> duration_threshold_true_to_false;
};

template <typename T>
inline T resolve_threshold(T base, const std::optional<T>& override_value) {
  return override_value ? *override_value : base;
}

int resolve_count_threshold(const ThresholdSet& t, Transition dir);
double resolve_duration_threshold(const ThresholdSet& t, Transition dir);

// True if both directions resolve to the same count and duration.
bool is_symmetric(const ThresholdSet& t);

// Throw InvalidConfigurationError if a count (base or override) is < 1 or a
// duration (base or override) is negative or non-finite.
void validate_thresholds(const ThresholdSet& t);

// Compact description, e.g. "count=3 duration=0.5s" or
// "count=2/5 duration=0s" (false->true / true->false) when asymmetric.
std::string describe_thresholds(const ThresholdSet& t);

// Full per-signal configuration. Copied into every StabilizedSignal at
// creation; later changes to the source do not propagate.
struct SignalConfig {
  ThresholdSet thresholds;
  BufferMode buffer_mode{BufferMode::Both};
};

} // namespace boolstab

#include "boolstab/stabilized_signal.hpp"

#include "boolstab/utils.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace boolstab {

StabilizedSignal::StabilizedSignal(std::string name, bool initial_value, const SignalConfig& config)
    : name_(std::move(name)), value_(initial_value), config_(config) {
  validate_thresholds(config_.thresholds);
}

double StabilizedSignal::pending_duration(double now) const {
  if (!pending_since_) return 0.0;
  return std::max(0.0, now - *pending_since_);
}

bool StabilizedSignal::report(bool new_value, double now, bool force_immediate) {
  if (!std::isfinite(now)) {
    throw std::invalid_argument("StabilizedSignal '" + name_ + "': report time must be finite");
  }

  if (new_value == value_) {
    // Re-asserting the committed value cancels an in-flight transition.
    clear_pending();
    return value_;
  }

  if (force_immediate || !stabilizes(config_.buffer_mode, value_, new_value)) {
    value_ = new_value;
    clear_pending();
    return value_;
  }

  if (!pending_value_ || *pending_value_ != new_value) {
    pending_value_ = new_value;
    pending_count_ = 1;
    pending_since_ = now;
  } else {
    // A candidate held back by its duration may be reported indefinitely.
    pending_count_ = saturating_increment(pending_count_);
  }

  const Transition dir = transition_into(new_value);
  const int need_count = resolve_count_threshold(config_.thresholds, dir);
  const double need_duration = resolve_duration_threshold(config_.thresholds, dir);

  if (pending_count_ >= need_count && pending_duration(now) >= need_duration) {
    value_ = new_value;
    clear_pending();
  }
  return value_;
}

void StabilizedSignal::reset(std::optional<bool> new_value) {
  if (new_value) value_ = *new_value;
  clear_pending();
}

void StabilizedSignal::set_thresholds(const ThresholdSet& t) {
  validate_thresholds(t);
  config_.thresholds = t;
}

void StabilizedSignal::set_count_threshold(int count) {
  ThresholdSet t = config_.thresholds;
  t.count_threshold = count;
  set_thresholds(t);
}

void StabilizedSignal::set_duration_threshold(double seconds) {
  ThresholdSet t = config_.thresholds;
  t.duration_threshold = seconds;
  set_thresholds(t);
}

void StabilizedSignal::set_count_threshold_override(Transition dir, std::optional<int> count) {
  ThresholdSet t = config_.thresholds;
  if (dir == Transition::FalseToTrue) {
    t.count_threshold_false_to_true = count;
  } else {
    t.count_threshold_true_to_false = count;
  }
  set_thresholds(t);
}

void StabilizedSignal::set_duration_threshold_override(Transition dir, std::optional<double> seconds) {
  ThresholdSet t = config_.thresholds;
  if (dir == Transition::FalseToTrue) {
    t.duration_threshold_false_to_true = seconds;
  } else {
    t.duration_threshold_true_to_false = seconds;
  }
  set_thresholds(t);
}

void StabilizedSignal::clear_pending() {
  pending_value_.reset();
  pending_count_ = 0;
  pending_since_.reset();
}

std::string to_string(const StabilizedSignal& s) {
  std::ostringstream oss;
  oss << "name=" << s.name()
      << " value=" << (s.value() ? "true" : "false");
  if (s.is_pending()) {
    oss << " pending=" << (*s.pending_value() ? "true" : "false")
        << " count=" << s.pending_count();
  } else {
    oss << " pending=none";
  }
  oss << " mode=" << buffer_mode_name(s.buffer_mode())
      << " " << describe_thresholds(s.thresholds());
  return oss.str();
}

} // namespace boolstab

#include "boolstab/thresholds.hpp"

#include "boolstab/errors.hpp"

#include <cmath>
#include <sstream>

namespace boolstab {

namespace {

void check_count(int v, const char* what) {
  if (v < 1) {
    throw InvalidConfigurationError(std::string(what) + " must be at least 1 (got " +
                                    std::to_string(v) + ")");
  }
}

void check_duration(double v, const char* what) {
  if (!std::isfinite(v)) {
    throw InvalidConfigurationError(std::string(what) + " must be finite");
  }
  if (v < 0.0) {
    std::ostringstream oss;
    oss << what << " cannot be negative (got " << v << ")";
    throw InvalidConfigurationError(oss.str());
  }
}

} // namespace

int resolve_count_threshold(const ThresholdSet& t, Transition dir) {
  if (dir == Transition::FalseToTrue) {
    return resolve_threshold(t.count_threshold, t.count_threshold_false_to_true);
  }
  return resolve_threshold(t.count_threshold, t.count_threshold_true_to_false);
}

double resolve_duration_threshold(const ThresholdSet& t, Transition dir) {
  if (dir == Transition::FalseToTrue) {
    return resolve_threshold(t.duration_threshold, t.duration_threshold_false_to_true);
  }
  return resolve_threshold(t.duration_threshold, t.duration_threshold_true_to_false);
}

bool is_symmetric(const ThresholdSet& t) {
  return resolve_count_threshold(t, Transition::FalseToTrue) ==
             resolve_count_threshold(t, Transition::TrueToFalse) &&
         resolve_duration_threshold(t, Transition::FalseToTrue) ==
             resolve_duration_threshold(t, Transition::TrueToFalse);
}

void validate_thresholds(const ThresholdSet& t) {
  check_count(t.count_threshold, "count_threshold");
  check_duration(t.duration_threshold, "duration_threshold");

  if (t.count_threshold_false_to_true) {
    check_count(*t.count_threshold_false_to_true, "count_threshold_false_to_true");
  }
  if (t.count_threshold_true_to_false) {
    check_count(*t.count_threshold_true_to_false, "count_threshold_true_to_false");
  }
  if (t.duration_threshold_false_to_true) {
    check_duration(*t.duration_threshold_false_to_true, "duration_threshold_false_to_true");
  }
  if (t.duration_threshold_true_to_false) {
    check_duration(*t.duration_threshold_true_to_false, "duration_threshold_true_to_false");
  }
}

std::string describe_thresholds(const ThresholdSet& t) {
  const int c_up = resolve_count_threshold(t, Transition::FalseToTrue);
  const int c_down = resolve_count_threshold(t, Transition::TrueToFalse);
  const double d_up = resolve_duration_threshold(t, Transition::FalseToTrue);
  const double d_down = resolve_duration_threshold(t, Transition::TrueToFalse);

  std::ostringstream oss;
  oss << "count=" << c_up;
  if (c_down != c_up) oss << "/" << c_down;
  oss << " duration=" << d_up << "s";
  if (d_down != d_up) oss << "/" << d_down << "s";
  return oss.str();
}

} // namespace boolstab

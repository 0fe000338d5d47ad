#include "boolstab/clock.hpp"

#include <chrono>
#include <cmath>
#include <stdexcept>

namespace boolstab {

double SteadyClock::now_seconds() const {
  using namespace std::chrono;
  return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

ManualClock::ManualClock(double start_seconds) {
  set(start_seconds);
}

void ManualClock::set(double t_seconds) {
  if (!std::isfinite(t_seconds)) {
    throw std::invalid_argument("ManualClock: time must be finite");
  }
  now_ = t_seconds;
}

void ManualClock::advance(double dt_seconds) {
  if (!std::isfinite(dt_seconds) || dt_seconds < 0.0) {
    throw std::invalid_argument("ManualClock: advance() requires a finite dt >= 0");
  }
  now_ += dt_seconds;
}

} // namespace boolstab

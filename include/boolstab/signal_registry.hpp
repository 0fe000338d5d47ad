#pragma once

#include "boolstab/clock.hpp"
#include "boolstab/errors.hpp"
#include "boolstab/stabilized_signal.hpp"
#include "boolstab/thresholds.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace boolstab {

// Per-call overrides for SignalRegistry::add(). Every field left empty falls
// back to the registry's defaults at the time of the call.
struct SignalOverrides {
  std::optional<int> count_threshold;
  std::optional<double> duration_threshold;
  std::optional<int> count_threshold_false_to_true;
  std::optional<int> count_threshold_true_to_false;
  std::optional<double> duration_threshold_false_to_true;
  std::optional<double> duration_threshold_true_to_false;
  std::optional<BufferMode> buffer_mode;
};

// Merge overrides on top of a base configuration.
SignalConfig apply_overrides(const SignalConfig& base, const SignalOverrides& o);

// Named collection of StabilizedSignal instances.
//
// Defaults are resolved once, when a signal is added: the signal receives its
// own copy of the configuration and later set_defaults() calls do not affect
// it. Enumeration (names(), get_all_values()) is in name order.
//
// References returned by add()/get() stay valid until the signal is removed.
// Like StabilizedSignal, this class is not thread-safe.
class SignalRegistry {
public:
  explicit SignalRegistry(const SignalConfig& defaults = SignalConfig{},
                          std::shared_ptr<const Clock> clock = nullptr);

  const SignalConfig& defaults() const { return defaults_; }
  void set_defaults(const SignalConfig& defaults);

  // Current reading of the injected clock (SteadyClock unless overridden).
  double now() const { return clock_->now_seconds(); }

  StabilizedSignal& add(const std::string& name, bool initial_value = false);
  StabilizedSignal& add(const std::string& name, bool initial_value, const SignalOverrides& overrides);

  void remove(const std::string& name);

  bool contains(const std::string& name) const;
  std::size_t size() const { return signals_.size(); }
  bool empty() const { return signals_.empty(); }
  std::vector<std::string> names() const;

  // Throw NotFoundError if the name is unknown.
  StabilizedSignal& get(const std::string& name);
  const StabilizedSignal& get(const std::string& name) const;

  // nullptr if the name is unknown.
  StabilizedSignal* find(const std::string& name);
  const StabilizedSignal* find(const std::string& name) const;

  bool report(const std::string& name, bool new_value, double now, bool force_immediate = false);
  // Same, with `now` read from the registry clock. Named apart from report()
  // so a numeric time argument can never bind to force_immediate.
  bool report_now(const std::string& name, bool new_value, bool force_immediate = false);

  bool get_value(const std::string& name) const;
  std::map<std::string, bool> get_all_values() const;

  void reset(const std::string& name, std::optional<bool> new_value = std::nullopt);

  // Drop every pending candidate. Committed values are unchanged.
  void reset_all();

private:
  SignalConfig defaults_;
  std::shared_ptr<const Clock> clock_;
  std::map<std::string, std::unique_ptr<StabilizedSignal>> signals_;
};

} // namespace boolstab

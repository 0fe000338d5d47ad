#include "boolstab/signal_registry.hpp"

#include <utility>

namespace boolstab {

SignalConfig apply_overrides(const SignalConfig& base, const SignalOverrides& o) {
  SignalConfig cfg = base;
  ThresholdSet& t = cfg.thresholds;
  if (o.count_threshold) t.count_threshold = *o.count_threshold;
  if (o.duration_threshold) t.duration_threshold = *o.duration_threshold;
  if (o.count_threshold_false_to_true) t.count_threshold_false_to_true = o.count_threshold_false_to_true;
  if (o.count_threshold_true_to_false) t.count_threshold_true_to_false = o.count_threshold_true_to_false;
  if (o.duration_threshold_false_to_true) {
    t.duration_threshold_false_to_true = o.duration_threshold_false_to_true;
  }
  if (o.duration_threshold_true_to_false) {
    t.duration_threshold_true_to_false = o.duration_threshold_true_to_false;
  }
  if (o.buffer_mode) cfg.buffer_mode = *o.buffer_mode;
  return cfg;
}

SignalRegistry::SignalRegistry(const SignalConfig& defaults, std::shared_ptr<const Clock> clock)
    : defaults_(defaults), clock_(std::move(clock)) {
  validate_thresholds(defaults_.thresholds);
  if (!clock_) clock_ = std::make_shared<SteadyClock>();
}

void SignalRegistry::set_defaults(const SignalConfig& defaults) {
  validate_thresholds(defaults.thresholds);
  defaults_ = defaults;
}

StabilizedSignal& SignalRegistry::add(const std::string& name, bool initial_value) {
  return add(name, initial_value, SignalOverrides{});
}

StabilizedSignal& SignalRegistry::add(const std::string& name, bool initial_value,
                                      const SignalOverrides& overrides) {
  if (signals_.count(name) != 0) {
    throw DuplicateNameError(name);
  }
  // Construct first so an invalid configuration leaves the registry untouched.
  auto sig = std::make_unique<StabilizedSignal>(name, initial_value, apply_overrides(defaults_, overrides));
  StabilizedSignal& ref = *sig;
  signals_.emplace(name, std::move(sig));
  return ref;
}

void SignalRegistry::remove(const std::string& name) {
  auto it = signals_.find(name);
  if (it == signals_.end()) {
    throw NotFoundError(name);
  }
  signals_.erase(it);
}

bool SignalRegistry::contains(const std::string& name) const {
  return signals_.count(name) != 0;
}

std::vector<std::string> SignalRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(signals_.size());
  for (const auto& kv : signals_) out.push_back(kv.first);
  return out;
}

StabilizedSignal& SignalRegistry::get(const std::string& name) {
  StabilizedSignal* s = find(name);
  if (!s) throw NotFoundError(name);
  return *s;
}

const StabilizedSignal& SignalRegistry::get(const std::string& name) const {
  const StabilizedSignal* s = find(name);
  if (!s) throw NotFoundError(name);
  return *s;
}

StabilizedSignal* SignalRegistry::find(const std::string& name) {
  auto it = signals_.find(name);
  return it == signals_.end() ? nullptr : it->second.get();
}

const StabilizedSignal* SignalRegistry::find(const std::string& name) const {
  auto it = signals_.find(name);
  return it == signals_.end() ? nullptr : it->second.get();
}

bool SignalRegistry::report(const std::string& name, bool new_value, double now, bool force_immediate) {
  return get(name).report(new_value, now, force_immediate);
}

bool SignalRegistry::report_now(const std::string& name, bool new_value, bool force_immediate) {
  StabilizedSignal& s = get(name);
  return s.report(new_value, clock_->now_seconds(), force_immediate);
}

bool SignalRegistry::get_value(const std::string& name) const {
  return get(name).value();
}

std::map<std::string, bool> SignalRegistry::get_all_values() const {
  std::map<std::string, bool> out;
  for (const auto& kv : signals_) out.emplace(kv.first, kv.second->value());
  return out;
}

void SignalRegistry::reset(const std::string& name, std::optional<bool> new_value) {
  get(name).reset(new_value);
}

void SignalRegistry::reset_all() {
  for (auto& kv : signals_) kv.second->reset();
}

} // namespace boolstab

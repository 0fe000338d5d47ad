#include "boolstab/signal_registry.hpp"

#include "test_support.hpp"
#include <iostream>
#include <memory>

using namespace boolstab;
using boolstab_test::throws;

int main() {
  // Add / contains / size / names.
  {
    SignalRegistry reg;
    assert(reg.empty());
    StabilizedSignal& a = reg.add("b_sensor");
    reg.add("a_sensor", true);
    assert(reg.size() == 2);
    assert(reg.contains("a_sensor"));
    assert(!reg.contains("c_sensor"));
    assert(a.name() == "b_sensor");
    assert(&reg.get("b_sensor") == &a);
    assert(reg.find("b_sensor") == &a);
    assert(reg.find("nope") == nullptr);

    const auto names = reg.names();
    assert(names.size() == 2);
    assert(names[0] == "a_sensor");
    assert(names[1] == "b_sensor");
  }

  // Name uniqueness and unknown names.
  {
    SignalRegistry reg;
    reg.add("x");
    assert(throws<DuplicateNameError>([&] { reg.add("x", true); }));
    assert(reg.get_value("x") == false);

    assert(throws<NotFoundError>([&] { reg.report("y", true, 0.0); }));
    assert(throws<NotFoundError>([&] { reg.report_now("y", true); }));
    assert(throws<NotFoundError>([&] { reg.remove("y"); }));
    assert(throws<NotFoundError>([&] { (void)reg.get_value("y"); }));
    assert(throws<NotFoundError>([&] { (void)reg.get("y"); }));
    assert(throws<NotFoundError>([&] { reg.reset("y"); }));

    try {
      reg.remove("missing");
      assert(false);
    } catch (const NotFoundError& e) {
      assert(e.name() == "missing");
    }
  }

  // Remove.
  {
    SignalRegistry reg;
    reg.add("x");
    reg.remove("x");
    assert(!reg.contains("x"));
    assert(reg.size() == 0);
    reg.add("x", true);
    assert(reg.get_value("x") == true);
  }

  // Registry defaults are applied to new signals.
  {
    SignalConfig defaults;
    defaults.thresholds.count_threshold = 3;
    SignalRegistry reg(defaults);
    reg.add("s");
    assert(reg.report("s", true, 0.0) == false);
    assert(reg.report("s", true, 0.0) == false);
    assert(reg.report("s", true, 0.0) == true);
    assert(reg.get_value("s") == true);
  }

  // Per-call overrides; omitted fields fall back to the defaults.
  {
    SignalConfig defaults;
    defaults.thresholds.count_threshold = 4;
    defaults.thresholds.duration_threshold = 1.0;
    defaults.buffer_mode = BufferMode::TrueToFalse;
    SignalRegistry reg(defaults);

    SignalOverrides o;
    o.count_threshold = 2;
    o.count_threshold_true_to_false = 6;
    const StabilizedSignal& s = reg.add("s", false, o);
    assert(s.count_threshold_for(Transition::FalseToTrue) == 2);
    assert(s.count_threshold_for(Transition::TrueToFalse) == 6);
    assert(s.duration_threshold_for(Transition::FalseToTrue) == 1.0);
    assert(s.buffer_mode() == BufferMode::TrueToFalse);

    SignalOverrides bad;
    bad.count_threshold = 0;
    assert(throws<InvalidConfigurationError>([&] { reg.add("t", false, bad); }));
    assert(!reg.contains("t"));
  }

  // A signal owns its configuration: later default changes do not leak in.
  {
    SignalRegistry reg;
    reg.add("old");
    SignalConfig d;
    d.thresholds.count_threshold = 5;
    reg.set_defaults(d);
    reg.add("new");
    assert(reg.get("old").thresholds().count_threshold == 1);
    assert(reg.get("new").thresholds().count_threshold == 5);
    assert(reg.report("old", true, 0.0) == true);
    assert(reg.report("new", true, 0.0) == false);

    SignalConfig bad;
    bad.thresholds.duration_threshold = -1.0;
    assert(throws<InvalidConfigurationError>([&] { reg.set_defaults(bad); }));
    assert(reg.defaults().thresholds.count_threshold == 5);
    assert(throws<InvalidConfigurationError>([&] { SignalRegistry r2(bad); }));
  }

  // Per-signal buffer mode through get().
  {
    SignalConfig defaults;
    defaults.thresholds.count_threshold = 3;
    SignalRegistry reg(defaults);
    reg.add("s");
    reg.get("s").set_buffer_mode(BufferMode::None);
    assert(reg.report("s", true, 0.0) == true);
  }

  // force_immediate through the registry.
  {
    SignalConfig defaults;
    defaults.thresholds.count_threshold = 3;
    SignalRegistry reg(defaults);
    reg.add("s");
    assert(reg.report("s", true, 0.0, true) == true);
  }

  // Injected clock drives duration thresholds.
  {
    auto clock = std::make_shared<ManualClock>(100.0);
    SignalConfig defaults;
    defaults.thresholds.duration_threshold = 2.0;
    SignalRegistry reg(defaults, clock);
    reg.add("s");

    assert(reg.now() == 100.0);
    assert(reg.report_now("s", true) == false);
    clock->advance(1.0);
    assert(reg.report_now("s", true) == false);
    assert(reg.get("s").pending_duration(reg.now()) == 1.0);
    clock->advance(1.0);
    assert(reg.report_now("s", true) == true);

    // A clock-driven report can still force a commit.
    assert(reg.report_now("s", false, true) == false);
    assert(!reg.get("s").is_pending());
  }

  // Snapshots and bulk reset.
  {
    SignalConfig defaults;
    defaults.thresholds.count_threshold = 2;
    SignalRegistry reg(defaults);
    reg.add("a", true);
    reg.add("b", false);
    reg.report("a", false, 0.0);
    reg.report("b", true, 0.0);
    assert(reg.get("a").is_pending());
    assert(reg.get("b").is_pending());

    reg.reset_all();
    assert(!reg.get("a").is_pending());
    assert(!reg.get("b").is_pending());

    const auto values = reg.get_all_values();
    assert(values.size() == 2);
    assert(values.at("a") == true);
    assert(values.at("b") == false);

    reg.reset("b", true);
    assert(reg.get_value("b") == true);
  }

  std::cout << "test_signal_registry: OK\n";
  return 0;
}

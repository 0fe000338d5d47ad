#include "boolstab/report_stream.hpp"

#include "test_support.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace boolstab;
using boolstab_test::throws;

static SignalConfig count_config(int count) {
  SignalConfig cfg;
  cfg.thresholds.count_threshold = count;
  return cfg;
}

int main() {
  // Epoch-scale timestamps keep their sub-second part in the trace.
  {
    SignalRegistry reg(count_config(2));
    reg.add("door");
    std::istringstream in(
        "1700000000.25,door,1\n"
        "1700000000.75,door,1\n"
        "1700000001.5,door,0\n");
    std::ostringstream out;
    const ReplayStats st = replay_reports(in, out, reg);
    assert(st.reports == 3);
    assert(st.changes == 1);
    assert(out.str() ==
           "time,name,raw,value,pending_count\n"
           "1700000000.25,door,1,0,1\n"
           "1700000000.75,door,1,1,0\n"
           "1700000001.5,door,0,1,1\n");
  }

  // changes_only keeps only rows where the committed value moved; comments
  // and blank lines are skipped.
  {
    SignalRegistry reg(count_config(2));
    reg.add("door");
    std::istringstream in(
        "# t,name,value\n"
        "0,door,1\n"
        "\n"
        "1,door,1\n"
        "2,door,0\n"
        "3,door,0,1\n");
    std::ostringstream out;
    ReplayOptions opt;
    opt.changes_only = true;
    const ReplayStats st = replay_reports(in, out, reg, opt);
    assert(st.lines == 6);
    assert(st.reports == 4);
    assert(st.changes == 2);
    assert(out.str() ==
           "time,name,raw,value,pending_count\n"
           "1,door,1,1,0\n"
           "3,door,0,0,0\n");
  }

  // Unknown names fail without auto_add and are registered with it.
  {
    SignalRegistry reg;
    std::istringstream in("0,pir,1\n");
    std::ostringstream out;
    assert(throws<NotFoundError>([&] { (void)replay_reports(in, out, reg); }));
    assert(!reg.contains("pir"));
  }
  {
    SignalRegistry reg(count_config(2));
    std::istringstream in("0,pir,1\n1,pir,1\n");
    std::ostringstream out;
    std::ostringstream log;
    ReplayOptions opt;
    opt.auto_add = true;
    opt.log = &log;
    const ReplayStats st = replay_reports(in, out, reg, opt);
    assert(st.added == 1);
    assert(reg.contains("pir"));
    assert(reg.get_value("pir") == true);
    assert(log.str().find("Added signal 'pir' on line 1") != std::string::npos);
  }

  // Parse errors carry the line number.
  {
    SignalRegistry reg;
    reg.add("door");
    std::istringstream in("0,door,1\n1,door,maybe\n");
    std::ostringstream out;
    try {
      (void)replay_reports(in, out, reg);
      assert(false);
    } catch (const std::runtime_error& e) {
      assert(std::string(e.what()).find("line 2:") == 0);
    }
  }

  // Snapshots, in name order.
  {
    SignalRegistry reg;
    reg.add("window", true);
    reg.add("door", false);

    std::ostringstream text;
    write_snapshot(text, reg, false);
    assert(text.str() == "door=0\nwindow=1\n");

    std::ostringstream json;
    write_snapshot(json, reg, true);
    assert(json.str() == "{\"door\":false,\"window\":true}\n");

    SignalRegistry empty;
    std::ostringstream none;
    write_snapshot(none, empty, true);
    assert(none.str() == "{}\n");
  }

  // --signal NAME[=VALUE]
  {
    const auto a = parse_signal_assignment("door");
    assert(a.first == "door" && a.second == false);
    const auto b = parse_signal_assignment(" window = on ");
    assert(b.first == "window" && b.second == true);
    assert(throws<std::runtime_error>([] { (void)parse_signal_assignment("=1"); }));
    assert(throws<std::runtime_error>([] { (void)parse_signal_assignment("  "); }));
    assert(throws<std::runtime_error>([] { (void)parse_signal_assignment("door=maybe"); }));
  }

  std::cout << "test_replay: OK\n";
  return 0;
}

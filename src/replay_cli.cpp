#include "boolstab/report_stream.hpp"
#include "boolstab/signal_registry.hpp"
#include "boolstab/utils.hpp"
#include "boolstab/version.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace boolstab;

struct Args {
  SignalConfig defaults;

  // Signals registered before the stream starts: name -> initial value.
  std::vector<std::pair<std::string, bool>> signals;

  // Register unknown names on first report (initial value false) instead of
  // failing.
  bool auto_add{false};

  bool changes_only{false};
  bool json{false};
  bool verbose{false};
};

static void print_help() {
  std::cout
    << "boolstab_replay_cli (replay boolean reports through stabilized signals)\n\n"
    << "Reads report lines from stdin and writes a CSV trace to stdout:\n"
    << "  input:  time,name,value[,force]     (value/force: 1/0, true/false, on/off)\n"
    << "  output: time,name,raw,value,pending_count\n"
    << "          followed by the final snapshot (name=0|1 lines, or JSON with --json)\n\n"
    << "Usage:\n"
    << "  boolstab_replay_cli --signal door --count 3 < reports.csv\n"
    << "  boolstab_replay_cli --auto-add --count-f2t 2 --count-t2f 5 --changes-only < reports.csv\n\n"
    << "Options:\n"
    << "  --count N               Consecutive reports required (default: 1)\n"
    << "  --duration SEC          Seconds a candidate must persist (default: 0)\n"
    << "  --count-f2t N           Count override for false->true\n"
    << "  --count-t2f N           Count override for true->false\n"
    << "  --duration-f2t SEC      Duration override for false->true\n"
    << "  --duration-t2f SEC      Duration override for true->false\n"
    << "  --mode MODE             both | true_to_false | false_to_true | none (default: both)\n"
    << "  --signal NAME[=VALUE]   Register a signal before replay (initial VALUE default: false)\n"
    << "  --auto-add              Register unknown names on first report\n"
    << "  --changes-only          Only print rows where the committed value changed\n"
    << "  --json                  Print the final snapshot as JSON instead of name=value lines\n"
    << "  --verbose               Log per-signal state to stderr\n"
    << "  --version               Print version and exit\n"
    << "  -h, --help              Show this help\n";
}

static Args parse_args(int argc, char** argv) {
  Args a;
  ThresholdSet& t = a.defaults.thresholds;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << version_string() << "\n";
      std::exit(0);
    } else if (arg == "--count" && i + 1 < argc) {
      t.count_threshold = to_int(argv[++i]);
    } else if (arg == "--duration" && i + 1 < argc) {
      t.duration_threshold = to_double(argv[++i]);
    } else if (arg == "--count-f2t" && i + 1 < argc) {
      t.count_threshold_false_to_true = to_int(argv[++i]);
    } else if (arg == "--count-t2f" && i + 1 < argc) {
      t.count_threshold_true_to_false = to_int(argv[++i]);
    } else if (arg == "--duration-f2t" && i + 1 < argc) {
      t.duration_threshold_false_to_true = to_double(argv[++i]);
    } else if (arg == "--duration-t2f" && i + 1 < argc) {
      t.duration_threshold_true_to_false = to_double(argv[++i]);
    } else if (arg == "--mode" && i + 1 < argc) {
      a.defaults.buffer_mode = parse_buffer_mode(argv[++i]);
    } else if (arg == "--signal" && i + 1 < argc) {
      a.signals.push_back(parse_signal_assignment(argv[++i]));
    } else if (arg == "--auto-add") {
      a.auto_add = true;
    } else if (arg == "--changes-only") {
      a.changes_only = true;
    } else if (arg == "--json") {
      a.json = true;
    } else if (arg == "--verbose") {
      a.verbose = true;
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

int main(int argc, char** argv) {
  try {
    const Args args = parse_args(argc, argv);
    if (args.signals.empty() && !args.auto_add) {
      print_help();
      throw std::runtime_error("At least one --signal (or --auto-add) is required");
    }

    SignalRegistry reg(args.defaults);
    for (const auto& s : args.signals) {
      reg.add(s.first, s.second);
    }

    if (args.verbose) {
      std::cerr << "Defaults: mode=" << buffer_mode_name(args.defaults.buffer_mode) << " "
                << describe_thresholds(args.defaults.thresholds) << "\n";
      for (const auto& name : reg.names()) {
        std::cerr << "  " << to_string(reg.get(name)) << "\n";
      }
    }

    ReplayOptions opt;
    opt.auto_add = args.auto_add;
    opt.changes_only = args.changes_only;
    if (args.verbose) opt.log = &std::cerr;

    const ReplayStats st = replay_reports(std::cin, std::cout, reg, opt);

    if (args.verbose) {
      std::cerr << "Processed " << st.reports << " reports, " << st.changes
                << " committed changes, " << reg.size() << " signals ("
                << st.added << " added)\n";
      std::cerr << "Final values:\n";
    }
    write_snapshot(std::cout, reg, args.json);
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    std::cerr << "Run with --help for usage.\n";
    return 1;
  }
}

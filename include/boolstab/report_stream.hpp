#pragma once

#include "boolstab/signal_registry.hpp"
#include "boolstab/stabilized_signal.hpp"

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>

namespace boolstab {

// One observation from a textual report stream.
struct ReportLine {
  double time_seconds{0.0};
  std::string name;
  bool value{false};
  bool force_immediate{false};
};

// Parse a line of the form:
//
//   time,name,value[,force]
//
// Fields may be separated by commas, tabs, or runs of spaces. `value` and
// `force` accept 1/0, true/false, on/off, yes/no.
//
// Returns std::nullopt for blank lines and '#' comments. Throws
// std::runtime_error for malformed lines.
std::optional<ReportLine> parse_report_line(const std::string& line);

// Parse "NAME" or "NAME=VALUE" (VALUE as in to_bool(), default false).
// Throws std::runtime_error if NAME is empty.
std::pair<std::string, bool> parse_signal_assignment(const std::string& s);

// Trace CSV: time,name,raw,value,pending_count
//
// write_trace_header() also sets 12 significant digits on `out` so that
// epoch-scale timestamps keep their sub-second part.
void write_trace_header(std::ostream& out);
void write_trace_row(std::ostream& out, const ReportLine& r, const StabilizedSignal& s);

// Final committed values, one "name=0|1" line per signal, or a single JSON
// object {"name":true,...} when json is set. Names are in registry order.
void write_snapshot(std::ostream& out, const SignalRegistry& reg, bool json);

struct ReplayOptions {
  // Register unknown names on first report (initial value false) instead of
  // throwing NotFoundError.
  bool auto_add{false};

  // Only write trace rows whose report changed the committed value.
  bool changes_only{false};

  // Optional progress log (signals added, committed changes).
  std::ostream* log{nullptr};
};

struct ReplayStats {
  std::size_t lines{0};
  std::size_t reports{0};
  std::size_t changes{0};
  std::size_t added{0};
};

// Feed every report line from `in` through `reg`, writing the trace header and
// rows to `trace`. Parse errors are rethrown as std::runtime_error prefixed
// with the line number.
ReplayStats replay_reports(std::istream& in, std::ostream& trace, SignalRegistry& reg,
                           const ReplayOptions& opt = ReplayOptions{});

} // namespace boolstab

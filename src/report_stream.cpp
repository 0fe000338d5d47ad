#include "boolstab/report_stream.hpp"

#include "boolstab/utils.hpp"

#include <cmath>
#include <iomanip>
#include <istream>
#include <map>
#include <ostream>
#include <stdexcept>
#include <vector>

namespace boolstab {

std::optional<ReportLine> parse_report_line(const std::string& line) {
  const std::string t = trim(line);
  if (t.empty() || t[0] == '#') return std::nullopt;

  std::vector<std::string> fields;
  if (t.find(',') != std::string::npos) {
    fields = split(t, ',');
  } else if (t.find('\t') != std::string::npos) {
    fields = split(t, '\t');
  } else {
    fields = split_whitespace(t);
  }
  for (auto& f : fields) f = trim(f);

  if (fields.size() < 3 || fields.size() > 4) {
    throw std::runtime_error("Malformed report line (expected time,name,value[,force]): '" + line + "'");
  }

  ReportLine r;
  r.time_seconds = to_double(fields[0]);
  if (!std::isfinite(r.time_seconds)) {
    throw std::runtime_error("Report time must be finite: '" + line + "'");
  }
  r.name = fields[1];
  if (r.name.empty()) {
    throw std::runtime_error("Report line has an empty signal name: '" + line + "'");
  }
  r.value = to_bool(fields[2]);
  if (fields.size() == 4) r.force_immediate = to_bool(fields[3]);
  return r;
}

std::pair<std::string, bool> parse_signal_assignment(const std::string& s) {
  const size_t eq = s.find('=');
  const std::string name = trim(eq == std::string::npos ? s : s.substr(0, eq));
  if (name.empty()) {
    throw std::runtime_error("Signal name must not be empty: '" + s + "'");
  }
  if (eq == std::string::npos) return {name, false};
  return {name, to_bool(s.substr(eq + 1))};
}

void write_trace_header(std::ostream& out) {
  out << std::setprecision(12);
  out << "time,name,raw,value,pending_count\n";
}

void write_trace_row(std::ostream& out, const ReportLine& r, const StabilizedSignal& s) {
  out << r.time_seconds << "," << r.name << ","
      << (r.value ? 1 : 0) << "," << (s.value() ? 1 : 0) << ","
      << s.pending_count() << "\n";
}

void write_snapshot(std::ostream& out, const SignalRegistry& reg, bool json) {
  const std::map<std::string, bool> values = reg.get_all_values();
  if (json) {
    out << "{";
    bool first = true;
    for (const auto& kv : values) {
      if (!first) out << ",";
      first = false;
      out << "\"" << json_escape(kv.first) << "\":" << (kv.second ? "true" : "false");
    }
    out << "}\n";
    return;
  }
  for (const auto& kv : values) {
    out << kv.first << "=" << (kv.second ? 1 : 0) << "\n";
  }
}

ReplayStats replay_reports(std::istream& in, std::ostream& trace, SignalRegistry& reg,
                           const ReplayOptions& opt) {
  ReplayStats st;
  write_trace_header(trace);

  std::string line;
  while (std::getline(in, line)) {
    ++st.lines;
    std::optional<ReportLine> r;
    try {
      r = parse_report_line(line);
    } catch (const std::exception& e) {
      throw std::runtime_error("line " + std::to_string(st.lines) + ": " + e.what());
    }
    if (!r) continue;

    StabilizedSignal* sig = reg.find(r->name);
    if (!sig) {
      if (!opt.auto_add) throw NotFoundError(r->name);
      sig = &reg.add(r->name, false);
      ++st.added;
      if (opt.log) {
        *opt.log << "Added signal '" << r->name << "' on line " << st.lines << "\n";
      }
    }

    const bool before = sig->value();
    const bool after = sig->report(r->value, r->time_seconds, r->force_immediate);
    ++st.reports;

    const bool changed = before != after;
    if (changed) ++st.changes;
    if (changed || !opt.changes_only) {
      write_trace_row(trace, *r, *sig);
    }
    if (opt.log && changed) {
      *opt.log << "[" << r->time_seconds << "] " << r->name << " -> "
               << (after ? "true" : "false") << "\n";
    }
  }
  return st;
}

} // namespace boolstab

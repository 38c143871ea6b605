#include "SessionSummary.hpp"

#include <algorithm>
#include <cstdio>

using nlohmann::json;

SessionSummary finalize(const std::vector<Repetition>& history) {
  SessionSummary s;
  s.reps = history;
  s.total = static_cast<int>(history.size());

  std::map<std::string, double> sums;
  for (const auto& rep : history) {
    if (rep.verdict == Verdict::Good) {
      ++s.good;
    } else {
      ++s.bad;
      for (const auto& v : rep.violations) ++s.violation_histogram[v];
    }

    for (const auto& kv : rep.extreme_metrics) {
      MetricStats& st = s.extreme_stats[kv.first];
      if (st.samples == 0) {
        st.min = st.max = kv.second;
      } else {
        st.min = std::min(st.min, kv.second);
        st.max = std::max(st.max, kv.second);
      }
      ++st.samples;
      sums[kv.first] += kv.second;
    }
  }

  for (auto& kv : s.extreme_stats) {
    kv.second.average = static_cast<float>(sums[kv.first] / kv.second.samples);
  }
  return s;
}

std::string formatDuration(int64_t ms) {
  if (ms < 0) ms = 0;
  int64_t secs = ms / 1000;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld",
                static_cast<long long>(secs / 3600),
                static_cast<long long>((secs % 3600) / 60),
                static_cast<long long>(secs % 60));
  return buf;
}

void to_json(json& j, const Repetition& r) {
  j = json{
    {"start_frame", r.start_frame},
    {"end_frame", r.end_frame},
    {"start_ms", r.start_ms},
    {"end_ms", r.end_ms},
    {"verdict", verdictName(r.verdict)},
    {"violations", r.violations},
    {"feedback", r.feedback},
    {"extreme_value", r.extreme_value},
    {"extreme_metrics", r.extreme_metrics},
  };
}

void to_json(json& j, const FrameDiagnostics& d) {
  j = json{
    {"frames_seen", d.frames_seen},
    {"malformed_frames", d.malformed_frames},
    {"held_frames", d.held_frames},
    {"unavailable_metrics", d.unavailable_metrics},
    {"dropped_frames", d.dropped_frames},
    {"aborted_cycles", d.aborted_cycles},
  };
}

void to_json(json& j, const SessionSummary& s) {
  json angles = json::object();
  for (const auto& kv : s.extreme_stats) {
    angles[kv.first] = {
      {"average", kv.second.average},
      {"min", kv.second.min},
      {"max", kv.second.max},
    };
  }

  j = json{
    {"exercise", s.exercise},
    {"session_info", {
      {"duration_ms", s.duration_ms},
      {"duration", formatDuration(s.duration_ms)},
    }},
    {"reps", {
      {"total", s.total},
      {"good", s.good},
      {"bad", s.bad},
    }},
    {"violation_histogram", s.violation_histogram},
    {"repetitions", s.reps},
    {"angles", angles},
    {"diagnostics", s.diagnostics},
  };
}

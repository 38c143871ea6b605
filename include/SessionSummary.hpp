#pragma once
#include "RepStateMachine.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct FrameDiagnostics {
  int64_t frames_seen = 0;
  int64_t malformed_frames = 0;      // skipped before analysis
  int64_t held_frames = 0;           // driver metric unavailable
  int64_t unavailable_metrics = 0;   // metric readings rejected for confidence or missing joints
  int64_t dropped_frames = 0;        // never reached the analyzer (full queue)
  int64_t aborted_cycles = 0;        // left start but came back without reaching the extreme
};

struct MetricStats {
  int samples = 0;
  float average = 0.0f;
  float min = 0.0f;
  float max = 0.0f;
};

struct SessionSummary {
  std::string exercise;
  int total = 0;
  int good = 0;
  int bad = 0;
  std::map<std::string, int> violation_histogram;   // over bad reps only
  std::vector<Repetition> reps;
  std::map<std::string, MetricStats> extreme_stats; // per metric, at each rep's deepest frame
  int64_t duration_ms = 0;
  FrameDiagnostics diagnostics;
};

// Pure over the history. Safe to call mid-session.
SessionSummary finalize(const std::vector<Repetition>& history);

// HH:MM:SS
std::string formatDuration(int64_t ms);

void to_json(nlohmann::json& j, const Repetition& r);
void to_json(nlohmann::json& j, const FrameDiagnostics& d);
void to_json(nlohmann::json& j, const SessionSummary& s);

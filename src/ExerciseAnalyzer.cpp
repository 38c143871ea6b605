#include "ExerciseAnalyzer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <utility>

using nlohmann::json;

const char* frameStatusName(FrameStatus s) {
  switch (s) {
    case FrameStatus::Analyzed:  return "analyzed";
    case FrameStatus::Held:      return "held";
    case FrameStatus::Malformed: return "malformed";
  }
  return "unknown";
}

void to_json(json& j, const TickResult& r) {
  j = json{
    {"frame", r.frame},
    {"t_ms", r.t_ms},
    {"status", frameStatusName(r.status)},
    {"phase", r.phase_name},
    {"reps", r.total_reps},
    {"feedback", r.feedback},
    {"violations", r.violations},
    {"side", sideName(r.side)},
  };
  if (r.driver_available) j["driver_value"] = r.driver_value;
  if (r.rep_completed) j["rep"] = r.rep;
  if (r.cycle_aborted) j["aborted"] = true;
}

ExerciseAnalyzer::ExerciseAnalyzer(ThresholdSet ts)
  : machine_(std::move(ts)),
    feedback_(machine_.thresholds().feedback_messages,
              machine_.thresholds().feedback_cooldown_ms) {
  spdlog::info("Session started for {} (debounce {} frames, driver {})",
               thresholds().exercise, thresholds().debounce_frames,
               thresholds().driver_metric);
}

std::string ExerciseAnalyzer::malformedReason(const LandmarkFrame& f) const {
  if (f.joints.empty()) return "no landmarks";
  if (has_last_index_ && f.index <= last_index_) {
    return "frame index " + std::to_string(f.index) + " not after " + std::to_string(last_index_);
  }
  for (const auto& kv : f.joints) {
    const Landmark& l = kv.second;
    if (!std::isfinite(l.x) || !std::isfinite(l.y) || !std::isfinite(l.z)) {
      return std::string("non-finite coordinate for ") + jointName(kv.first);
    }
    if (!(l.confidence >= 0.0f && l.confidence <= 1.0f)) {
      return std::string("confidence out of range for ") + jointName(kv.first);
    }
  }
  return std::string();
}

TickResult ExerciseAnalyzer::tick(const LandmarkFrame& f) {
  const ThresholdSet& ts = thresholds();
  ++diag_.frames_seen;

  TickResult r;
  r.frame = f.index;
  r.t_ms = f.t_ms;

  std::string why = malformedReason(f);
  if (!why.empty()) {
    ++diag_.malformed_frames;
    spdlog::debug("{}: skipping frame {}: {}", ts.exercise, f.index, why);
    r.status = FrameStatus::Malformed;
    r.phase = machine_.phase();
    r.phase_name = ts.phaseName(r.phase);
    r.total_reps = machine_.totalReps();
    return r;
  }

  has_last_index_ = true;
  last_index_ = f.index;
  if (!has_time_) {
    has_time_ = true;
    first_ms_ = f.t_ms;
  }
  last_ms_ = f.t_ms;

  r.side = facingSide(f);

  RepInput in;
  in.frame = f.index;
  in.t_ms = f.t_ms;
  in.metrics = ts.measure(f, r.side);
  for (const auto& kv : in.metrics) {
    if (!kv.second.ok()) ++diag_.unavailable_metrics;
  }

  const Measurement& driver = in.metrics[ts.driver_metric];
  r.driver_available = driver.ok();
  r.driver_value = driver.value;

  in.classification = classify(driver, ts, machine_.phase());
  if (in.classification.held) {
    ++diag_.held_frames;
    r.status = FrameStatus::Held;
    spdlog::debug("{}: frame {} held, {} {}", ts.exercise, f.index, ts.driver_metric,
                  metricStatusName(driver.status));
  }

  RepEvent ev = machine_.update(in);

  r.phase = ev.phase;
  r.phase_name = ts.phaseName(ev.phase);
  r.total_reps = ev.total_reps;
  r.violations = ev.violations;

  std::set<std::string> shown = ev.violations;
  if (ev.aborted) {
    ++diag_.aborted_cycles;
    r.cycle_aborted = true;
    shown.insert(ts.shallowCycleName());
  }
  r.feedback = feedback_.update(shown, f.t_ms);

  r.rep_completed = ev.completed;
  if (ev.completed) {
    Repetition rep = ev.rep;
    for (const auto& v : rep.violations) {
      std::string text = feedback_.messageFor(v);
      if (std::find(rep.feedback.begin(), rep.feedback.end(), text) == rep.feedback.end()) {
        rep.feedback.push_back(text);
      }
    }
    reps_.push_back(rep);
    r.rep = rep;
  }
  return r;
}

SessionSummary ExerciseAnalyzer::summary() const {
  SessionSummary s = finalize(reps_);
  s.exercise = thresholds().exercise;
  s.duration_ms = has_time_ ? last_ms_ - first_ms_ : 0;
  s.diagnostics = diag_;
  return s;
}

#pragma once
#include "FeedbackGenerator.hpp"
#include "Landmark.hpp"
#include "RepStateMachine.hpp"
#include "SessionSummary.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <set>
#include <string>
#include <vector>

enum class FrameStatus {
  Analyzed,
  Held,        // driver metric unavailable, phase carried over
  Malformed    // frame rejected, nothing updated but the diagnostics
};

const char* frameStatusName(FrameStatus s);

struct TickResult {
  int64_t frame = 0;
  int64_t t_ms = 0;
  FrameStatus status = FrameStatus::Analyzed;

  Phase phase = Phase::Start;
  std::string phase_name;
  int total_reps = 0;

  std::vector<std::string> feedback;
  std::set<std::string> violations;

  bool rep_completed = false;
  Repetition rep;
  bool cycle_aborted = false;   // back at start without reaching the extreme

  bool driver_available = false;
  float driver_value = 0.0f;
  Side side = Side::Left;
};

void to_json(nlohmann::json& j, const TickResult& r);

// One exercise session. Not thread-safe: tick() calls must be serialized by
// the caller.
class ExerciseAnalyzer {
public:
  // Throws ConfigError if the set does not validate.
  explicit ExerciseAnalyzer(ThresholdSet ts);

  TickResult tick(const LandmarkFrame& f);

  SessionSummary summary() const;

  // Completed reps, with the feedback text of their violations.
  const std::vector<Repetition>& history() const { return reps_; }
  const FrameDiagnostics& diagnostics() const { return diag_; }
  const ThresholdSet& thresholds() const { return machine_.thresholds(); }

  Phase phase() const { return machine_.phase(); }
  int totalReps() const { return machine_.totalReps(); }

  void addDroppedFrames(int64_t n) { diag_.dropped_frames += n; }

private:
  RepStateMachine machine_;
  FeedbackGenerator feedback_;
  FrameDiagnostics diag_;
  std::vector<Repetition> reps_;

  bool has_last_index_ = false;
  int64_t last_index_ = 0;

  bool has_time_ = false;
  int64_t first_ms_ = 0;
  int64_t last_ms_ = 0;

  // Empty when the frame is usable, otherwise why it is not.
  std::string malformedReason(const LandmarkFrame& f) const;
};

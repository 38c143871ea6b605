#pragma once
#include "PhaseClassifier.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

enum class Verdict { Good, Bad };

const char* verdictName(Verdict v);

struct Repetition {
  int64_t start_frame = 0;   // first frame of the run that left the start phase
  int64_t end_frame = 0;     // frame on which the return to start was accepted
  int64_t start_ms = 0;
  int64_t end_ms = 0;
  Verdict verdict = Verdict::Good;
  std::set<std::string> violations;
  std::vector<std::string> feedback;   // display text for the violations

  // Driver metric at the deepest point of the rep, and every other available
  // metric on that same frame.
  float extreme_value = 0.0f;
  std::map<std::string, float> extreme_metrics;

  bool operator==(const Repetition& o) const {
    return start_frame == o.start_frame && end_frame == o.end_frame &&
           start_ms == o.start_ms && end_ms == o.end_ms &&
           verdict == o.verdict && violations == o.violations && feedback == o.feedback &&
           extreme_value == o.extreme_value && extreme_metrics == o.extreme_metrics;
  }
};

// One tick as the state machine sees it.
struct RepInput {
  int64_t frame = 0;
  int64_t t_ms = 0;
  Classification classification;
  MetricValues metrics;
};

struct RepEvent {
  bool completed = false;
  bool phase_changed = false;
  bool aborted = false;               // returned to start without reaching the extreme
  int total_reps = 0;
  Phase phase = Phase::Start;
  std::set<std::string> violations;   // bounds violated on this tick, within a rep
  Repetition rep;                     // set when completed
};

// Debounced phase tracker and repetition counter. A candidate phase must be
// reported debounce_frames ticks in a row before it is accepted. A rep is
// counted when the accepted phase returns to start after visiting the extreme.
// Bounds are checked against the classified phase of each frame, so the
// debounce delay never shifts which constraints apply.
class RepStateMachine {
public:
  // Throws ConfigError if ts does not validate.
  explicit RepStateMachine(ThresholdSet ts);

  RepEvent update(const RepInput& in);

  Phase phase() const { return accepted_; }
  int candidateFrames() const { return candidate_count_; }
  int64_t phaseEnterFrame() const { return phase_enter_frame_; }

  bool repInProgress() const { return in_rep_; }
  bool visitedExtreme() const { return visited_extreme_; }
  const std::set<std::string>& activeViolations() const { return active_; }

  int totalReps() const { return static_cast<int>(history_.size()); }
  int abortedCycles() const { return aborted_; }
  int heldTicks() const { return held_; }
  const std::vector<Repetition>& history() const { return history_; }

  const ThresholdSet& thresholds() const { return ts_; }

  void reset();

private:
  ThresholdSet ts_;

  Phase accepted_ = Phase::Start;
  int64_t phase_enter_frame_ = 0;

  Phase candidate_ = Phase::Start;
  int candidate_count_ = 0;
  int64_t candidate_frame_ = 0;
  int64_t candidate_ms_ = 0;

  bool in_rep_ = false;
  bool visited_extreme_ = false;
  std::set<std::string> active_;
  std::set<std::string> pending_;   // violations of a run leaving start, not yet accepted
  int64_t rep_start_frame_ = 0;
  int64_t rep_start_ms_ = 0;

  bool has_deepest_ = false;
  float deepest_ = 0.0f;
  std::map<std::string, float> deepest_metrics_;

  std::vector<Repetition> history_;
  int aborted_ = 0;
  int held_ = 0;

  void accept(Phase p, const RepInput& in, RepEvent& ev);
  void beginRep();
  void trackDeepest(const MetricValues& metrics);
};

#include "RepStateMachine.hpp"

#include <spdlog/spdlog.h>
#include <utility>

const char* verdictName(Verdict v) {
  return v == Verdict::Good ? "GOOD" : "BAD";
}

RepStateMachine::RepStateMachine(ThresholdSet ts) : ts_(std::move(ts)) {
  ts_.validate();
}

void RepStateMachine::reset() {
  accepted_ = Phase::Start;
  phase_enter_frame_ = 0;
  candidate_ = Phase::Start;
  candidate_count_ = 0;
  candidate_frame_ = 0;
  candidate_ms_ = 0;
  in_rep_ = false;
  visited_extreme_ = false;
  active_.clear();
  pending_.clear();
  has_deepest_ = false;
  deepest_metrics_.clear();
  history_.clear();
  aborted_ = 0;
  held_ = 0;
}

RepEvent RepStateMachine::update(const RepInput& in) {
  RepEvent ev;

  // Occluded or unreadable driver: keep everything as it is, including the
  // debounce run in progress.
  if (in.classification.held) {
    ++held_;
    ev.total_reps = totalReps();
    ev.phase = accepted_;
    return ev;
  }

  Phase p = in.classification.phase;
  if (p == accepted_) {
    candidate_ = accepted_;
    candidate_count_ = 0;
    pending_.clear();
  } else {
    if (p == candidate_ && candidate_count_ > 0) {
      ++candidate_count_;
    } else {
      candidate_ = p;
      candidate_count_ = 1;
      candidate_frame_ = in.frame;
      candidate_ms_ = in.t_ms;
      pending_.clear();
    }
    if (candidate_count_ >= ts_.debounce_frames) accept(p, in, ev);
  }

  // The accepted phase trails the body by the debounce window; bounds follow
  // the phase this frame was classified in.
  std::set<std::string> found = ts_.violations(in.metrics, p);
  if (in_rep_) {
    active_.insert(found.begin(), found.end());
    trackDeepest(in.metrics);
    ev.violations = found;
  } else if (candidate_count_ > 0) {
    // Leaving start, not yet confirmed. Joins the rep if the run is accepted.
    pending_.insert(found.begin(), found.end());
    ev.violations = found;
  }

  ev.total_reps = totalReps();
  ev.phase = accepted_;
  return ev;
}

void RepStateMachine::accept(Phase p, const RepInput& in, RepEvent& ev) {
  Phase from = accepted_;
  accepted_ = p;
  phase_enter_frame_ = candidate_frame_;
  candidate_count_ = 0;
  ev.phase_changed = true;

  spdlog::debug("{}: phase {} -> {} at frame {}", ts_.exercise,
                ts_.phaseName(from), ts_.phaseName(p), in.frame);

  if (from == Phase::Start) beginRep();
  if (p == Phase::Extreme) visited_extreme_ = true;
  if (p != Phase::Start || !in_rep_) return;

  in_rep_ = false;
  if (!visited_extreme_) {
    ++aborted_;
    ev.aborted = true;
    spdlog::debug("{}: cycle from frame {} never reached {}, not counted",
                  ts_.exercise, rep_start_frame_, ts_.phaseName(Phase::Extreme));
    active_.clear();
    return;
  }

  Repetition rep;
  rep.start_frame = rep_start_frame_;
  rep.end_frame = in.frame;
  rep.start_ms = rep_start_ms_;
  rep.end_ms = in.t_ms;
  rep.violations = active_;
  rep.verdict = active_.empty() ? Verdict::Good : Verdict::Bad;
  rep.extreme_value = deepest_;
  rep.extreme_metrics = deepest_metrics_;
  history_.push_back(rep);

  spdlog::info("{}: rep {} {} (frames {}-{}, {} violation(s))", ts_.exercise,
               history_.size(), verdictName(rep.verdict), rep.start_frame,
               rep.end_frame, rep.violations.size());

  ev.completed = true;
  ev.rep = rep;
  active_.clear();
  visited_extreme_ = false;
}

void RepStateMachine::beginRep() {
  in_rep_ = true;
  visited_extreme_ = false;
  active_ = pending_;
  pending_.clear();
  rep_start_frame_ = candidate_frame_;
  rep_start_ms_ = candidate_ms_;
  has_deepest_ = false;
  deepest_ = 0.0f;
  deepest_metrics_.clear();
}

void RepStateMachine::trackDeepest(const MetricValues& metrics) {
  auto it = metrics.find(ts_.driver_metric);
  if (it == metrics.end() || !it->second.ok()) return;

  float v = it->second.value;
  bool deeper = ts_.decreasing() ? v < deepest_ : v > deepest_;
  if (has_deepest_ && !deeper) return;

  has_deepest_ = true;
  deepest_ = v;
  deepest_metrics_.clear();
  for (const auto& kv : metrics) {
    if (kv.second.ok()) deepest_metrics_[kv.first] = kv.second.value;
  }
}

/*
 * Repetition state machine tests
 */

#include <cstdio>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "RepStateMachine.hpp"
#include "TestHarness.hpp"
#include "ThresholdStore.hpp"

namespace {

struct Step {
  Phase phase;
  bool knee_forward;   // ankle angle below its minimum on this tick
  bool held;
  float hip;
};

// Feeds classifier outputs straight into the machine. Metrics are in-range
// for the bottom of a squat apart from the ankle angle on knee_forward ticks.
class Driver {
public:
  explicit Driver(const ThresholdSet& ts) : machine(ts) {}

  void feed(Phase p, int count, bool knee_forward = false, float hip = 75.0f) {
    for (int i = 0; i < count; ++i) push(Step{p, knee_forward, false, hip});
  }
  void hold() { push(Step{machine.phase(), false, true, 75.0f}); }

  RepStateMachine machine;
  std::vector<RepEvent> events;
  int64_t frame = 0;

private:
  void push(const Step& s) {
    RepInput in;
    in.frame = frame;
    in.t_ms = frame * 33;
    in.classification.phase = s.phase;
    in.classification.held = s.held;
    in.metrics["knee_angle"] = ok(s.phase == Phase::Extreme ? 70.0f : 130.0f);
    in.metrics["hip_angle"] = ok(s.hip);
    in.metrics["ankle_angle"] = ok(s.knee_forward ? 70.0f : 90.0f);
    events.push_back(machine.update(in));
    ++frame;
  }

  static Measurement ok(float v) {
    Measurement m;
    m.status = MetricStatus::Ok;
    m.value = v;
    return m;
  }
};

ThresholdSet squat() {
  return ThresholdStore().load("squat");
}

// UP x5, DESCENDING x3, DOWN x4, ASCENDING x3, UP x3 with the knee metric
// violated on the last two DOWN ticks.
void squatScenario(Driver& d, bool knee_forward) {
  d.feed(Phase::Start, 5);
  d.feed(Phase::TowardExtreme, 3);
  d.feed(Phase::Extreme, 2);
  d.feed(Phase::Extreme, 2, knee_forward);
  d.feed(Phase::TowardStart, 3);
  d.feed(Phase::Start, 3);
}

}  // namespace

bool test_bad_rep_scenario() {
  Driver d(squat());
  squatScenario(d, true);

  const auto& h = d.machine.history();
  TEST_ASSERT(h.size() == 1, "Exactly one repetition expected");
  TEST_ASSERT(h[0].verdict == Verdict::Bad, "Knee violation must make the rep BAD");
  TEST_ASSERT(h[0].violations.size() == 1, "Only one violated metric expected");
  TEST_ASSERT(h[0].violations.count("ankle_angle_min") == 1, "Violation should be the knee metric");
  TEST_ASSERT(h[0].start_frame == 5, "Rep starts with the first DESCENDING frame");
  TEST_ASSERT(h[0].end_frame == 17, "Rep ends when UP is confirmed");
  TEST_ASSERT(d.events.back().completed, "Completion is reported on the confirming tick");
  TEST_ASSERT(d.events.back().total_reps == 1, "Running count should be 1");
  return true;
}

bool test_good_rep_scenario() {
  Driver d(squat());
  squatScenario(d, false);

  const auto& h = d.machine.history();
  TEST_ASSERT(h.size() == 1, "Exactly one repetition expected");
  TEST_ASSERT(h[0].verdict == Verdict::Good, "Clean rep must be GOOD");
  TEST_ASSERT(h[0].violations.empty(), "Clean rep has no violations");
  TEST_ASSERT(h[0].extreme_value == 70.0f, "Deepest knee angle should be recorded");
  return true;
}

bool test_bottom_frames_before_acceptance() {
  Driver d(squat());
  d.feed(Phase::Start, 5);
  d.feed(Phase::TowardExtreme, 3);
  d.feed(Phase::Extreme, 2, true);   // DOWN not yet accepted
  d.feed(Phase::Extreme, 2);
  d.feed(Phase::TowardStart, 3);
  d.feed(Phase::Start, 3);

  TEST_ASSERT(d.events[8].violations.count("ankle_angle_min") == 1,
              "First bottom frame is checked against the bottom bounds");
  const auto& h = d.machine.history();
  TEST_ASSERT(h.size() == 1, "Exactly one repetition expected");
  TEST_ASSERT(h[0].verdict == Verdict::Bad, "Early bottom violation makes the rep BAD");
  return true;
}

bool test_rising_frames_use_their_own_bounds() {
  Driver d(squat());
  d.feed(Phase::Start, 5, false, 170.0f);
  d.feed(Phase::TowardExtreme, 3, false, 120.0f);
  d.feed(Phase::Extreme, 4);
  d.feed(Phase::TowardStart, 3, false, 120.0f);   // hip opens while DOWN is still accepted
  d.feed(Phase::Start, 3, false, 170.0f);

  TEST_ASSERT(d.events[12].phase == Phase::Extreme, "DOWN still accepted on frame 12");
  TEST_ASSERT(d.events[12].violations.empty(), "Rising frame is not held to the bottom hip range");
  TEST_ASSERT(d.machine.history().size() == 1, "One repetition expected");
  TEST_ASSERT(d.machine.history()[0].verdict == Verdict::Good, "Opening hips keep the rep GOOD");
  return true;
}

bool test_debounce_delays_acceptance() {
  Driver d(squat());
  d.feed(Phase::Start, 2);
  d.feed(Phase::TowardExtreme, 2);
  TEST_ASSERT(d.machine.phase() == Phase::Start, "Two frames are not enough to accept");
  TEST_ASSERT(d.machine.candidateFrames() == 2, "Candidate run should be counted");

  d.feed(Phase::TowardExtreme, 1);
  TEST_ASSERT(d.machine.phase() == Phase::TowardExtreme, "Third frame accepts the phase");
  TEST_ASSERT(d.events.back().phase_changed, "Acceptance is reported as a phase change");
  TEST_ASSERT(d.machine.phaseEnterFrame() == 2, "Phase entry is the first frame of the run");
  return true;
}

bool test_flicker_at_extreme_is_not_counted() {
  Driver d(squat());
  d.feed(Phase::Start, 5);
  d.feed(Phase::TowardExtreme, 3);
  for (int i = 0; i < 4; ++i) {
    d.feed(Phase::Extreme, 2);
    d.feed(Phase::TowardExtreme, 1);
  }
  d.feed(Phase::Start, 5);

  TEST_ASSERT(d.machine.totalReps() == 0, "Unconfirmed extreme must not count a rep");
  TEST_ASSERT(d.machine.abortedCycles() == 1, "The shallow cycle is counted as aborted");
  int aborted_events = 0;
  for (const auto& ev : d.events) aborted_events += ev.aborted ? 1 : 0;
  TEST_ASSERT(aborted_events == 1, "Exactly one tick reports the aborted cycle");
  TEST_ASSERT(d.events[d.events.size() - 3].aborted, "Reported when UP is confirmed");
  TEST_ASSERT(!d.machine.repInProgress(), "Back at start nothing is in progress");
  return true;
}

bool test_twitch_from_start_is_not_counted() {
  Driver d(squat());
  d.feed(Phase::Start, 5);
  d.feed(Phase::Extreme, 2);
  d.feed(Phase::Start, 5);
  d.feed(Phase::TowardExtreme, 1);
  d.feed(Phase::Extreme, 1);
  d.feed(Phase::Start, 3);

  TEST_ASSERT(d.machine.totalReps() == 0, "Short spikes must not count");
  TEST_ASSERT(d.machine.phase() == Phase::Start, "Phase never left UP");
  for (const auto& ev : d.events) {
    TEST_ASSERT(!ev.phase_changed, "No phase change expected");
  }
  return true;
}

bool test_violation_is_sticky_within_rep() {
  Driver d(squat());

  d.feed(Phase::Start, 5);
  d.feed(Phase::TowardExtreme, 3);
  d.feed(Phase::TowardExtreme, 1, true);   // one frame of knee travel mid-descent
  d.feed(Phase::TowardExtreme, 2);
  d.feed(Phase::Extreme, 4);
  d.feed(Phase::TowardStart, 3);
  TEST_ASSERT(d.machine.activeViolations().count("ankle_angle_min") == 1,
              "Violation stays active after the knee realigns");
  d.feed(Phase::Start, 3);

  const auto& h = d.machine.history();
  TEST_ASSERT(h.size() == 1, "One repetition expected");
  TEST_ASSERT(h[0].verdict == Verdict::Bad, "Single violating frame taints the rep");
  TEST_ASSERT(d.machine.activeViolations().empty(), "Accumulator resets after the boundary");
  return true;
}

bool test_violation_while_leaving_start() {
  Driver d(squat());
  d.feed(Phase::Start, 5);
  d.feed(Phase::TowardExtreme, 1, true);   // first frame of the run, UP still accepted
  d.feed(Phase::TowardExtreme, 2);
  d.feed(Phase::Extreme, 4);
  d.feed(Phase::TowardStart, 3);
  d.feed(Phase::Start, 3);

  TEST_ASSERT(d.events[5].phase == Phase::Start, "Run not yet accepted on frame 5");
  TEST_ASSERT(d.machine.history().size() == 1, "One repetition expected");
  TEST_ASSERT(d.machine.history()[0].start_frame == 5, "Rep starts with the run");
  TEST_ASSERT(d.machine.history()[0].verdict == Verdict::Bad,
              "Violation on the run's first frame belongs to the rep");
  return true;
}

bool test_violations_reset_between_reps() {
  Driver d(squat());
  squatScenario(d, true);
  squatScenario(d, false);

  const auto& h = d.machine.history();
  TEST_ASSERT(h.size() == 2, "Two repetitions expected");
  TEST_ASSERT(h[0].verdict == Verdict::Bad, "First rep is BAD");
  TEST_ASSERT(h[1].verdict == Verdict::Good, "Second rep starts clean");
  return true;
}

bool test_held_ticks_do_not_disturb() {
  Driver d(squat());
  d.feed(Phase::Start, 5);
  d.feed(Phase::TowardExtreme, 2);
  d.hold();
  d.feed(Phase::TowardExtreme, 1);
  TEST_ASSERT(d.machine.phase() == Phase::TowardExtreme,
              "Hold neither advances nor resets the debounce run");

  d.feed(Phase::Extreme, 3);
  d.hold();
  d.feed(Phase::Extreme, 1);
  d.feed(Phase::TowardStart, 3);
  d.feed(Phase::Start, 3);

  TEST_ASSERT(d.machine.totalReps() == 1, "Rep survives held ticks");
  TEST_ASSERT(d.machine.heldTicks() == 2, "Held ticks are counted");
  return true;
}

bool test_replay_is_deterministic() {
  Driver a(squat());
  Driver b(squat());
  for (Driver* d : {&a, &b}) {
    squatScenario(*d, true);
    squatScenario(*d, false);
    d->feed(Phase::TowardExtreme, 3);
    d->feed(Phase::Start, 3);
    squatScenario(*d, true);
  }
  TEST_ASSERT(a.machine.history() == b.machine.history(), "Identical input must give identical history");
  TEST_ASSERT(a.machine.totalReps() == 3, "Three counted reps expected");
  return true;
}

bool test_reset() {
  Driver d(squat());
  squatScenario(d, true);
  d.machine.reset();
  TEST_ASSERT(d.machine.totalReps() == 0, "Reset clears the history");
  TEST_ASSERT(d.machine.phase() == Phase::Start, "Reset returns to the start phase");
  return true;
}

bool test_invalid_thresholds_refused() {
  ThresholdSet ts = squat();
  ts.debounce_frames = 0;
  bool threw = false;
  try {
    RepStateMachine m(ts);
  } catch (const ConfigError&) {
    threw = true;
  }
  TEST_ASSERT(threw, "Machine must refuse an invalid threshold set");
  return true;
}

int main() {
  spdlog::set_level(spdlog::level::warn);

  printf("Repetition State Machine Test Suite\n");
  printf("===================================\n\n");

  int total = 0, passed = 0, failed = 0;

  RUN_TEST(test_bad_rep_scenario);
  RUN_TEST(test_good_rep_scenario);
  RUN_TEST(test_bottom_frames_before_acceptance);
  RUN_TEST(test_rising_frames_use_their_own_bounds);
  RUN_TEST(test_debounce_delays_acceptance);
  RUN_TEST(test_flicker_at_extreme_is_not_counted);
  RUN_TEST(test_twitch_from_start_is_not_counted);
  RUN_TEST(test_violation_is_sticky_within_rep);
  RUN_TEST(test_violation_while_leaving_start);
  RUN_TEST(test_violations_reset_between_reps);
  RUN_TEST(test_held_ticks_do_not_disturb);
  RUN_TEST(test_replay_is_deterministic);
  RUN_TEST(test_reset);
  RUN_TEST(test_invalid_thresholds_refused);

  PRINT_RESULTS();
  return (failed == 0) ? 0 : 1;
}

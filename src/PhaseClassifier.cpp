#include "PhaseClassifier.hpp"

namespace {

// "Beyond" means further along the path from the start toward the extreme.
bool beyond(float v, float threshold, bool decreasing) {
  return decreasing ? v < threshold : v > threshold;
}

Classification hold(Phase previous) {
  Classification c;
  c.phase = previous;
  c.held = true;
  return c;
}

}  // namespace

Classification classify(const Measurement& driver, const ThresholdSet& ts, Phase previous) {
  if (!driver.ok()) return hold(previous);

  const float v = driver.value;
  const bool dec = ts.decreasing();

  Classification c;
  c.phase = previous;

  // Leaving the start band needs the stricter leave_start threshold.
  if (previous == Phase::Start && !beyond(v, ts.leave_start_threshold, dec)) {
    return c;
  }

  if (beyond(v, ts.extreme_threshold, dec) ||
      (v == ts.extreme_threshold && previous == Phase::Extreme)) {
    c.phase = Phase::Extreme;
    return c;
  }

  if (beyond(ts.start_threshold, v, dec) ||
      (v == ts.start_threshold && previous == Phase::Start)) {
    c.phase = Phase::Start;
    return c;
  }

  // Between the bands: direction comes from where we were.
  Phase transit = (previous == Phase::Start || previous == Phase::TowardExtreme)
                      ? Phase::TowardExtreme : Phase::TowardStart;
  if (ts.hasPhase(transit)) c.phase = transit;
  return c;
}

Classification classify(const LandmarkFrame& f, const ThresholdSet& ts, Phase previous) {
  auto it = ts.metrics.find(ts.driver_metric);
  if (it == ts.metrics.end()) return hold(previous);
  return classify(it->second.evaluate(f, facingSide(f), ts.visibility_min), ts, previous);
}

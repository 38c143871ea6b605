#include "ThresholdSet.hpp"

#include <algorithm>
#include <cmath>

const char* phaseRoleName(Phase p) {
  switch (p) {
    case Phase::Start:         return "start";
    case Phase::TowardExtreme: return "toward_extreme";
    case Phase::Extreme:       return "extreme";
    case Phase::TowardStart:   return "toward_start";
  }
  return "unknown";
}

bool Constraint::appliesIn(Phase p) const {
  return std::find(phases.begin(), phases.end(), p) != phases.end();
}

std::string violationName(const std::string& metric, bool below_min) {
  return metric + (below_min ? "_min" : "_max");
}

bool ThresholdSet::phaseFromName(const std::string& name, Phase& out) const {
  for (int i = 0; i < 4; ++i) {
    if (!phase_names[i].empty() && phase_names[i] == name) {
      out = static_cast<Phase>(i);
      return true;
    }
  }
  return false;
}

MetricValues ThresholdSet::measure(const LandmarkFrame& f, Side side) const {
  MetricValues values;
  for (const auto& kv : metrics) {
    values[kv.first] = kv.second.evaluate(f, side, visibility_min);
  }
  return values;
}

std::set<std::string> ThresholdSet::violations(const MetricValues& values, Phase p) const {
  std::set<std::string> out;
  for (const auto& c : constraints) {
    if (!c.appliesIn(p)) continue;
    auto it = values.find(c.metric);
    if (it == values.end() || !it->second.ok()) continue;

    float v = it->second.value;
    if (c.bound.has_min && v < c.bound.min) out.insert(violationName(c.metric, true));
    if (c.bound.has_max && v > c.bound.max) out.insert(violationName(c.metric, false));
  }
  return out;
}

void ThresholdSet::validate() const {
  auto fail = [this](const std::string& why) {
    throw ConfigError("exercise '" + exercise + "': " + why);
  };

  if (exercise.empty()) throw ConfigError("threshold set has no exercise name");

  if (!hasPhase(Phase::Start)) fail("missing start phase");
  if (!hasPhase(Phase::Extreme)) fail("missing extreme phase");
  for (int i = 0; i < 4; ++i) {
    for (int k = i + 1; k < 4; ++k) {
      if (!phase_names[i].empty() && phase_names[i] == phase_names[k]) {
        fail("phase name '" + phase_names[i] + "' used twice");
      }
    }
  }

  if (!std::isfinite(start_threshold) || !std::isfinite(leave_start_threshold) ||
      !std::isfinite(extreme_threshold)) {
    fail("state thresholds must be finite");
  }
  if (start_threshold == extreme_threshold) fail("start and extreme thresholds are equal");
  float lo = std::min(start_threshold, extreme_threshold);
  float hi = std::max(start_threshold, extreme_threshold);
  if (leave_start_threshold < lo || leave_start_threshold > hi) {
    fail("leave_start threshold must lie between the start and extreme thresholds");
  }

  if (debounce_frames < 1) fail("debounce_frames must be at least 1");
  if (!(visibility_min >= 0.0f && visibility_min <= 1.0f)) {
    fail("visibility_min must be within [0, 1]");
  }
  if (feedback_cooldown_ms < 0) fail("feedback_cooldown_ms must not be negative");

  for (const auto& kv : metrics) {
    std::string why;
    if (!validateMetric(kv.second, why)) fail("metric '" + kv.first + "': " + why);
  }

  if (driver_metric.empty()) fail("missing driver metric");
  if (metrics.find(driver_metric) == metrics.end()) {
    fail("unknown driver metric '" + driver_metric + "'");
  }

  for (const auto& c : constraints) {
    if (metrics.find(c.metric) == metrics.end()) {
      fail("constraint on unknown metric '" + c.metric + "'");
    }
    if (!c.bound.has_min && !c.bound.has_max) {
      fail("constraint on '" + c.metric + "' has neither min nor max");
    }
    if ((c.bound.has_min && !std::isfinite(c.bound.min)) ||
        (c.bound.has_max && !std::isfinite(c.bound.max))) {
      fail("constraint on '" + c.metric + "' has a non-finite bound");
    }
    if (c.bound.has_min && c.bound.has_max && c.bound.min > c.bound.max) {
      fail("constraint on '" + c.metric + "' has min > max");
    }
    if (c.phases.empty()) fail("constraint on '" + c.metric + "' applies in no phase");
    for (Phase p : c.phases) {
      if (!hasPhase(p)) {
        fail("constraint on '" + c.metric + "' names unused phase role " + phaseRoleName(p));
      }
    }
  }
}

bool ThresholdSet::operator==(const ThresholdSet& o) const {
  return exercise == o.exercise &&
         phase_names == o.phase_names &&
         driver_metric == o.driver_metric &&
         start_threshold == o.start_threshold &&
         leave_start_threshold == o.leave_start_threshold &&
         extreme_threshold == o.extreme_threshold &&
         debounce_frames == o.debounce_frames &&
         visibility_min == o.visibility_min &&
         feedback_cooldown_ms == o.feedback_cooldown_ms &&
         metrics == o.metrics &&
         constraints == o.constraints &&
         feedback_messages == o.feedback_messages;
}

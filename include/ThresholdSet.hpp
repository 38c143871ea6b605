#pragma once
#include "MetricCatalog.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// Roles of the four phases an exercise cycle can have. Each exercise names
// them (UP, DESCENDING, DOWN, ASCENDING for a squat) and may leave either
// transitional role unused.
enum class Phase {
  Start = 0,
  TowardExtreme = 1,
  Extreme = 2,
  TowardStart = 3
};

const char* phaseRoleName(Phase p);

// Thrown when a threshold set cannot be loaded. A session must not start.
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct Bound {
  bool has_min = false;
  bool has_max = false;
  float min = 0.0f;
  float max = 0.0f;

  bool operator==(const Bound& o) const {
    return has_min == o.has_min && has_max == o.has_max &&
           (!has_min || min == o.min) && (!has_max || max == o.max);
  }
};

struct Constraint {
  std::string metric;
  Bound bound;
  std::vector<Phase> phases;   // phases in which the bound is enforced

  bool appliesIn(Phase p) const;

  bool operator==(const Constraint& o) const {
    return metric == o.metric && bound == o.bound && phases == o.phases;
  }
};

// "<metric>_min" when the value fell below the bound, "<metric>_max" above.
std::string violationName(const std::string& metric, bool below_min);

using MetricValues = std::map<std::string, Measurement>;

struct ThresholdSet {
  std::string exercise;
  std::array<std::string, 4> phase_names;   // empty name = role unused

  std::string driver_metric;
  float start_threshold = 150.0f;
  float leave_start_threshold = 120.0f;
  float extreme_threshold = 90.0f;

  int debounce_frames = 3;
  float visibility_min = 0.5f;
  int64_t feedback_cooldown_ms = 1000;

  MetricCatalog metrics;                    // every metric this set references
  std::vector<Constraint> constraints;
  std::map<std::string, std::string> feedback_messages;

  bool hasPhase(Phase p) const { return !phase_names[static_cast<int>(p)].empty(); }
  const std::string& phaseName(Phase p) const { return phase_names[static_cast<int>(p)]; }
  bool phaseFromName(const std::string& name, Phase& out) const;

  // True when the driver metric falls while moving toward the extreme phase
  // (joint angles closing), false when it rises.
  bool decreasing() const { return extreme_threshold < start_threshold; }

  // Reported when a cycle returns to start without reaching the extreme
  // phase, e.g. "knee_angle_depth".
  std::string shallowCycleName() const { return driver_metric + "_depth"; }

  // Evaluates the driver and every constrained metric on the given side.
  MetricValues measure(const LandmarkFrame& f, Side side) const;

  // Names of the bounds violated in phase p. Unavailable metrics never violate.
  std::set<std::string> violations(const MetricValues& values, Phase p) const;

  // Throws ConfigError describing the first problem found.
  void validate() const;

  bool operator==(const ThresholdSet& o) const;
  bool operator!=(const ThresholdSet& o) const { return !(*this == o); }
};

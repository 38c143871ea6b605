#pragma once
#include "Geometry.hpp"
#include <map>
#include <string>
#include <vector>

// A named geometry computation over side-relative or absolute joint names.
struct MetricDefinition {
  enum class Kind { Angle, Ratio };

  Kind kind = Kind::Angle;
  std::vector<std::string> joints;   // 3 for Angle, 4 for Ratio

  Measurement evaluate(const LandmarkFrame& f, Side side, float min_confidence) const;

  bool operator==(const MetricDefinition& o) const {
    return kind == o.kind && joints == o.joints;
  }
  bool operator!=(const MetricDefinition& o) const { return !(*this == o); }
};

using MetricCatalog = std::map<std::string, MetricDefinition>;

// knee_angle, hip_angle, ankle_angle, elbow_angle, shoulder_angle,
// stance_ratio (ankle width over hip width), grip_ratio (wrist width over
// shoulder width).
const MetricCatalog& builtinMetrics();

// Checks joint count and joint names. Writes a reason on failure.
bool validateMetric(const MetricDefinition& def, std::string& why);

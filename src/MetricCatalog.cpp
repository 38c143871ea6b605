#include "MetricCatalog.hpp"

namespace {

MetricDefinition angleOf(const char* a, const char* b, const char* c) {
  MetricDefinition d;
  d.kind = MetricDefinition::Kind::Angle;
  d.joints = {a, b, c};
  return d;
}

MetricDefinition ratioOf(const char* p1, const char* p2, const char* p3, const char* p4) {
  MetricDefinition d;
  d.kind = MetricDefinition::Kind::Ratio;
  d.joints = {p1, p2, p3, p4};
  return d;
}

}  // namespace

Measurement MetricDefinition::evaluate(const LandmarkFrame& f, Side side,
                                       float min_confidence) const {
  Measurement missing;
  missing.status = MetricStatus::MissingLandmark;

  std::vector<const Landmark*> pts;
  pts.reserve(joints.size());
  for (const auto& name : joints) {
    Joint j;
    if (!resolveJoint(name, side, j)) return missing;
    auto it = f.joints.find(j);
    if (it == f.joints.end()) return missing;
    pts.push_back(&it->second);
  }

  if (kind == Kind::Angle && pts.size() == 3) {
    return angle(*pts[0], *pts[1], *pts[2], min_confidence);
  }
  if (kind == Kind::Ratio && pts.size() == 4) {
    return distanceRatio(*pts[0], *pts[1], *pts[2], *pts[3], min_confidence);
  }
  return missing;
}

const MetricCatalog& builtinMetrics() {
  static const MetricCatalog catalog = {
    {"knee_angle",     angleOf("hip", "knee", "ankle")},
    {"hip_angle",      angleOf("shoulder", "hip", "knee")},
    {"ankle_angle",    angleOf("knee", "ankle", "foot_index")},
    {"elbow_angle",    angleOf("shoulder", "elbow", "wrist")},
    {"shoulder_angle", angleOf("hip", "shoulder", "elbow")},
    {"stance_ratio",   ratioOf("left_ankle", "right_ankle", "left_hip", "right_hip")},
    {"grip_ratio",     ratioOf("left_wrist", "right_wrist", "left_shoulder", "right_shoulder")},
  };
  return catalog;
}

bool validateMetric(const MetricDefinition& def, std::string& why) {
  size_t want = (def.kind == MetricDefinition::Kind::Angle) ? 3 : 4;
  if (def.joints.size() != want) {
    why = "expected " + std::to_string(want) + " joints, got " +
          std::to_string(def.joints.size());
    return false;
  }
  for (const auto& name : def.joints) {
    Joint j;
    if (!resolveJoint(name, Side::Left, j)) {
      why = "unknown joint '" + name + "'";
      return false;
    }
  }
  return true;
}

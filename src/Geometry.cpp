#include "Geometry.hpp"
#include <cmath>

namespace {

const float kPi = 3.14159265358979323846f;

bool confident(const Landmark& l, float min_confidence) {
  return l.confidence >= min_confidence;
}

float sideConfidence(const LandmarkFrame& f, Side s) {
  float sum = 0.0f;
  for (const auto& kv : f.joints) {
    Joint j = kv.first;
    bool left = false, right = false;
    switch (j) {
      case Joint::LeftShoulder: case Joint::LeftElbow: case Joint::LeftWrist:
      case Joint::LeftHip: case Joint::LeftKnee: case Joint::LeftAnkle:
      case Joint::LeftHeel: case Joint::LeftFootIndex:
        left = true;
        break;
      case Joint::Nose:
        break;
      default:
        right = true;
        break;
    }
    if ((s == Side::Left && left) || (s == Side::Right && right)) {
      sum += kv.second.confidence;
    }
  }
  return sum;
}

}  // namespace

Measurement angle(const Landmark& a, const Landmark& b, const Landmark& c,
                  float min_confidence) {
  Measurement m;
  if (!confident(a, min_confidence) || !confident(b, min_confidence) ||
      !confident(c, min_confidence)) {
    m.status = MetricStatus::LowConfidence;
    return m;
  }

  float ax = a.x - b.x, ay = a.y - b.y;
  float cx = c.x - b.x, cy = c.y - b.y;
  if ((ax == 0.0f && ay == 0.0f) || (cx == 0.0f && cy == 0.0f)) {
    m.status = MetricStatus::Degenerate;
    return m;
  }

  float rad = std::atan2(cy, cx) - std::atan2(ay, ax);
  float deg = std::fabs(rad * 180.0f / kPi);
  if (deg > 180.0f) deg = 360.0f - deg;

  m.status = MetricStatus::Ok;
  m.value = deg;
  return m;
}

Measurement distanceRatio(const Landmark& p1, const Landmark& p2,
                          const Landmark& p3, const Landmark& p4,
                          float min_confidence) {
  Measurement m;
  if (!confident(p1, min_confidence) || !confident(p2, min_confidence) ||
      !confident(p3, min_confidence) || !confident(p4, min_confidence)) {
    m.status = MetricStatus::LowConfidence;
    return m;
  }

  float num = std::hypot(p1.x - p2.x, p1.y - p2.y);
  float den = std::hypot(p3.x - p4.x, p3.y - p4.y);
  if (den <= 1e-6f) {
    m.status = MetricStatus::Degenerate;
    return m;
  }

  m.status = MetricStatus::Ok;
  m.value = num / den;
  return m;
}

Side facingSide(const LandmarkFrame& f) {
  auto l = f.joints.find(Joint::LeftShoulder);
  auto r = f.joints.find(Joint::RightShoulder);
  if (l != f.joints.end() && r != f.joints.end() && l->second.z != r->second.z) {
    return (l->second.z < r->second.z) ? Side::Left : Side::Right;
  }
  return sideConfidence(f, Side::Left) >= sideConfidence(f, Side::Right)
             ? Side::Left : Side::Right;
}

const char* metricStatusName(MetricStatus s) {
  switch (s) {
    case MetricStatus::Ok:              return "ok";
    case MetricStatus::LowConfidence:   return "low_confidence";
    case MetricStatus::MissingLandmark: return "missing_landmark";
    case MetricStatus::Degenerate:      return "degenerate";
  }
  return "unknown";
}

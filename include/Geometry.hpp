#pragma once
#include "Landmark.hpp"

enum class MetricStatus {
  Ok,
  LowConfidence,     // an input fell below the visibility minimum
  MissingLandmark,   // the frame does not carry a required joint
  Degenerate         // zero-length segment, no meaningful value
};

struct Measurement {
  MetricStatus status = MetricStatus::MissingLandmark;
  float value = 0.0f;

  bool ok() const { return status == MetricStatus::Ok; }
};

// Angle in degrees at vertex b, in [0, 180].
Measurement angle(const Landmark& a, const Landmark& b, const Landmark& c,
                  float min_confidence);

// |p1 - p2| / |p3 - p4|
Measurement distanceRatio(const Landmark& p1, const Landmark& p2,
                          const Landmark& p3, const Landmark& p4,
                          float min_confidence);

// The side of the body facing the camera: the shoulder with the smaller depth
// when depths are reported, otherwise the side with more confident joints.
Side facingSide(const LandmarkFrame& f);

const char* metricStatusName(MetricStatus s);

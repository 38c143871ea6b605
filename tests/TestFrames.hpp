#pragma once
// Synthetic side-view poses with exact joint angles, left side to the camera.

#include "Landmark.hpp"

#include <cmath>
#include <vector>

namespace testframes {

struct Vec { float x, y; };

inline Vec rotate(Vec v, float deg) {
  float r = deg * 3.14159265358979323846f / 180.0f;
  return {v.x * std::cos(r) - v.y * std::sin(r), v.x * std::sin(r) + v.y * std::cos(r)};
}

inline Vec along(Vec from, Vec dir, float len) {
  return {from.x + dir.x * len, from.y + dir.y * len};
}

inline Landmark mark(Vec p, float conf, float z) {
  Landmark l;
  l.x = p.x;
  l.y = p.y;
  l.z = z;
  l.confidence = conf;
  return l;
}

// Squat pose: knee, hip and ankle angles in degrees. conf applies to the
// left (camera-facing) joints; the right side is partly occluded.
inline LandmarkFrame squat(int64_t index, float knee, float hip = 75.0f,
                           float ankle = 90.0f, float conf = 0.9f) {
  Vec k{0.5f, 0.6f};
  Vec down{0.0f, 1.0f};
  Vec a = along(k, down, 0.2f);
  Vec to_hip = rotate(down, knee);
  Vec h = along(k, to_hip, 0.2f);
  Vec hip_to_knee{-to_hip.x, -to_hip.y};
  Vec s = along(h, rotate(hip_to_knee, hip), 0.25f);
  Vec f = along(a, rotate(Vec{0.0f, -1.0f}, ankle), 0.1f);

  LandmarkFrame fr;
  fr.index = index;
  fr.t_ms = index * 33;
  fr.joints[Joint::Nose] = mark(along(s, Vec{0.0f, -1.0f}, 0.1f), 0.95f, -0.2f);
  fr.joints[Joint::LeftShoulder] = mark(s, conf, -0.1f);
  fr.joints[Joint::LeftHip] = mark(h, conf, -0.1f);
  fr.joints[Joint::LeftKnee] = mark(k, conf, -0.1f);
  fr.joints[Joint::LeftAnkle] = mark(a, conf, -0.1f);
  fr.joints[Joint::LeftFootIndex] = mark(f, conf, -0.1f);
  fr.joints[Joint::RightShoulder] = mark(s, 0.3f, 0.1f);
  fr.joints[Joint::RightHip] = mark(h, 0.3f, 0.1f);
  fr.joints[Joint::RightKnee] = mark(k, 0.3f, 0.1f);
  fr.joints[Joint::RightAnkle] = mark(a, 0.3f, 0.1f);
  fr.joints[Joint::RightFootIndex] = mark(f, 0.3f, 0.1f);
  return fr;
}

// Push-up pose: elbow angle and hip (shoulder-hip-knee) angle.
inline LandmarkFrame pushup(int64_t index, float elbow, float hip = 175.0f,
                            float conf = 0.9f) {
  Vec s{0.4f, 0.5f};
  Vec down{0.0f, 1.0f};
  Vec e = along(s, down, 0.15f);
  Vec w = along(e, rotate(Vec{0.0f, -1.0f}, elbow), 0.15f);
  Vec h = along(s, Vec{1.0f, 0.0f}, 0.3f);
  Vec kn = along(h, rotate(Vec{-1.0f, 0.0f}, hip), 0.25f);

  LandmarkFrame fr;
  fr.index = index;
  fr.t_ms = index * 33;
  fr.joints[Joint::LeftShoulder] = mark(s, conf, -0.1f);
  fr.joints[Joint::LeftElbow] = mark(e, conf, -0.1f);
  fr.joints[Joint::LeftWrist] = mark(w, conf, -0.1f);
  fr.joints[Joint::LeftHip] = mark(h, conf, -0.1f);
  fr.joints[Joint::LeftKnee] = mark(kn, conf, -0.1f);
  fr.joints[Joint::RightShoulder] = mark(s, 0.3f, 0.1f);
  return fr;
}

// Knee angles standing in for the squat phase labels under the default
// thresholds (start 150, leave_start 120, extreme 90).
const float kUp = 170.0f;
const float kMid = 110.0f;
const float kDown = 70.0f;

// Hip angles that go with them: open when standing, folding on the way down.
// Only the bottom value sits inside the default [60, 90] hip range.
const float kHipUp = 170.0f;
const float kHipMid = 120.0f;
const float kHipDown = 75.0f;

// UP x5, DESCENDING x3, DOWN x4, ASCENDING x3, UP x3. ankle_bad lists the
// indices whose ankle angle drops to 70 (knees too far forward).
inline std::vector<LandmarkFrame> squatRep(int64_t first_index,
                                           const std::vector<int64_t>& ankle_bad) {
  std::vector<float> knees;
  std::vector<float> hips;
  auto add = [&](float knee, float hip, int n) {
    for (int i = 0; i < n; ++i) {
      knees.push_back(knee);
      hips.push_back(hip);
    }
  };
  add(kUp, kHipUp, 5);
  add(kMid, kHipMid, 3);
  add(kDown, kHipDown, 4);
  add(kMid, kHipMid, 3);
  add(kUp, kHipUp, 3);

  std::vector<LandmarkFrame> frames;
  for (size_t i = 0; i < knees.size(); ++i) {
    int64_t idx = first_index + static_cast<int64_t>(i);
    bool bad = false;
    for (int64_t b : ankle_bad) bad = bad || (b == idx);
    frames.push_back(squat(idx, knees[i], hips[i], bad ? 70.0f : 90.0f));
  }
  return frames;
}

// A squat that turns back before the knee closes past the extreme threshold:
// UP x5, DESCENDING x6, UP x4.
inline std::vector<LandmarkFrame> shallowSquat(int64_t first_index) {
  std::vector<LandmarkFrame> frames;
  int64_t idx = first_index;
  for (int i = 0; i < 5; ++i) frames.push_back(squat(idx++, kUp, kHipUp));
  for (int i = 0; i < 6; ++i) frames.push_back(squat(idx++, kMid, kHipMid));
  for (int i = 0; i < 4; ++i) frames.push_back(squat(idx++, kUp, kHipUp));
  return frames;
}

}  // namespace testframes

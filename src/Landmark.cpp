#include "Landmark.hpp"

#include <utility>

namespace {

const std::pair<Joint, const char*> kJointNames[] = {
  {Joint::Nose,           "nose"},
  {Joint::LeftShoulder,   "left_shoulder"},
  {Joint::RightShoulder,  "right_shoulder"},
  {Joint::LeftElbow,      "left_elbow"},
  {Joint::RightElbow,     "right_elbow"},
  {Joint::LeftWrist,      "left_wrist"},
  {Joint::RightWrist,     "right_wrist"},
  {Joint::LeftHip,        "left_hip"},
  {Joint::RightHip,       "right_hip"},
  {Joint::LeftKnee,       "left_knee"},
  {Joint::RightKnee,      "right_knee"},
  {Joint::LeftAnkle,      "left_ankle"},
  {Joint::RightAnkle,     "right_ankle"},
  {Joint::LeftHeel,       "left_heel"},
  {Joint::RightHeel,      "right_heel"},
  {Joint::LeftFootIndex,  "left_foot_index"},
  {Joint::RightFootIndex, "right_foot_index"},
};

}  // namespace

const char* jointName(Joint j) {
  for (const auto& p : kJointNames) {
    if (p.first == j) return p.second;
  }
  return "unknown";
}

bool jointFromName(const std::string& name, Joint& out) {
  for (const auto& p : kJointNames) {
    if (name == p.second) {
      out = p.first;
      return true;
    }
  }
  return false;
}

bool resolveJoint(const std::string& name, Side side, Joint& out) {
  if (jointFromName(name, out)) return true;
  std::string prefix = (side == Side::Left) ? "left_" : "right_";
  return jointFromName(prefix + name, out);
}

const char* sideName(Side s) {
  return s == Side::Left ? "left" : "right";
}

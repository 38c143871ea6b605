#pragma once
#include <cstdint>
#include <map>
#include <string>

// Subset of the MediaPipe Pose joints the analyzer can measure.
enum class Joint {
  Nose,
  LeftShoulder, RightShoulder,
  LeftElbow,    RightElbow,
  LeftWrist,    RightWrist,
  LeftHip,      RightHip,
  LeftKnee,     RightKnee,
  LeftAnkle,    RightAnkle,
  LeftHeel,     RightHeel,
  LeftFootIndex, RightFootIndex
};

enum class Side { Left, Right };

struct Landmark {
  float x = 0, y = 0;       // normalized image coordinates
  float z = 0;              // relative depth, smaller is closer to the camera
  float confidence = 0;     // visibility in [0, 1]
};

struct LandmarkFrame {
  int64_t index = 0;
  int64_t t_ms = 0;
  std::map<Joint, Landmark> joints;
};

const char* jointName(Joint j);

// Accepts "left_hip" style names. Returns false for unknown names.
bool jointFromName(const std::string& name, Joint& out);

// Resolves a side-relative joint ("hip") to the joint on the given side.
// Absolute names ("left_hip", "nose") resolve to themselves.
bool resolveJoint(const std::string& name, Side side, Joint& out);

const char* sideName(Side s);

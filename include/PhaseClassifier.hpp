#pragma once
#include "ThresholdSet.hpp"

struct Classification {
  Phase phase = Phase::Start;
  bool held = false;   // driver metric unavailable, previous phase carried over
};

// Maps one driver metric reading to a phase. Pure: the previous phase is the
// only memory, and it only decides boundary and transitional cases.
Classification classify(const Measurement& driver, const ThresholdSet& ts, Phase previous);

// Convenience overload measuring the driver metric on the facing side.
Classification classify(const LandmarkFrame& f, const ThresholdSet& ts, Phase previous);

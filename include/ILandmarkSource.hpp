#pragma once
#include "Landmark.hpp"

class ILandmarkSource {
public:
  virtual ~ILandmarkSource() = default;
  // Returns false at end of stream.
  virtual bool next(LandmarkFrame& out) = 0;
};

#pragma once
#include "ILandmarkSource.hpp"
#include <string>
#include <vector>

// Replays a recorded session: a JSON array of frames (see LandmarkJson.hpp).
// Entries that fail to parse are kept as empty frames so the analyzer can
// count them as malformed.
class JsonLandmarkSource : public ILandmarkSource {
public:
  explicit JsonLandmarkSource(const std::string& path);
  bool next(LandmarkFrame& out) override;

  size_t size() const { return frames_.size(); }

private:
  std::vector<LandmarkFrame> frames_;
  size_t idx_ = 0;
};

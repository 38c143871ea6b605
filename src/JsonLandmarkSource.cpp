#include "JsonLandmarkSource.hpp"
#include "LandmarkJson.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

using nlohmann::json;

JsonLandmarkSource::JsonLandmarkSource(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) throw std::runtime_error("Could not open landmark file " + path);

  json j;
  try {
    f >> j;
  } catch (const json::exception& e) {
    throw std::runtime_error("Could not parse landmark file " + path + ": " + e.what());
  }
  if (!j.is_array()) throw std::runtime_error("Landmark JSON must be an array");

  frames_.reserve(j.size());
  int64_t i = 0;
  for (const auto& item : j) {
    LandmarkFrame fr;
    fr.index = i++;
    std::string why;
    if (!frameFromJson(item, fr, why)) {
      spdlog::warn("{}: frame {} unreadable: {}", path, fr.index, why);
    }
    frames_.push_back(fr);
  }
  spdlog::info("Loaded {} frames from {}", frames_.size(), path);
}

bool JsonLandmarkSource::next(LandmarkFrame& out) {
  if (idx_ >= frames_.size()) return false;
  out = frames_[idx_++];
  return true;
}

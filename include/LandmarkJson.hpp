#pragma once
#include "Landmark.hpp"

#include <nlohmann/json.hpp>
#include <string>

// Frame layout, one object per frame:
// {"frame":12,"t_ms":400,"landmarks":{"left_hip":{"x":0.51,"y":0.62,"z":-0.1,"visibility":0.98},...}}
// "confidence" is accepted in place of "visibility". Joints the analyzer does
// not use are ignored.
bool frameFromJson(const nlohmann::json& j, LandmarkFrame& out, std::string& why);

void to_json(nlohmann::json& j, const LandmarkFrame& f);

#include "LandmarkJson.hpp"

using nlohmann::json;

bool frameFromJson(const json& j, LandmarkFrame& out, std::string& why) {
  out.joints.clear();
  if (!j.is_object()) {
    why = "frame is not an object";
    return false;
  }

  try {
    out.index = j.value("frame", out.index);
    out.t_ms = j.value("t_ms", out.t_ms);

    if (!j.contains("landmarks") || !j["landmarks"].is_object()) {
      why = "missing landmarks object";
      return false;
    }

    for (const auto& item : j["landmarks"].items()) {
      Joint joint;
      if (!jointFromName(item.key(), joint)) continue;

      const auto& p = item.value();
      if (!p.contains("x") || !p.contains("y")) {
        why = "landmark " + item.key() + " lacks coordinates";
        out.joints.clear();
        return false;
      }

      Landmark l;
      l.x = p["x"].get<float>();
      l.y = p["y"].get<float>();
      l.z = p.value("z", 0.0f);
      if (p.contains("visibility")) {
        l.confidence = p["visibility"].get<float>();
      } else if (p.contains("confidence")) {
        l.confidence = p["confidence"].get<float>();
      } else {
        why = "landmark " + item.key() + " lacks visibility";
        out.joints.clear();
        return false;
      }
      out.joints[joint] = l;
    }
  } catch (const json::exception& e) {
    why = e.what();
    out.joints.clear();
    return false;
  }
  return true;
}

void to_json(json& j, const LandmarkFrame& f) {
  json marks = json::object();
  for (const auto& kv : f.joints) {
    marks[jointName(kv.first)] = {
      {"x", kv.second.x},
      {"y", kv.second.y},
      {"z", kv.second.z},
      {"visibility", kv.second.confidence},
    };
  }
  j = json{{"frame", f.index}, {"t_ms", f.t_ms}, {"landmarks", marks}};
}

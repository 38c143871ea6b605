#include "ThresholdStore.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <utility>

using nlohmann::json;

namespace {

const char* kDefaultConfig = R"json(
{
  "squat": {
    "phases": ["UP", "DESCENDING", "DOWN", "ASCENDING"],
    "start_phase": "UP",
    "extreme_phase": "DOWN",
    "driver_metric": "knee_angle",
    "state_thresholds": { "start": 150, "leave_start": 120, "extreme": 90 },
    "debounce_frames": 3,
    "visibility_min": 0.5,
    "feedback_cooldown_ms": 1000,
    "constraints": {
      "hip_angle":   { "min": 60, "max": 90, "phases": ["DOWN"] },
      "ankle_angle": { "min": 80, "phases": ["DESCENDING", "DOWN", "ASCENDING"] },
      "knee_angle":  { "min": 40, "phases": ["DOWN"] }
    },
    "feedback_messages": {
      "hip_angle_min":   "Maintain a more upright position",
      "hip_angle_max":   "Bend forward slightly more",
      "ankle_angle_min": "Knees going too far forward",
      "knee_angle_min":  "Squat too deep",
      "knee_angle_depth": "Squat not deep enough"
    }
  },
  "pushup": {
    "phases": ["UP", "DESCENDING", "DOWN", "ASCENDING"],
    "start_phase": "UP",
    "extreme_phase": "DOWN",
    "driver_metric": "elbow_angle",
    "state_thresholds": { "start": 150, "leave_start": 130, "extreme": 95 },
    "debounce_frames": 3,
    "visibility_min": 0.5,
    "feedback_cooldown_ms": 1000,
    "constraints": {
      "elbow_angle": { "min": 50, "phases": ["DESCENDING", "DOWN", "ASCENDING"] },
      "hip_angle":   { "min": 160, "phases": ["DESCENDING", "DOWN", "ASCENDING"] }
    },
    "feedback_messages": {
      "elbow_angle_min": "Too deep",
      "hip_angle_min":   "Hip too high",
      "elbow_angle_depth": "Not deep enough"
    }
  }
}
)json";

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

json readDocument(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) throw ConfigError("Could not open config file " + path);

  json j;
  try {
    f >> j;
  } catch (const json::exception& e) {
    throw ConfigError("Could not parse config file " + path + ": " + e.what());
  }
  if (!j.is_object()) throw ConfigError("Config file " + path + " must hold a JSON object");
  return j;
}

MetricDefinition parseMetric(const std::string& name, const json& m) {
  MetricDefinition def;
  if (m.contains("angle")) {
    def.kind = MetricDefinition::Kind::Angle;
    def.joints = m.at("angle").get<std::vector<std::string>>();
  } else if (m.contains("ratio")) {
    def.kind = MetricDefinition::Kind::Ratio;
    def.joints = m.at("ratio").get<std::vector<std::string>>();
  } else {
    throw ConfigError("metric '" + name + "' needs an \"angle\" or \"ratio\" joint list");
  }
  return def;
}

// Places the ordered cycle into the four phase roles.
void assignPhases(ThresholdSet& set, const json& entry) {
  auto cycle = entry.at("phases").get<std::vector<std::string>>();
  auto start = entry.at("start_phase").get<std::string>();
  auto extreme = entry.at("extreme_phase").get<std::string>();

  if (cycle.size() < 2 || cycle.size() > 4) {
    throw ConfigError("exercise '" + set.exercise + "': phases must list 2 to 4 names");
  }
  auto s = std::find(cycle.begin(), cycle.end(), start);
  auto e = std::find(cycle.begin(), cycle.end(), extreme);
  if (s == cycle.end()) throw ConfigError("exercise '" + set.exercise + "': unknown start phase '" + start + "'");
  if (e == cycle.end()) throw ConfigError("exercise '" + set.exercise + "': unknown extreme phase '" + extreme + "'");

  size_t n = cycle.size();
  size_t si = static_cast<size_t>(s - cycle.begin());
  size_t ei = static_cast<size_t>(e - cycle.begin());
  size_t outbound = (ei + n - si) % n - 1;   // phases strictly between start and extreme
  size_t inbound = (si + n - ei) % n - 1;
  if (si == ei || outbound > 1 || inbound > 1) {
    throw ConfigError("exercise '" + set.exercise +
                      "': phases must form start, [toward extreme], extreme, [toward start]");
  }

  set.phase_names[static_cast<int>(Phase::Start)] = start;
  set.phase_names[static_cast<int>(Phase::Extreme)] = extreme;
  if (outbound == 1) set.phase_names[static_cast<int>(Phase::TowardExtreme)] = cycle[(si + 1) % n];
  if (inbound == 1) set.phase_names[static_cast<int>(Phase::TowardStart)] = cycle[(ei + 1) % n];
}

void requireMetric(ThresholdSet& set, const std::string& name, const MetricCatalog& custom) {
  if (set.metrics.count(name)) return;
  auto c = custom.find(name);
  if (c != custom.end()) {
    set.metrics[name] = c->second;
    return;
  }
  const auto& builtin = builtinMetrics();
  auto b = builtin.find(name);
  if (b == builtin.end()) {
    throw ConfigError("exercise '" + set.exercise + "': no geometry for metric '" + name + "'");
  }
  set.metrics[name] = b->second;
}

// Every exercise must parse before a document is taken into use.
void validateDocument(const json& doc) {
  for (const auto& item : doc.items()) {
    parseThresholdSet(lower(item.key()), item.value());
  }
}

}  // namespace

ThresholdSet parseThresholdSet(const std::string& exercise, const json& entry) {
  ThresholdSet set;
  set.exercise = exercise;

  try {
    if (!entry.is_object()) throw ConfigError("exercise '" + exercise + "' must be an object");

    assignPhases(set, entry);

    MetricCatalog custom;
    if (entry.contains("metrics")) {
      for (const auto& m : entry.at("metrics").items()) {
        custom[m.key()] = parseMetric(m.key(), m.value());
      }
    }

    set.driver_metric = entry.at("driver_metric").get<std::string>();
    requireMetric(set, set.driver_metric, custom);

    const auto& st = entry.at("state_thresholds");
    set.start_threshold = st.at("start").get<float>();
    set.extreme_threshold = st.at("extreme").get<float>();
    set.leave_start_threshold = st.value("leave_start", set.start_threshold);

    set.debounce_frames = entry.value("debounce_frames", 3);
    set.visibility_min = entry.value("visibility_min", 0.5f);
    set.feedback_cooldown_ms = entry.value("feedback_cooldown_ms", int64_t{1000});

    if (entry.contains("constraints")) {
      for (const auto& c : entry.at("constraints").items()) {
        Constraint con;
        con.metric = c.key();
        const auto& body = c.value();
        if (body.contains("min")) {
          con.bound.has_min = true;
          con.bound.min = body.at("min").get<float>();
        }
        if (body.contains("max")) {
          con.bound.has_max = true;
          con.bound.max = body.at("max").get<float>();
        }

        std::vector<std::string> phases;
        if (body.contains("phases")) {
          phases = body.at("phases").get<std::vector<std::string>>();
        } else {
          phases.push_back(set.phaseName(Phase::Extreme));
        }
        for (const auto& name : phases) {
          Phase p;
          if (!set.phaseFromName(name, p)) {
            throw ConfigError("exercise '" + exercise + "': constraint on '" + con.metric +
                              "' names unknown phase '" + name + "'");
          }
          con.phases.push_back(p);
        }

        requireMetric(set, con.metric, custom);
        set.constraints.push_back(con);
      }
    }

    if (entry.contains("feedback_messages")) {
      set.feedback_messages =
          entry.at("feedback_messages").get<std::map<std::string, std::string>>();
    }
  } catch (const json::exception& e) {
    throw ConfigError("exercise '" + exercise + "': " + e.what());
  }

  set.validate();
  return set;
}

ThresholdStore::ThresholdStore() : doc_(defaults()) {}

ThresholdStore::ThresholdStore(const std::string& path)
  : path_(path), doc_(defaults()) {
  doc_.merge_patch(readDocument(path_));
  validateDocument(doc_);
  spdlog::info("Loaded exercise config from {}", path_);
}

json ThresholdStore::defaults() {
  return json::parse(kDefaultConfig);
}

ThresholdSet ThresholdStore::load(const std::string& exercise) const {
  std::string want = lower(exercise);
  for (const auto& item : doc_.items()) {
    if (lower(item.key()) == want) {
      return parseThresholdSet(want, item.value());
    }
  }
  throw ConfigError("unknown exercise '" + exercise + "'");
}

std::vector<std::string> ThresholdStore::exercises() const {
  std::vector<std::string> names;
  for (const auto& item : doc_.items()) names.push_back(lower(item.key()));
  return names;
}

void ThresholdStore::reload() {
  if (path_.empty()) return;
  json next = defaults();
  next.merge_patch(readDocument(path_));
  validateDocument(next);
  doc_ = std::move(next);
  spdlog::info("Reloaded exercise config from {}", path_);
}

#pragma once
#include "ThresholdSet.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Exercise configuration document: built-in defaults, optionally overlaid with
// a JSON file. Hands out validated, immutable ThresholdSets.
class ThresholdStore {
public:
  // Built-in squat and pushup defaults only.
  ThresholdStore();

  // Defaults overlaid (JSON merge-patch) with the file at path.
  // Throws ConfigError if the file cannot be read or parsed, or if any
  // exercise in the result is invalid.
  explicit ThresholdStore(const std::string& path);

  // Throws ConfigError for unknown exercises and invalid settings.
  ThresholdSet load(const std::string& exercise) const;

  std::vector<std::string> exercises() const;

  // Re-reads the overlay file. Sets already loaded are unaffected. Throws
  // ConfigError and keeps the current document if the file is unreadable or
  // any exercise in it fails validation.
  void reload();

  static nlohmann::json defaults();

private:
  std::string path_;
  nlohmann::json doc_;
};

// Parses and validates one exercise entry of the configuration document.
ThresholdSet parseThresholdSet(const std::string& exercise, const nlohmann::json& entry);

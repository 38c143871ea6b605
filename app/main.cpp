#include "ExerciseAnalyzer.hpp"
#include "JsonLandmarkSource.hpp"
#include "ThresholdStore.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using json = nlohmann::json;

namespace {

void usage() {
  std::cerr << "usage: repcoach_replay <exercise> <frames.json> [config.json]"
               " [--summary out.json] [--realtime]\n";
}

}  // namespace

int main(int argc, char** argv) {
  // stdout carries the JSON lines, logs go to stderr
  spdlog::set_default_logger(spdlog::stderr_color_mt("repcoach"));
  spdlog::cfg::load_env_levels();

  std::string exercise, frames_path, config_path, summary_path;
  bool realtime = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--realtime") {
      realtime = true;
    } else if (arg == "--summary" && i + 1 < argc) {
      summary_path = argv[++i];
    } else if (exercise.empty()) {
      exercise = arg;
    } else if (frames_path.empty()) {
      frames_path = arg;
    } else if (config_path.empty()) {
      config_path = arg;
    } else {
      usage();
      return 2;
    }
  }
  if (exercise.empty() || frames_path.empty()) {
    usage();
    return 2;
  }

  try {
    ThresholdStore store = config_path.empty() ? ThresholdStore() : ThresholdStore(config_path);
    ExerciseAnalyzer analyzer(store.load(exercise));
    JsonLandmarkSource source(frames_path);

    LandmarkFrame f;
    int64_t last_t = -1;

    while (source.next(f)) {
      // simulate real-time spacing based on t_ms in the recording
      if (realtime && last_t >= 0) {
        int64_t dt = f.t_ms - last_t;
        if (dt > 0) std::this_thread::sleep_for(std::chrono::milliseconds(dt));
      }
      last_t = f.t_ms;

      TickResult r = analyzer.tick(f);
      std::cout << json(r).dump() << std::endl;
    }

    SessionSummary summary = analyzer.summary();
    json j = summary;
    std::cout << json{{"summary", j}}.dump() << std::endl;

    if (!summary_path.empty()) {
      std::ofstream out(summary_path);
      if (!out.is_open()) throw std::runtime_error("Could not write summary to " + summary_path);
      out << j.dump(4) << "\n";
      spdlog::info("Summary saved to {}", summary_path);
    }

    spdlog::info("{}: {} reps ({} good, {} bad) in {}", summary.exercise, summary.total,
                 summary.good, summary.bad, formatDuration(summary.duration_ms));
    return 0;
  } catch (const ConfigError& e) {
    spdlog::error("Invalid configuration: {}", e.what());
    return 1;
  } catch (const std::exception& e) {
    spdlog::error("Error: {}", e.what());
    return 1;
  }
}

#include "AnalysisWorker.hpp"
#include "TcpLandmarkSource.hpp"
#include "ThresholdStore.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

using json = nlohmann::json;

// Live mode: a pose-estimation process streams one JSON frame per line, e.g.
// {"frame":0,"t_ms":0,"landmarks":{"left_hip":{"x":0.51,"y":0.62,"z":-0.1,"visibility":0.98},...}}
// Frames are read on this thread and analyzed on a worker thread, which
// prints one JSON line per frame for the frontend.
int main(int argc, char** argv) {
  spdlog::set_default_logger(spdlog::stderr_color_mt("repcoach"));
  spdlog::cfg::load_env_levels();

  if (argc < 4 || argc > 5) {
    std::cerr << "usage: repcoach_live <exercise> <host> <port> [config.json]\n";
    return 2;
  }
  std::string exercise = argv[1];
  std::string host = argv[2];
  std::string port = argv[3];

  try {
    ThresholdStore store = (argc == 5) ? ThresholdStore(argv[4]) : ThresholdStore();

    AnalysisWorker worker(store.load(exercise), [](const TickResult& r) {
      // EXACT format the frontend expects: one JSON object per line
      std::cout << json(r).dump() << std::endl;
    });

    TcpLandmarkSource source(host, port);
    worker.start();

    LandmarkFrame f;
    while (source.next(f)) {
      worker.submit(f);
    }
    worker.stop();

    SessionSummary summary = worker.summary();
    std::cout << json{{"summary", summary}}.dump() << std::endl;

    spdlog::info("Stream ended: {} reps ({} good, {} bad), {} frames dropped, {} unreadable lines",
                 summary.total, summary.good, summary.bad,
                 summary.diagnostics.dropped_frames, source.badLines());
    return 0;
  } catch (const ConfigError& e) {
    spdlog::error("Invalid configuration: {}", e.what());
    return 1;
  } catch (const std::exception& e) {
    spdlog::error("Error in main: {}", e.what());
    return 1;
  }
}

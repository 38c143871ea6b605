#include "AnalysisWorker.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>
#include <utility>

AnalysisWorker::AnalysisWorker(ThresholdSet ts, ResultCallback on_result, size_t capacity)
  : analyzer_(std::move(ts)), on_result_(std::move(on_result)), queue_(capacity) {}

AnalysisWorker::~AnalysisWorker() {
  stop();
}

void AnalysisWorker::start() {
  if (running_.load()) return;
  stop_requested_.store(false);
  running_.store(true);
  thread_ = std::thread(&AnalysisWorker::run, this);
}

bool AnalysisWorker::submit(const LandmarkFrame& f) {
  if (queue_.push(f)) return true;
  int64_t n = ++dropped_;
  spdlog::warn("Frame queue is full, dropping frame {} ({} dropped so far)", f.index, n);
  return false;
}

void AnalysisWorker::stop() {
  if (!running_.load()) return;
  stop_requested_.store(true);
  if (thread_.joinable()) thread_.join();
  running_.store(false);
  int64_t d = dropped_.load();
  analyzer_.addDroppedFrames(d - reported_drops_);
  reported_drops_ = d;
}

SessionSummary AnalysisWorker::summary() const {
  if (running_.load()) throw std::logic_error("AnalysisWorker::summary() called while running");
  return analyzer_.summary();
}

void AnalysisWorker::run() {
  LandmarkFrame f;
  while (!stop_requested_.load()) {
    if (queue_.pop(f)) {
      process(f);
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }
  while (queue_.pop(f)) process(f);
}

void AnalysisWorker::process(const LandmarkFrame& f) {
  TickResult r = analyzer_.tick(f);
  ++processed_;
  if (!on_result_) return;
  try {
    on_result_(r);
  } catch (const std::exception& e) {
    spdlog::error("Result callback failed on frame {}: {}", r.frame, e.what());
  }
}

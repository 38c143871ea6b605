#pragma once
#include "ExerciseAnalyzer.hpp"

#include <boost/lockfree/spsc_queue.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <thread>

// Runs an ExerciseAnalyzer on its own thread. One producer thread calls
// submit(); results are delivered to the callback on the worker thread.
class AnalysisWorker {
public:
  using ResultCallback = std::function<void(const TickResult&)>;

  AnalysisWorker(ThresholdSet ts, ResultCallback on_result, size_t capacity = 64);
  ~AnalysisWorker();

  AnalysisWorker(const AnalysisWorker&) = delete;
  AnalysisWorker& operator=(const AnalysisWorker&) = delete;

  void start();

  // Producer side. Returns false and counts a drop when the queue is full.
  bool submit(const LandmarkFrame& f);

  // Processes whatever is still queued, then joins the worker thread.
  void stop();

  bool running() const { return running_.load(); }
  int64_t dropped() const { return dropped_.load(); }
  int64_t processed() const { return processed_.load(); }

  // Only valid once stopped. Throws std::logic_error while running.
  SessionSummary summary() const;

private:
  ExerciseAnalyzer analyzer_;
  ResultCallback on_result_;
  boost::lockfree::spsc_queue<LandmarkFrame> queue_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<int64_t> dropped_{0};
  std::atomic<int64_t> processed_{0};
  int64_t reported_drops_ = 0;
  std::thread thread_;

  void run();
  void process(const LandmarkFrame& f);
};

#include "FeedbackGenerator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

FeedbackGenerator::FeedbackGenerator(std::map<std::string, std::string> messages,
                                     int64_t cooldown_ms)
  : messages_(std::move(messages)), cooldown_ms_(cooldown_ms) {}

std::vector<std::string> FeedbackGenerator::update(const std::set<std::string>& violations,
                                                   int64_t t_ms) {
  std::vector<std::string> out;
  for (const auto& v : violations) {
    auto last = last_shown_ms_.find(v);
    if (last != last_shown_ms_.end() && t_ms >= last->second &&
        t_ms - last->second < cooldown_ms_) {
      continue;
    }
    last_shown_ms_[v] = t_ms;

    std::string text = messageFor(v);
    if (std::find(out.begin(), out.end(), text) == out.end()) {
      out.push_back(std::move(text));
    }
  }
  return out;
}

std::string FeedbackGenerator::messageFor(const std::string& violation) {
  auto it = messages_.find(violation);
  if (it != messages_.end()) return it->second;

  if (reported_gaps_.insert(violation).second) {
    spdlog::warn("No feedback message configured for '{}'", violation);
  }
  std::string readable = violation;
  std::replace(readable.begin(), readable.end(), '_', ' ');
  return "Issue with " + readable;
}

void FeedbackGenerator::reset() {
  last_shown_ms_.clear();
}

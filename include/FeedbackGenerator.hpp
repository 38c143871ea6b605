#pragma once
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

// Turns the violations of the current tick into display text. A violation is
// not repeated until cooldown_ms has passed since it was last shown.
class FeedbackGenerator {
public:
  FeedbackGenerator(std::map<std::string, std::string> messages, int64_t cooldown_ms);

  std::vector<std::string> update(const std::set<std::string>& violations, int64_t t_ms);

  // Configured text, or a generic fallback for unmapped names.
  std::string messageFor(const std::string& violation);

  void reset();

private:
  std::map<std::string, std::string> messages_;
  int64_t cooldown_ms_;

  std::map<std::string, int64_t> last_shown_ms_;
  std::set<std::string> reported_gaps_;
};

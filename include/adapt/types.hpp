#pragma once

#include <cmath>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace adapt {

enum class ConceptStatus {
  Locked,
  Opened,
  Mastered
};

inline std::string to_string(ConceptStatus status) {
  switch (status) {
    case ConceptStatus::Locked: return "locked";
    case ConceptStatus::Opened: return "opened";
    case ConceptStatus::Mastered: return "mastered";
  }
  return "locked";
}

inline ConceptStatus concept_status_from_string(const std::string& value) {
  if (value == "locked") {
    return ConceptStatus::Locked;
  }
  if (value == "opened") {
    return ConceptStatus::Opened;
  }
  if (value == "mastered") {
    return ConceptStatus::Mastered;
  }
  throw std::invalid_argument("Unknown concept status: " + value);
}

// Concepts missing from the map are treated as locked.
using StatusMap = std::map<std::string, ConceptStatus>;
using AbilityMap = std::map<std::string, double>;

/**
 * 3PL item parameters: discrimination a (> 0), difficulty b, guessing floor
 * c in [0, 1).
 */
struct ItemParams {
  double a = 1.0;
  double b = 0.0;
  double c = 0.0;

  void validate() const;
};

struct TestCase {
  nlohmann::json input;
  nlohmann::json output;
  bool unordered = false;
};

struct Item {
  std::string id;
  std::string topic;
  std::string description;
  ItemParams params;
  std::vector<TestCase> tests;
  std::vector<TestCase> hidden_tests;
  std::string init_code = "solve()";
  bool unordered = false;

  void validate() const;
};

/**
 * One recorded answer. The item parameters are a snapshot taken when the
 * answer was recorded; entries loaded without a complete snapshot keep
 * `params` empty and are ignored by ability estimation.
 */
struct Outcome {
  std::string item_id;
  std::string topic;
  std::optional<ItemParams> params;
  bool correct = false;
  std::string timestamp;
  double time_taken = 0.0;
  double theta_before = 0.0;
  double theta_after = 0.0;
  nlohmann::json test_results;
  nlohmann::json subjective_feedback;
};

struct LearnerProfile {
  std::string learner_id = "default_user";
  AbilityMap theta_by_topic;
  StatusMap concept_status;
  std::vector<Outcome> history;
};

struct RecentPerformance {
  int attempts = 0;
  int correct = 0;
  double accuracy = 0.0;
  double average_time = 0.0;
};

inline void ItemParams::validate() const {
  if (!(a > 0.0)) {
    throw std::invalid_argument("Item discrimination (a) must be positive");
  }
  if (!std::isfinite(b)) {
    throw std::invalid_argument("Item difficulty (b) must be finite");
  }
  if (!(c >= 0.0 && c < 1.0)) {
    throw std::invalid_argument("Item guessing parameter (c) must be within [0, 1)");
  }
}

inline void Item::validate() const {
  if (id.empty()) {
    throw std::invalid_argument("Item id must not be empty");
  }
  if (topic.empty()) {
    throw std::invalid_argument("Item '" + id + "' has no topic");
  }
  try {
    params.validate();
  } catch (const std::invalid_argument& ex) {
    throw std::invalid_argument("Item '" + id + "': " + ex.what());
  }
}

} // namespace adapt

#pragma once

#include "ability_estimator.hpp"
#include "concept_graph.hpp"
#include "engine_config.hpp"
#include "timestamp.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace adapt {

// Fresh profile: every concept at the initial ability, concepts without
// prerequisites opened, the rest locked.
LearnerProfile make_default_profile(const ConceptGraph& graph,
                                    const EngineConfig& config,
                                    std::string learner_id = "default_user");

struct RecordResult {
  Outcome outcome;
  ConceptStatus status_before = ConceptStatus::Locked;
  ConceptStatus status_after = ConceptStatus::Locked;
  // Concepts opened while recording, by the unlock sweep or the mastery cascade.
  std::vector<std::string> unlocked;
  // Set by the engine once the updated profile reached its store. The answer
  // stays recorded in memory when saving fails.
  bool persisted = false;
};

struct TopicProgress {
  std::string topic;
  double theta = 0.0;
  ConceptStatus status = ConceptStatus::Locked;
  double progress_percent = 0.0;
  int attempts = 0;
  double mastery_threshold = 0.0;
};

struct OverallProgress {
  int total_topics = 0;
  int mastered = 0;
  int in_progress = 0;
  int locked = 0;
  double overall_progress_percent = 0.0;
  int total_attempts = 0;
  std::optional<std::string> current_focus;
};

/**
 * Owns one learner's profile and applies answers to it.
 *
 * record_answer() updates the topic ability first and evaluates mastery on
 * the updated value. Concept status only moves forward and history is
 * append-only. Not thread-safe; callers serialize access per learner.
 */
class LearnerState {
public:
  LearnerState(LearnerProfile profile,
               const ConceptGraph& graph,
               const AbilityEstimator& estimator,
               double mastery_threshold,
               Clock clock = system_now);

  const LearnerProfile& profile() const { return profile_; }
  const StatusMap& statuses() const { return profile_.concept_status; }
  double mastery_threshold() const { return mastery_threshold_; }
  const ConceptGraph& graph() const { return graph_; }
  const AbilityEstimator& estimator() const { return estimator_; }

  double theta(const std::string& topic) const;
  ConceptStatus status(const std::string& concept_name) const;

  // Chronological outcomes for one topic.
  std::vector<const Outcome*> topic_history(const std::string& topic) const;

  // Opens every locked concept whose prerequisites are all mastered.
  std::vector<std::string> refresh_unlocks();

  RecordResult record_answer(const Item& item,
                             bool correct,
                             double time_taken = 0.0,
                             nlohmann::json test_results = nullptr);

  // Attaches feedback to the most recent outcome for `item_id`. Returns false
  // when the item has never been answered.
  bool attach_feedback(const std::string& item_id, nlohmann::json feedback);

  // Outcomes recorded for `item_id`.
  int attempt_count(const std::string& item_id) const;

  std::optional<std::string> focus_topic() const;
  std::vector<std::string> mastered_topics() const;
  std::vector<std::string> locked_topics() const;
  std::vector<std::string> available_topics() const;

  TopicProgress topic_progress(const std::string& topic) const;
  OverallProgress overall_progress() const;

  RecentPerformance recent_performance(int n = 10) const;
  RecentPerformance topic_performance(const std::string& topic, int n) const;

private:
  LearnerProfile profile_;
  const ConceptGraph& graph_;
  const AbilityEstimator& estimator_;
  double mastery_threshold_;
  Clock clock_;
};

} // namespace adapt

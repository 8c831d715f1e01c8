#pragma once

#include "ability_estimator.hpp"
#include "concept_graph.hpp"
#include "engine_config.hpp"
#include "item_catalog.hpp"
#include "learner_state.hpp"
#include "profile_store.hpp"
#include "ranking.hpp"
#include "selection_policy.hpp"
#include "timestamp.hpp"
#include "types.hpp"

#include "grading/feedback.hpp"
#include "grading/grading.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace adapt {

struct EngineSetup {
  EngineConfig config;
  // Canonical concept order; empty selects the built-in recursion curriculum.
  std::vector<ConceptGraph::Node> concepts;
  std::vector<Item> items;
  // Used as-is when set; otherwise loaded from `store`, else a default profile.
  std::optional<LearnerProfile> profile;
  std::string learner_id = "default_user";
  // Null selects the closest-difficulty ranker.
  std::shared_ptr<RankingCollaborator> ranker;
  // Optional; saved after every submission and feedback attachment.
  std::shared_ptr<ProfileStore> store;
  // Optional; receives "code_submit" and "feedback_submit" entries.
  std::shared_ptr<InteractionLog> interactions;
  Clock clock;
};

struct TopicStatistics {
  std::string topic;
  int total_items = 0;
  int total_attempts = 0;
  int correct_attempts = 0;
  // 0 when the topic has no attempts.
  double accuracy = 0.0;
  double current_theta = 0.0;
  ConceptStatus status = ConceptStatus::Locked;
};

class AssessmentEngine {
public:
  virtual ~AssessmentEngine() = default;

  virtual Next next_item() = 0;

  // Records the grader's verdict for `item_id`; throws std::out_of_range for
  // unknown items. A failed profile save is logged and reported through
  // RecordResult::persisted; the answer stays recorded.
  virtual RecordResult submit(const std::string& item_id,
                              const grading::GradingReport& report,
                              double time_taken) = 0;

  virtual bool attach_feedback(const std::string& item_id, nlohmann::json feedback) = 0;

  // Assessment of the most recent attempt at `item_id`, blending its grading
  // results with any attached feedback. nullopt when never attempted.
  virtual std::optional<grading::FeedbackAssessment> assess_feedback(const std::string& item_id) const = 0;

  // Unknown topics report zero counts and the default ability and status.
  virtual TopicStatistics topic_statistics(const std::string& topic) const = 0;

  // Appends to the interaction log when one is configured. Returns false
  // when there is none or the write failed.
  virtual bool log_interaction(const std::string& action, nlohmann::json details) = 0;

  virtual const EngineConfig& config() const = 0;
  virtual const ItemCatalog& catalog() const = 0;
  virtual const ConceptGraph& graph() const = 0;
  virtual const LearnerState& learner() const = 0;
  virtual const SelectionPolicy& policy() const = 0;
  virtual const LearnerProfile& profile() const = 0;

  virtual nlohmann::json progress_report() const = 0;
  virtual nlohmann::json concept_tree() const = 0;
  virtual nlohmann::json diagnostic() const = 0;
};

std::unique_ptr<AssessmentEngine> make_engine(EngineSetup setup);

} // namespace adapt

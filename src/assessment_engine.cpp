#include "adapt/assessment_engine.hpp"

#include "debug_log.hpp"
#include "json_bridge.hpp"
#include "resources/builtin_curriculum.hpp"

#include <exception>
#include <utility>

namespace adapt {

namespace {

EngineConfig validated(EngineConfig config) {
  config.validate();
  return config;
}

std::vector<ConceptGraph::Node> curriculum_or_default(std::vector<ConceptGraph::Node> nodes) {
  if (nodes.empty()) {
    return builtin::Recursion::nodes();
  }
  return nodes;
}

} // namespace

class AssessmentEngineImpl : public AssessmentEngine {
public:
  explicit AssessmentEngineImpl(EngineSetup setup)
      : config_(validated(setup.config)),
        catalog_(std::move(setup.items)),
        graph_(curriculum_or_default(std::move(setup.concepts))),
        estimator_(config_.estimator),
        store_(std::move(setup.store)),
        interactions_(std::move(setup.interactions)),
        clock_(setup.clock ? setup.clock : Clock(system_now)),
        assessor_(config_.feedback),
        learner_(initial_profile(setup), graph_, estimator_, config_.mastery_threshold, setup.clock),
        policy_(catalog_,
                learner_,
                config_.selection,
                setup.ranker ? std::move(setup.ranker) : std::make_shared<ClosestDifficultyRanker>(),
                setup.clock) {}

  Next next_item() override {
    return policy_.select_next();
  }

  RecordResult submit(const std::string& item_id,
                      const grading::GradingReport& report,
                      double time_taken) override {
    const Item& item = catalog_.at(item_id);
    auto result = learner_.record_answer(item, report.passed, time_taken, grading::to_json(report));
    result.persisted = persist();
    nlohmann::json details = {
        {"question_name", item.id},
        {"correct", report.passed},
        {"time_taken", time_taken},
        {"pass_rate", report.pass_rate},
    };
    log_interaction("code_submit", std::move(details));
    return result;
  }

  bool attach_feedback(const std::string& item_id, nlohmann::json feedback) override {
    nlohmann::json details = {
        {"question_name", item_id},
        {"difficulty_rating", rating_of(feedback, "difficulty_rating")},
        {"confidence_level", rating_of(feedback, "confidence_level")},
    };
    const bool attached = learner_.attach_feedback(item_id, std::move(feedback));
    if (attached) {
      persist();
      log_interaction("feedback_submit", std::move(details));
    }
    return attached;
  }

  std::optional<grading::FeedbackAssessment> assess_feedback(const std::string& item_id) const override {
    const auto& history = learner_.profile().history;
    const Outcome* latest = nullptr;
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
      if (it->item_id == item_id) {
        latest = &*it;
        break;
      }
    }
    if (!latest) {
      return std::nullopt;
    }

    grading::GradingReport report;
    if (latest->test_results.is_object()) {
      report = grading::report_from_json(latest->test_results);
    } else {
      // Imported histories may carry only the verdict.
      report.passed = latest->correct;
      report.pass_rate = latest->correct ? 1.0 : 0.0;
    }

    std::optional<double> difficulty;
    if (const Item* item = catalog_.find(item_id)) {
      difficulty = item->params.b;
    } else if (latest->params) {
      difficulty = latest->params->b;
    }
    return assessor_.assess(report, latest->time_taken, latest->subjective_feedback, difficulty);
  }

  TopicStatistics topic_statistics(const std::string& topic) const override {
    TopicStatistics stats;
    stats.topic = topic;
    stats.total_items = static_cast<int>(catalog_.items_for_topic(topic).size());
    for (const auto& outcome : learner_.profile().history) {
      const Item* item = catalog_.find(outcome.item_id);
      const std::string& outcome_topic = item ? item->topic : outcome.topic;
      if (outcome_topic != topic) {
        continue;
      }
      ++stats.total_attempts;
      if (outcome.correct) {
        ++stats.correct_attempts;
      }
    }
    if (stats.total_attempts > 0) {
      stats.accuracy = static_cast<double>(stats.correct_attempts) / stats.total_attempts;
    }
    stats.current_theta = learner_.theta(topic);
    stats.status = learner_.status(topic);
    return stats;
  }

  bool log_interaction(const std::string& action, nlohmann::json details) override {
    if (!interactions_) {
      return false;
    }
    try {
      interactions_->append(Interaction{format_iso8601(clock_()), action, std::move(details)});
    } catch (const std::exception& ex) {
      debug::log(debug::Channel::Learner, "interaction log write failed (" + action + "): " + ex.what());
      return false;
    }
    return true;
  }

  const EngineConfig& config() const override { return config_; }
  const ItemCatalog& catalog() const override { return catalog_; }
  const ConceptGraph& graph() const override { return graph_; }
  const LearnerState& learner() const override { return learner_; }
  const SelectionPolicy& policy() const override { return policy_; }
  const LearnerProfile& profile() const override { return learner_.profile(); }

  nlohmann::json progress_report() const override {
    nlohmann::json report = nlohmann::json::object();
    report["user_id"] = learner_.profile().learner_id;
    report["overall"] = bridge::to_json(learner_.overall_progress());
    nlohmann::json topics = nlohmann::json::array();
    for (const auto& name : graph_.concepts()) {
      topics.push_back(bridge::to_json(learner_.topic_progress(name)));
    }
    report["topics"] = topics;
    report["recent_performance"] = bridge::to_json(learner_.recent_performance());
    report["mastered"] = learner_.mastered_topics();
    report["available"] = learner_.available_topics();
    report["locked"] = learner_.locked_topics();
    return report;
  }

  nlohmann::json concept_tree() const override {
    nlohmann::json tree = graph_.to_json();
    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& name : graph_.concepts()) {
      nlohmann::json node = bridge::to_json(policy_.topic_readiness(name));
      node["level"] = graph_.concept_level(name);
      node["item_count"] = static_cast<int>(catalog_.items_for_topic(name).size());
      nodes.push_back(node);
    }
    tree["nodes"] = nodes;
    return tree;
  }

  nlohmann::json diagnostic() const override {
    nlohmann::json info = nlohmann::json::object();
    info["config"] = bridge::to_json(config_);
    info["user_id"] = learner_.profile().learner_id;
    info["item_count"] = static_cast<int>(catalog_.size());
    info["topics"] = catalog_.topics();
    info["history_size"] = static_cast<int>(learner_.profile().history.size());
    const auto focus = learner_.focus_topic();
    info["focus_topic"] = focus ? nlohmann::json(*focus) : nlohmann::json();
    const auto& ranker = policy_.ranker();
    info["ranker"] = ranker ? nlohmann::json(ranker->name()) : nlohmann::json();
    const auto& explanation = policy_.last_explanation();
    info["last_explanation"] = explanation ? nlohmann::json(*explanation) : nlohmann::json();
    nlohmann::json thetas = nlohmann::json::object();
    nlohmann::json statuses = nlohmann::json::object();
    for (const auto& name : graph_.concepts()) {
      thetas[name] = learner_.theta(name);
      statuses[name] = to_string(learner_.status(name));
    }
    info["theta_by_topic"] = thetas;
    info["concept_status"] = statuses;
    info["last_persist_error"] = last_persist_error_ ? nlohmann::json(*last_persist_error_) : nlohmann::json();
    return info;
  }

private:
  LearnerProfile initial_profile(EngineSetup& setup) {
    std::optional<LearnerProfile> stored;
    if (!setup.profile && store_) {
      stored = store_->load();
    }
    LearnerProfile profile;
    if (setup.profile) {
      profile = std::move(*setup.profile);
    } else if (stored) {
      profile = std::move(*stored);
    } else {
      profile = make_default_profile(graph_, config_, setup.learner_id);
    }

    // Older histories may omit the topic; recover it from the catalog.
    for (auto& outcome : profile.history) {
      if (!outcome.topic.empty()) {
        continue;
      }
      if (const Item* item = catalog_.find(outcome.item_id)) {
        outcome.topic = item->topic;
      }
    }
    return profile;
  }

  static nlohmann::json rating_of(const nlohmann::json& feedback, const char* key) {
    if (!feedback.is_object() || !feedback.contains(key)) {
      return nullptr;
    }
    return feedback[key];
  }

  // Saves the in-memory profile. A failure leaves the recorded state in place
  // and is reported through the return value and diagnostic().
  bool persist() {
    if (!store_) {
      return false;
    }
    try {
      store_->save(learner_.profile());
    } catch (const std::exception& ex) {
      last_persist_error_ = ex.what();
      debug::log(debug::Channel::Learner, std::string("profile save failed: ") + ex.what());
      return false;
    }
    last_persist_error_.reset();
    debug::log(debug::Channel::Learner, "profile saved");
    return true;
  }

  EngineConfig config_;
  ItemCatalog catalog_;
  ConceptGraph graph_;
  AbilityEstimator estimator_;
  std::shared_ptr<ProfileStore> store_;
  std::shared_ptr<InteractionLog> interactions_;
  Clock clock_;
  grading::FeedbackAssessor assessor_;
  std::optional<std::string> last_persist_error_;
  LearnerState learner_;
  SelectionPolicy policy_;
};

std::unique_ptr<AssessmentEngine> make_engine(EngineSetup setup) {
  return std::make_unique<AssessmentEngineImpl>(std::move(setup));
}

} // namespace adapt

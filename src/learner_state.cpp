#include "adapt/learner_state.hpp"

#include "debug_log.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace adapt {

namespace {

RecentPerformance summarize(const std::vector<const Outcome*>& outcomes) {
  RecentPerformance perf;
  if (outcomes.empty()) {
    return perf;
  }
  double total_time = 0.0;
  for (const Outcome* outcome : outcomes) {
    ++perf.attempts;
    if (outcome->correct) {
      ++perf.correct;
    }
    total_time += outcome->time_taken;
  }
  perf.accuracy = static_cast<double>(perf.correct) / perf.attempts;
  perf.average_time = total_time / perf.attempts;
  return perf;
}

template <typename Container>
Container tail(const Container& items, int n) {
  if (n <= 0) {
    return {};
  }
  const std::size_t count = static_cast<std::size_t>(n);
  if (items.size() <= count) {
    return items;
  }
  return Container(items.end() - static_cast<std::ptrdiff_t>(count), items.end());
}

} // namespace

LearnerProfile make_default_profile(const ConceptGraph& graph,
                                    const EngineConfig& config,
                                    std::string learner_id) {
  LearnerProfile profile;
  profile.learner_id = std::move(learner_id);
  for (const auto& name : graph.concepts()) {
    profile.theta_by_topic[name] = config.estimator.initial_theta;
  }
  profile.concept_status = graph.initial_statuses();
  return profile;
}

LearnerState::LearnerState(LearnerProfile profile,
                           const ConceptGraph& graph,
                           const AbilityEstimator& estimator,
                           double mastery_threshold,
                           Clock clock)
    : profile_(std::move(profile)),
      graph_(graph),
      estimator_(estimator),
      mastery_threshold_(mastery_threshold),
      clock_(clock ? std::move(clock) : Clock(system_now)) {}

double LearnerState::theta(const std::string& topic) const {
  auto it = profile_.theta_by_topic.find(topic);
  if (it == profile_.theta_by_topic.end()) {
    return estimator_.config().initial_theta;
  }
  return it->second;
}

ConceptStatus LearnerState::status(const std::string& concept_name) const {
  return ConceptGraph::status_of(profile_.concept_status, concept_name);
}

std::vector<const Outcome*> LearnerState::topic_history(const std::string& topic) const {
  std::vector<const Outcome*> out;
  for (const auto& outcome : profile_.history) {
    if (outcome.topic == topic) {
      out.push_back(&outcome);
    }
  }
  return out;
}

std::vector<std::string> LearnerState::refresh_unlocks() {
  std::vector<std::string> opened;
  for (const auto& name : graph_.unlockable_concepts(profile_.concept_status)) {
    graph_.open(name, profile_.concept_status);
    opened.push_back(name);
  }
  if (!opened.empty() && debug::enabled(debug::Channel::Learner)) {
    for (const auto& name : opened) {
      debug::log(debug::Channel::Learner, "opened " + name + " (prerequisites mastered)");
    }
  }
  return opened;
}

RecordResult LearnerState::record_answer(const Item& item,
                                         bool correct,
                                         double time_taken,
                                         nlohmann::json test_results) {
  RecordResult result;
  result.unlocked = refresh_unlocks();

  const std::string& topic = item.topic;
  result.status_before = status(topic);

  const double theta_before = theta(topic);
  const double theta_after =
      estimator_.update_theta(theta_before, item.params, correct, topic_history(topic));
  profile_.theta_by_topic[topic] = theta_after;

  Outcome outcome;
  outcome.item_id = item.id;
  outcome.topic = topic;
  outcome.params = item.params;
  outcome.correct = correct;
  outcome.timestamp = format_iso8601(clock_());
  outcome.time_taken = time_taken;
  outcome.theta_before = theta_before;
  outcome.theta_after = theta_after;
  outcome.test_results = std::move(test_results);
  profile_.history.push_back(outcome);

  if (graph_.contains(topic) && status(topic) == ConceptStatus::Opened &&
      theta_after >= mastery_threshold_) {
    auto opened = graph_.master(topic, profile_.concept_status);
    debug::log(debug::Channel::Learner, "mastered " + topic);
    for (auto& name : opened) {
      debug::log(debug::Channel::Learner, "opened " + name + " after mastering " + topic);
      result.unlocked.push_back(std::move(name));
    }
  }
  result.status_after = status(topic);

  if (debug::enabled(debug::Channel::Learner)) {
    std::ostringstream oss;
    oss << "recorded " << item.id << " correct=" << (correct ? "true" : "false")
        << " theta " << theta_before << " -> " << theta_after
        << " status " << to_string(result.status_before) << " -> " << to_string(result.status_after);
    debug::log(debug::Channel::Learner, oss.str());
  }

  result.outcome = std::move(outcome);
  return result;
}

bool LearnerState::attach_feedback(const std::string& item_id, nlohmann::json feedback) {
  for (auto it = profile_.history.rbegin(); it != profile_.history.rend(); ++it) {
    if (it->item_id == item_id) {
      it->subjective_feedback = std::move(feedback);
      return true;
    }
  }
  return false;
}

int LearnerState::attempt_count(const std::string& item_id) const {
  return static_cast<int>(std::count_if(profile_.history.begin(), profile_.history.end(),
                                        [&](const Outcome& outcome) { return outcome.item_id == item_id; }));
}

std::optional<std::string> LearnerState::focus_topic() const {
  return graph_.next_concept_to_learn(profile_.concept_status);
}

std::vector<std::string> LearnerState::mastered_topics() const {
  return graph_.concepts_with_status(profile_.concept_status, ConceptStatus::Mastered);
}

std::vector<std::string> LearnerState::locked_topics() const {
  return graph_.concepts_with_status(profile_.concept_status, ConceptStatus::Locked);
}

std::vector<std::string> LearnerState::available_topics() const {
  return graph_.available_concepts(profile_.concept_status);
}

TopicProgress LearnerState::topic_progress(const std::string& topic) const {
  TopicProgress progress;
  progress.topic = topic;
  progress.theta = theta(topic);
  progress.status = status(topic);
  progress.mastery_threshold = mastery_threshold_;
  progress.attempts = static_cast<int>(topic_history(topic).size());

  if (progress.status == ConceptStatus::Mastered) {
    progress.progress_percent = 100.0;
  } else if (progress.status == ConceptStatus::Opened) {
    const double start = estimator_.config().initial_theta;
    const double span = mastery_threshold_ - start;
    if (span <= 0.0) {
      progress.progress_percent = progress.theta >= mastery_threshold_ ? 100.0 : 0.0;
    } else {
      progress.progress_percent = std::clamp((progress.theta - start) / span * 100.0, 0.0, 100.0);
    }
  }
  return progress;
}

OverallProgress LearnerState::overall_progress() const {
  OverallProgress overall;
  overall.total_topics = static_cast<int>(graph_.concepts().size());
  overall.mastered = static_cast<int>(mastered_topics().size());
  overall.locked = static_cast<int>(locked_topics().size());
  overall.in_progress = static_cast<int>(
      graph_.concepts_with_status(profile_.concept_status, ConceptStatus::Opened).size());
  if (overall.total_topics > 0) {
    overall.overall_progress_percent = 100.0 * overall.mastered / overall.total_topics;
  }
  overall.total_attempts = static_cast<int>(profile_.history.size());
  overall.current_focus = focus_topic();
  return overall;
}

RecentPerformance LearnerState::recent_performance(int n) const {
  std::vector<const Outcome*> all;
  all.reserve(profile_.history.size());
  for (const auto& outcome : profile_.history) {
    all.push_back(&outcome);
  }
  return summarize(tail(all, n));
}

RecentPerformance LearnerState::topic_performance(const std::string& topic, int n) const {
  return summarize(tail(topic_history(topic), n));
}

} // namespace adapt

#include "adapt/ability_estimator.hpp"
#include "adapt/concept_graph.hpp"
#include "adapt/engine_config.hpp"
#include "adapt/learner_state.hpp"
#include "adapt/timestamp.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

constexpr double kThreshold = 0.5;

adapt::TimePoint fixed_time() {
  return adapt::TimePoint(std::chrono::seconds(1700000000));
}

adapt::Item make_item(const std::string& id, const std::string& topic, double b = 0.0) {
  adapt::Item item;
  item.id = id;
  item.topic = topic;
  item.params = adapt::ItemParams{1.5, b, 0.0};
  return item;
}

bool contains(const std::vector<std::string>& values, const std::string& wanted) {
  return std::find(values.begin(), values.end(), wanted) != values.end();
}

struct Fixture {
  adapt::EngineConfig config;
  adapt::ConceptGraph graph{{{"A", {}}, {"B", {"A"}}}};
  adapt::AbilityEstimator estimator{config.estimator};
  adapt::LearnerState learner{adapt::make_default_profile(graph, config, "tester"), graph, estimator,
                              kThreshold, fixed_time};
};

void test_default_profile(TestSuite& suite) {
  Fixture fx;
  const auto& profile = fx.learner.profile();
  suite.require(profile.learner_id == "tester", "learner id should come from the factory");
  suite.require(profile.theta_by_topic.at("A") == 0.0 && profile.theta_by_topic.at("B") == 0.0,
                "every concept should start at the initial ability");
  suite.require(fx.learner.status("A") == adapt::ConceptStatus::Opened, "root concept starts opened");
  suite.require(fx.learner.status("B") == adapt::ConceptStatus::Locked, "dependent concept starts locked");
  suite.require(profile.history.empty(), "fresh profile has no history");
  suite.require(fx.learner.theta("unknown") == 0.0, "unknown topics read the initial ability");
}

void test_mastery_on_updated_theta(TestSuite& suite) {
  Fixture fx;
  const auto item = make_item("a1", "A");

  const auto first = fx.learner.record_answer(item, true, 12.0);
  suite.require(first.outcome.theta_before == 0.0 && first.outcome.theta_after == 0.0,
                "one answer is below the minimum and should not move theta");
  suite.require(first.outcome.timestamp == "2023-11-14T22:13:20.000000",
                "timestamp should come from the injected clock");
  suite.require(first.status_after == adapt::ConceptStatus::Opened, "A is not mastered yet");

  const auto second = fx.learner.record_answer(item, true, 8.0);
  suite.require(second.outcome.theta_after > second.outcome.theta_before,
                "second correct answer should raise theta");
  suite.require(second.outcome.theta_after >= kThreshold, "two correct answers should cross the threshold");
  suite.require(second.status_before == adapt::ConceptStatus::Opened, "status before should be opened");
  suite.require(second.status_after == adapt::ConceptStatus::Mastered,
                "mastery should be evaluated on the updated theta");
  suite.require(contains(second.unlocked, "B"), "mastering A should report B as unlocked");
  suite.require(fx.learner.status("B") == adapt::ConceptStatus::Opened, "B should be opened");
  suite.require(fx.learner.theta("A") == second.outcome.theta_after, "profile theta should be updated");
  suite.require(fx.learner.profile().history.size() == 2, "history should grow by one per answer");
  suite.require(fx.learner.profile().history[1].params.has_value(),
                "outcomes should snapshot item parameters");
}

void test_status_is_monotonic(TestSuite& suite) {
  Fixture fx;
  const auto item = make_item("a1", "A");
  fx.learner.record_answer(item, true);
  fx.learner.record_answer(item, true);
  suite.require(fx.learner.status("A") == adapt::ConceptStatus::Mastered, "A should be mastered");

  for (int i = 0; i < 5; ++i) {
    fx.learner.record_answer(item, false);
  }
  suite.require(fx.learner.theta("A") < kThreshold, "wrong answers should pull theta back down");
  suite.require(fx.learner.status("A") == adapt::ConceptStatus::Mastered,
                "mastered status should never regress");

  const auto& history = fx.learner.profile().history;
  suite.require(history.size() == 7, "every answer should be kept");
  suite.require(history.front().correct && !history.back().correct, "history should stay in answer order");
}

void test_unlock_sweep(TestSuite& suite) {
  adapt::EngineConfig config;
  adapt::ConceptGraph graph({{"A", {}}, {"B", {"A"}}});
  adapt::AbilityEstimator estimator(config.estimator);
  auto profile = adapt::make_default_profile(graph, config);
  profile.concept_status["A"] = adapt::ConceptStatus::Mastered;

  adapt::LearnerState learner(profile, graph, estimator, kThreshold, fixed_time);
  suite.require(learner.status("B") == adapt::ConceptStatus::Locked, "B is still locked as loaded");
  const auto result = learner.record_answer(make_item("a1", "A"), true);
  suite.require(contains(result.unlocked, "B"), "record_answer should run the unlock sweep first");
  suite.require(learner.status("B") == adapt::ConceptStatus::Opened, "B should be opened by the sweep");
  suite.require(learner.refresh_unlocks().empty(), "a second sweep should find nothing");
}

void test_topic_outside_graph(TestSuite& suite) {
  Fixture fx;
  const auto item = make_item("z1", "Z");
  fx.learner.record_answer(item, true);
  const auto result = fx.learner.record_answer(item, true);
  suite.require(result.outcome.theta_after > 0.0, "topics outside the graph still track ability");
  suite.require(result.status_after == adapt::ConceptStatus::Locked, "unknown topics never change status");
  suite.require(fx.learner.topic_history("Z").size() == 2, "topic history should filter by topic");
  suite.require(fx.learner.topic_history("A").empty(), "other topics should not see Z answers");
}

void test_feedback_and_progress(TestSuite& suite) {
  Fixture fx;
  const auto item = make_item("a1", "A");
  const auto other = make_item("a2", "A", 1.0);
  fx.learner.record_answer(item, false, 10.0);
  fx.learner.record_answer(other, true, 20.0);
  fx.learner.record_answer(item, true, 30.0);

  suite.require(fx.learner.attach_feedback("a1", {{"difficulty", 3}}), "feedback should attach to a1");
  suite.require(!fx.learner.attach_feedback("missing", {{"difficulty", 1}}), "unknown items have no outcome");
  const auto& history = fx.learner.profile().history;
  suite.require(history[0].subjective_feedback.is_null(), "older a1 outcome should be untouched");
  suite.require(history[2].subjective_feedback["difficulty"] == 3, "latest a1 outcome gets the feedback");

  const auto recent = fx.learner.recent_performance(2);
  suite.require(recent.attempts == 2 && recent.correct == 2, "recent window should hold the last two");
  suite.require(std::fabs(recent.average_time - 25.0) < 1e-9, "average time should cover the window");
  const auto overall_perf = fx.learner.recent_performance();
  suite.require(std::fabs(overall_perf.accuracy - 2.0 / 3.0) < 1e-9, "accuracy should be correct/attempts");

  const auto progress_a = fx.learner.topic_progress("A");
  suite.require(progress_a.attempts == 3, "topic progress should count attempts");
  const auto progress_b = fx.learner.topic_progress("B");
  suite.require(progress_b.progress_percent == 0.0, "B has made no progress");

  const auto overall = fx.learner.overall_progress();
  suite.require(overall.total_topics == 2, "two topics in the graph");
  suite.require(overall.total_attempts == 3, "overall attempts should count every answer");
  suite.require(overall.current_focus.has_value(), "some topic should be in focus");
}

void test_progress_percentages(TestSuite& suite) {
  adapt::EngineConfig config;
  adapt::ConceptGraph graph({{"A", {}}, {"B", {"A"}}});
  adapt::AbilityEstimator estimator(config.estimator);
  auto profile = adapt::make_default_profile(graph, config);
  profile.theta_by_topic["A"] = 0.25;
  adapt::LearnerState learner(profile, graph, estimator, kThreshold, fixed_time);

  suite.require(std::fabs(learner.topic_progress("A").progress_percent - 50.0) < 1e-9,
                "halfway to the threshold should be 50 percent");
  suite.require(learner.topic_progress("B").progress_percent == 0.0, "locked topic should be 0 percent");
  suite.require(learner.mastered_topics().empty(), "nothing mastered yet");
  suite.require(learner.available_topics() == std::vector<std::string>({"A"}), "only A is available");
  suite.require(learner.locked_topics() == std::vector<std::string>({"B"}), "only B is locked");
  suite.require(learner.focus_topic() == std::optional<std::string>("A"), "A should be in focus");
}

} // namespace

int main() {
  TestSuite suite;

  test_default_profile(suite);
  test_mastery_on_updated_theta(suite);
  test_status_is_monotonic(suite);
  test_unlock_sweep(suite);
  test_topic_outside_graph(suite);
  test_feedback_and_progress(suite);
  test_progress_percentages(suite);

  if (!suite.ok) {
    std::cerr << "Learner state tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Learner state tests passed" << std::endl;
  return 0;
}

#include "grading/feedback.hpp"
#include "grading/grading.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
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

bool near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

adapt::grading::GradingReport report_with(int passed, int total) {
  std::vector<adapt::grading::TestResult> tests;
  for (int i = 1; i <= total; ++i) {
    adapt::grading::TestResult test;
    test.number = i;
    test.passed = i <= passed;
    tests.push_back(test);
  }
  return adapt::grading::summarize(tests);
}

bool contains(const std::vector<std::string>& lines, const std::string& text) {
  for (const auto& line : lines) {
    if (line == text) {
      return true;
    }
  }
  return false;
}

void test_objective_metrics(TestSuite& suite) {
  const auto partial = adapt::grading::objective_metrics(report_with(3, 4), 90.0);
  suite.require(partial.success && !partial.all_passed, "a partial run executed but did not pass");
  suite.require(near(partial.performance_score, 0.75), "performance equals the pass rate");
  suite.require(partial.passed_tests == 3 && partial.total_tests == 4, "counts are carried over");
  suite.require(partial.time_taken == 90.0, "time is carried over");

  const auto crashed = adapt::grading::objective_metrics(adapt::grading::failed_run("SyntaxError"), 4.0);
  suite.require(!crashed.success && crashed.performance_score == 0.0, "a run that never executed scores zero");
  suite.require(crashed.error == "SyntaxError", "the grader's error is kept");
  suite.require(!adapt::grading::should_adjust_theta(crashed), "abilities do not move on a crashed run");
  suite.require(adapt::grading::should_adjust_theta(partial), "abilities move on any executed run");
}

void test_subjective_metrics(TestSuite& suite) {
  const auto missing = adapt::grading::subjective_metrics(nullptr);
  suite.require(!missing.provided && near(missing.subjective_score, 0.5), "no feedback is neutral");
  suite.require(!missing.difficulty_rating && !missing.confidence_level, "no ratings without feedback");
  suite.require(!adapt::grading::subjective_metrics(nlohmann::json::object()).provided,
                "an empty object counts as no feedback");

  const auto defaults = adapt::grading::subjective_metrics({{"notes", "tricky base case"}});
  suite.require(defaults.provided, "any non-empty object counts as feedback");
  suite.require(defaults.difficulty_rating == 3.0 && defaults.confidence_level == 3.0,
                "missing ratings default to the middle of the scale");
  suite.require(near(defaults.subjective_score, 0.5 * 0.7 + 0.5 * 0.3), "neutral ratings score 0.5");
  suite.require(defaults.notes == "tricky base case", "notes are kept");

  const auto easy = adapt::grading::subjective_metrics({{"difficulty_rating", 1}, {"confidence_level", 5}});
  suite.require(near(easy.difficulty_normalized, 0.0) && near(easy.confidence_normalized, 1.0),
                "ratings normalize from 1..5 onto 0..1");
  suite.require(near(easy.subjective_score, 1.0), "easy and confident scores one");

  bool threw = false;
  try {
    adapt::grading::subjective_metrics({{"difficulty_rating", "hard"}});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  suite.require(threw, "non-numeric ratings should be rejected");

  threw = false;
  try {
    adapt::grading::subjective_metrics("loved it");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  suite.require(threw, "feedback must be an object");
}

void test_combination(TestSuite& suite) {
  const adapt::grading::FeedbackAssessor assessor;
  suite.require(assessor.config().objective_weight == 0.7 && assessor.config().subjective_weight == 0.3,
                "default weights favour the grader");

  const auto objective = adapt::grading::objective_metrics(report_with(1, 2), 30.0);
  const auto none = adapt::grading::subjective_metrics(nullptr);
  const auto alone = assessor.combine(objective, none);
  suite.require(near(alone.combined_score, 0.5), "without feedback only the objective score counts");
  suite.require(alone.objective_weight_used == 1.0 && alone.subjective_weight_used == 0.0,
                "reported weights reflect the missing feedback");
  suite.require(alone.assessment == adapt::grading::Assessment::Fair, "0.5 is fair");
  suite.require(!alone.discrepancy, "no discrepancy without feedback");

  const auto confident = adapt::grading::subjective_metrics({{"difficulty_rating", 1}, {"confidence_level", 5}});
  const auto blended = assessor.combine(objective, confident);
  suite.require(near(blended.combined_score, 0.5 * 0.7 + 1.0 * 0.3), "feedback is blended in");
  suite.require(blended.assessment == adapt::grading::Assessment::Good, "0.65 is good");
  suite.require(blended.discrepancy == adapt::grading::Discrepancy::UnderestimatingDifficulty,
                "feeling sure while failing half the tests underestimates the difficulty");

  const auto neutral = adapt::grading::subjective_metrics({{"difficulty_rating", 3}, {"confidence_level", 3}});
  suite.require(!assessor.combine(objective, neutral).discrepancy, "a gap of 0.3 or less is not a discrepancy");

  const auto failed = adapt::grading::objective_metrics(report_with(0, 3), 30.0);
  suite.require(assessor.combine(failed, none).assessment == adapt::grading::Assessment::NeedsImprovement,
                "scores under 0.4 need improvement");

  const adapt::grading::FeedbackAssessor even(adapt::FeedbackConfig{0.5, 0.5});
  suite.require(near(even.combine(objective, confident).combined_score, 0.75), "configured weights apply");

  bool threw = false;
  try {
    adapt::grading::FeedbackAssessor negative(adapt::FeedbackConfig{0.7, -0.3});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  suite.require(threw, "negative weights should be rejected");
}

void test_recommendations(TestSuite& suite) {
  const adapt::grading::FeedbackAssessor assessor;

  const auto nothing = assessor.assess(report_with(0, 4), 10.0);
  suite.require(contains(nothing.recommendations,
                         "Review the problem description carefully and ensure you understand the requirements."),
                "no passing tests points back at the problem statement");

  const auto some = assessor.assess(report_with(1, 4), 10.0);
  suite.require(contains(some.recommendations,
                         "You're on the right track, but there are some edge cases to handle. "
                         "Check the failed test cases for patterns."),
                "under half passing points at edge cases");

  const auto most = assessor.assess(report_with(3, 4), 10.0);
  suite.require(contains(most.recommendations,
                         "Almost there! Review the hidden test cases - they often test boundary conditions."),
                "most passing points at hidden tests");
  suite.require(contains(most.recommendations, "Good job! You're making solid progress."),
                "0.75 earns the good note");

  const auto breeze = assessor.assess(report_with(4, 4), 10.0, {{"difficulty_rating", 1}, {"confidence_level", 5}});
  suite.require(contains(breeze.recommendations,
                         "Great job! You found this easy. You're ready for more challenging problems in this topic."),
                "easy and confident suggests harder problems");
  suite.require(contains(breeze.recommendations, "Excellent work! Keep up the great progress."),
                "a perfect blended score is excellent");

  const auto surprised = assessor.assess(report_with(4, 4), 10.0, {{"difficulty_rating", 5}, {"confidence_level", 1}});
  suite.require(contains(surprised.recommendations, "You did better than you thought! Trust your skills more."),
                "outperforming one's own rating is called out");

  const auto overconfident =
      assessor.assess(report_with(0, 4), 10.0, {{"difficulty_rating", 1}, {"confidence_level", 5}});
  suite.require(contains(overconfident.recommendations,
                         "This was trickier than it seemed. Pay attention to edge cases and problem constraints."),
                "underperforming one's own rating is called out");

  const auto crashed = assessor.assess(adapt::grading::failed_run("Timeout"), 10.0);
  suite.require(crashed.recommendations.size() == 1, "a crashed run gets the problem-statement note only");
}

void test_perception(TestSuite& suite) {
  const auto accurate = adapt::grading::analyze_perception(0.0, 1.0, 0.6);
  suite.require(near(accurate.expected_difficulty, 0.5), "b = 0 sits in the middle");
  suite.require(near(accurate.perception_gap, 0.1) && near(accurate.performance_gap, -0.5), "gaps are signed");
  suite.require(accurate.accuracy == adapt::grading::PerceptionAccuracy::Accurate, "a gap under 0.2 is accurate");

  suite.require(adapt::grading::analyze_perception(-2.0, 1.0, 0.75).accuracy ==
                    adapt::grading::PerceptionAccuracy::Overestimating,
                "rating an easy item hard overestimates it");
  suite.require(adapt::grading::analyze_perception(2.0, 0.0, 0.25).accuracy ==
                    adapt::grading::PerceptionAccuracy::Underestimating,
                "rating a hard item easy underestimates it");

  const adapt::grading::FeedbackAssessor assessor;
  suite.require(!assessor.assess(report_with(1, 1), 5.0, nullptr, 0.0).perception,
                "perception needs feedback");
  suite.require(!assessor.assess(report_with(1, 1), 5.0, {{"difficulty_rating", 2}}).perception,
                "perception needs the item difficulty");
  suite.require(assessor.assess(report_with(1, 1), 5.0, {{"difficulty_rating", 2}}, 0.0).perception.has_value(),
                "both inputs produce a perception analysis");
}

void test_summary_and_json(TestSuite& suite) {
  const adapt::grading::FeedbackAssessor assessor;
  const auto partial = assessor.assess(report_with(1, 4), 30.0);
  suite.require(adapt::grading::feedback_summary(partial) == "Needs Improvement (Score: 0.25)\nTests: 1/4 passed\n",
                "summary for a partial run");

  const auto clean = assessor.assess(report_with(2, 2), 30.0);
  suite.require(adapt::grading::feedback_summary(clean) == "Excellent (Score: 1.00)\n\xE2\x9C\x93 All tests passed!\n",
                "summary for a clean run");

  const auto crashed = assessor.assess(adapt::grading::failed_run("Timeout"), 30.0);
  suite.require(adapt::grading::feedback_summary(crashed) == "Error: Timeout", "summary for a crashed run");

  const auto json = adapt::grading::to_json(assessor.assess(report_with(3, 4), 30.0, {{"confidence_level", 4}}, 0.5));
  suite.require(json["objective_metrics"]["time_score"] == 1.0, "time never lowers the objective score");
  suite.require(json["subjective_metrics"]["provided"] == true, "feedback is reported as provided");
  suite.require(json["combined_assessment"]["objective_weight_used"] == 0.7, "weights are reported");
  suite.require(json["combined_assessment"]["discrepancy"].is_null(), "a small gap reports no discrepancy");
  suite.require(json.contains("perception") && json["perception"].contains("perception_accuracy"),
                "perception is included when available");
  suite.require(json["recommendations"].is_array(), "recommendations are listed");

  const auto crashed_json = adapt::grading::to_json(crashed);
  suite.require(crashed_json["objective_metrics"]["error"] == "Timeout", "errors are reported");
  suite.require(crashed_json["subjective_metrics"]["difficulty_rating"].is_null(), "missing ratings are null");
}

} // namespace

int main() {
  TestSuite suite;

  test_objective_metrics(suite);
  test_subjective_metrics(suite);
  test_combination(suite);
  test_recommendations(suite);
  test_perception(suite);
  test_summary_and_json(suite);

  if (!suite.ok) {
    std::cerr << "Feedback tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Feedback tests passed" << std::endl;
  return 0;
}

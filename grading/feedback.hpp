#pragma once

#include "grading.hpp"

#include "adapt/engine_config.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace adapt::grading {

enum class Assessment { Excellent, Good, Fair, NeedsImprovement };
enum class Discrepancy { OverestimatingDifficulty, UnderestimatingDifficulty };
enum class PerceptionAccuracy { Accurate, Overestimating, Underestimating };

std::string to_string(Assessment assessment);
std::string to_string(Discrepancy discrepancy);
std::string to_string(PerceptionAccuracy accuracy);

struct ObjectiveMetrics {
  bool success = false;
  double pass_rate = 0.0;
  bool all_passed = false;
  int passed_tests = 0;
  int total_tests = 0;
  double time_taken = 0.0;
  // Equal to the pass rate; a run that could not execute scores 0.
  double performance_score = 0.0;
  std::string error;
};

// Ratings are on a 1..5 scale (difficulty: 1 easy, confidence: 1 low).
struct SubjectiveMetrics {
  bool provided = false;
  std::optional<double> difficulty_rating;
  std::optional<double> confidence_level;
  double difficulty_normalized = 0.0;
  double confidence_normalized = 0.0;
  double subjective_score = 0.5;
  std::string notes;
};

struct CombinedAssessment {
  double combined_score = 0.0;
  Assessment assessment = Assessment::NeedsImprovement;
  std::optional<Discrepancy> discrepancy;
  double objective_weight_used = 1.0;
  double subjective_weight_used = 0.0;
};

struct PerceptionAnalysis {
  double expected_difficulty = 0.0;
  double perceived_difficulty = 0.0;
  double actual_performance = 0.0;
  double perception_gap = 0.0;
  double performance_gap = 0.0;
  PerceptionAccuracy accuracy = PerceptionAccuracy::Accurate;
};

struct FeedbackAssessment {
  ObjectiveMetrics objective;
  SubjectiveMetrics subjective;
  CombinedAssessment combined;
  std::vector<std::string> recommendations;
  std::optional<PerceptionAnalysis> perception;
};

ObjectiveMetrics objective_metrics(const GradingReport& report, double time_taken);

// Null or an empty object means no feedback was given. Missing ratings
// default to 3. Throws std::invalid_argument for anything but an object or
// for non-numeric ratings.
SubjectiveMetrics subjective_metrics(const nlohmann::json& feedback);

// Compares the learner's normalized perceived difficulty with the item's
// difficulty mapped from [-4, 4] onto [0, 1].
PerceptionAnalysis analyze_perception(double item_difficulty,
                                      double actual_performance,
                                      double perceived_difficulty);

// Ability updates only follow submissions that actually ran.
bool should_adjust_theta(const ObjectiveMetrics& objective);

/**
 * Blends grader results with the learner's self-assessment.
 *
 * The subjective weight only applies when feedback was provided; otherwise
 * the objective score stands alone. Scores of 0.8, 0.6 and 0.4 separate the
 * four assessment bands, and a gap above 0.3 between the two scores is
 * reported as a discrepancy.
 */
class FeedbackAssessor {
public:
  explicit FeedbackAssessor(FeedbackConfig config = {});

  const FeedbackConfig& config() const { return config_; }

  CombinedAssessment combine(const ObjectiveMetrics& objective, const SubjectiveMetrics& subjective) const;
  std::vector<std::string> recommendations(const ObjectiveMetrics& objective,
                                           const SubjectiveMetrics& subjective,
                                           const CombinedAssessment& combined) const;

  // Adds a perception analysis when both the item difficulty and feedback
  // are available.
  FeedbackAssessment assess(const GradingReport& report,
                            double time_taken,
                            const nlohmann::json& feedback = nullptr,
                            std::optional<double> item_difficulty = std::nullopt) const;

private:
  FeedbackConfig config_;
};

// "Good (Score: 0.72)\nTests: 3/4 passed\n", or "Error: ..." for runs that
// did not execute.
std::string feedback_summary(const FeedbackAssessment& assessment);

nlohmann::json to_json(const PerceptionAnalysis& analysis);
nlohmann::json to_json(const FeedbackAssessment& assessment);

} // namespace adapt::grading

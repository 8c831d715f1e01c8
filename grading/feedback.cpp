#include "feedback.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace adapt::grading {

namespace {

constexpr double kExcellentScore = 0.8;
constexpr double kGoodScore = 0.6;
constexpr double kFairScore = 0.4;
constexpr double kDiscrepancyGap = 0.3;
constexpr double kAccuratePerceptionGap = 0.2;
constexpr double kNeutralRating = 3.0;
constexpr double kConfidenceShare = 0.7;
constexpr double kEaseShare = 0.3;

double read_rating(const nlohmann::json& feedback, const char* key) {
  if (!feedback.contains(key) || feedback[key].is_null()) {
    return kNeutralRating;
  }
  const auto& value = feedback[key];
  if (!value.is_number()) {
    throw std::invalid_argument(std::string("Expected number for field '") + key + "'");
  }
  const double rating = value.get<double>();
  if (!std::isfinite(rating)) {
    throw std::invalid_argument(std::string("Expected finite number for field '") + key + "'");
  }
  return rating;
}

double normalize_rating(double rating) {
  return (rating - 1.0) / 4.0;
}

nlohmann::json optional_number(const std::optional<double>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json();
}

std::string title_case(const std::string& snake) {
  std::string out;
  bool upper = true;
  for (char ch : snake) {
    if (ch == '_') {
      out += ' ';
      upper = true;
      continue;
    }
    out += upper ? static_cast<char>(std::toupper(static_cast<unsigned char>(ch))) : ch;
    upper = false;
  }
  return out;
}

} // namespace

std::string to_string(Assessment assessment) {
  switch (assessment) {
    case Assessment::Excellent:
      return "excellent";
    case Assessment::Good:
      return "good";
    case Assessment::Fair:
      return "fair";
    case Assessment::NeedsImprovement:
      return "needs_improvement";
  }
  return "needs_improvement";
}

std::string to_string(Discrepancy discrepancy) {
  switch (discrepancy) {
    case Discrepancy::OverestimatingDifficulty:
      return "overestimating_difficulty";
    case Discrepancy::UnderestimatingDifficulty:
      return "underestimating_difficulty";
  }
  return "overestimating_difficulty";
}

std::string to_string(PerceptionAccuracy accuracy) {
  switch (accuracy) {
    case PerceptionAccuracy::Accurate:
      return "accurate";
    case PerceptionAccuracy::Overestimating:
      return "overestimating";
    case PerceptionAccuracy::Underestimating:
      return "underestimating";
  }
  return "accurate";
}

ObjectiveMetrics objective_metrics(const GradingReport& report, double time_taken) {
  ObjectiveMetrics metrics;
  metrics.time_taken = time_taken;
  if (!report.success) {
    metrics.error = report.error.empty() ? std::string("Unknown error") : report.error;
    return metrics;
  }
  metrics.success = true;
  metrics.pass_rate = report.pass_rate;
  metrics.all_passed = report.passed;
  metrics.passed_tests = report.passed_tests;
  metrics.total_tests = report.total_tests;
  metrics.performance_score = report.pass_rate;
  return metrics;
}

SubjectiveMetrics subjective_metrics(const nlohmann::json& feedback) {
  SubjectiveMetrics metrics;
  if (feedback.is_null()) {
    return metrics;
  }
  if (!feedback.is_object()) {
    throw std::invalid_argument("Subjective feedback must be an object");
  }
  if (feedback.empty()) {
    return metrics;
  }
  metrics.provided = true;
  const double difficulty = read_rating(feedback, "difficulty_rating");
  const double confidence = read_rating(feedback, "confidence_level");
  metrics.difficulty_rating = difficulty;
  metrics.confidence_level = confidence;
  metrics.difficulty_normalized = normalize_rating(difficulty);
  metrics.confidence_normalized = normalize_rating(confidence);
  metrics.subjective_score =
      metrics.confidence_normalized * kConfidenceShare + (1.0 - metrics.difficulty_normalized) * kEaseShare;
  if (feedback.contains("notes") && feedback["notes"].is_string()) {
    metrics.notes = feedback["notes"].get<std::string>();
  }
  return metrics;
}

PerceptionAnalysis analyze_perception(double item_difficulty,
                                      double actual_performance,
                                      double perceived_difficulty) {
  PerceptionAnalysis analysis;
  analysis.expected_difficulty = (item_difficulty + 4.0) / 8.0;
  analysis.perceived_difficulty = perceived_difficulty;
  analysis.actual_performance = actual_performance;
  analysis.perception_gap = perceived_difficulty - analysis.expected_difficulty;
  analysis.performance_gap = analysis.expected_difficulty - actual_performance;
  if (std::fabs(analysis.perception_gap) < kAccuratePerceptionGap) {
    analysis.accuracy = PerceptionAccuracy::Accurate;
  } else if (analysis.perception_gap > 0.0) {
    analysis.accuracy = PerceptionAccuracy::Overestimating;
  } else {
    analysis.accuracy = PerceptionAccuracy::Underestimating;
  }
  return analysis;
}

bool should_adjust_theta(const ObjectiveMetrics& objective) {
  return objective.success;
}

FeedbackAssessor::FeedbackAssessor(FeedbackConfig config) : config_(config) {
  config_.validate();
}

CombinedAssessment FeedbackAssessor::combine(const ObjectiveMetrics& objective,
                                             const SubjectiveMetrics& subjective) const {
  CombinedAssessment combined;
  const double objective_score = objective.performance_score;
  const double subjective_score = subjective.subjective_score;

  if (subjective.provided) {
    combined.combined_score =
        objective_score * config_.objective_weight + subjective_score * config_.subjective_weight;
    combined.objective_weight_used = config_.objective_weight;
    combined.subjective_weight_used = config_.subjective_weight;
  } else {
    combined.combined_score = objective_score;
  }

  if (combined.combined_score >= kExcellentScore) {
    combined.assessment = Assessment::Excellent;
  } else if (combined.combined_score >= kGoodScore) {
    combined.assessment = Assessment::Good;
  } else if (combined.combined_score >= kFairScore) {
    combined.assessment = Assessment::Fair;
  } else {
    combined.assessment = Assessment::NeedsImprovement;
  }

  if (subjective.provided && std::fabs(objective_score - subjective_score) > kDiscrepancyGap) {
    combined.discrepancy = objective_score > subjective_score ? Discrepancy::OverestimatingDifficulty
                                                              : Discrepancy::UnderestimatingDifficulty;
  }
  return combined;
}

std::vector<std::string> FeedbackAssessor::recommendations(const ObjectiveMetrics& objective,
                                                           const SubjectiveMetrics& subjective,
                                                           const CombinedAssessment& combined) const {
  std::vector<std::string> out;

  if (!objective.all_passed) {
    if (objective.pass_rate == 0.0) {
      out.emplace_back("Review the problem description carefully and ensure you understand the requirements.");
    } else if (objective.pass_rate < 0.5) {
      out.emplace_back(
          "You're on the right track, but there are some edge cases to handle. "
          "Check the failed test cases for patterns.");
    } else {
      out.emplace_back("Almost there! Review the hidden test cases - they often test boundary conditions.");
    }
  }

  if (subjective.provided) {
    const double difficulty = subjective.difficulty_rating.value_or(kNeutralRating);
    const double confidence = subjective.confidence_level.value_or(kNeutralRating);
    if (difficulty >= 4.0 && confidence <= 2.0) {
      out.emplace_back(
          "This problem was challenging for you. Consider reviewing the concept fundamentals "
          "before attempting similar problems.");
    } else if (difficulty <= 2.0 && confidence >= 4.0) {
      out.emplace_back("Great job! You found this easy. You're ready for more challenging problems in this topic.");
    }
  }

  if (combined.discrepancy == Discrepancy::OverestimatingDifficulty) {
    out.emplace_back("You did better than you thought! Trust your skills more.");
  } else if (combined.discrepancy == Discrepancy::UnderestimatingDifficulty) {
    out.emplace_back("This was trickier than it seemed. Pay attention to edge cases and problem constraints.");
  }

  if (combined.assessment == Assessment::Excellent) {
    out.emplace_back("Excellent work! Keep up the great progress.");
  } else if (combined.assessment == Assessment::Good) {
    out.emplace_back("Good job! You're making solid progress.");
  }
  return out;
}

FeedbackAssessment FeedbackAssessor::assess(const GradingReport& report,
                                            double time_taken,
                                            const nlohmann::json& feedback,
                                            std::optional<double> item_difficulty) const {
  FeedbackAssessment result;
  result.objective = objective_metrics(report, time_taken);
  result.subjective = subjective_metrics(feedback);
  result.combined = combine(result.objective, result.subjective);
  result.recommendations = recommendations(result.objective, result.subjective, result.combined);
  if (item_difficulty && result.subjective.provided) {
    result.perception = analyze_perception(*item_difficulty,
                                           result.objective.performance_score,
                                           result.subjective.difficulty_normalized);
  }
  return result;
}

std::string feedback_summary(const FeedbackAssessment& assessment) {
  const auto& objective = assessment.objective;
  if (!objective.success) {
    return "Error: " + objective.error;
  }
  std::ostringstream oss;
  oss << title_case(to_string(assessment.combined.assessment)) << " (Score: " << std::fixed
      << std::setprecision(2) << assessment.combined.combined_score << ")\n";
  if (objective.all_passed) {
    oss << "\xE2\x9C\x93 All tests passed!\n";
  } else {
    oss << "Tests: " << objective.passed_tests << "/" << objective.total_tests << " passed\n";
  }
  return oss.str();
}

nlohmann::json to_json(const PerceptionAnalysis& analysis) {
  return {
      {"expected_difficulty", analysis.expected_difficulty},
      {"perceived_difficulty", analysis.perceived_difficulty},
      {"actual_performance", analysis.actual_performance},
      {"perception_gap", analysis.perception_gap},
      {"performance_gap", analysis.performance_gap},
      {"perception_accuracy", to_string(analysis.accuracy)},
  };
}

nlohmann::json to_json(const FeedbackAssessment& assessment) {
  const auto& objective = assessment.objective;
  nlohmann::json objective_json = {
      {"success", objective.success},
      {"pass_rate", objective.pass_rate},
      {"time_taken", objective.time_taken},
      {"performance_score", objective.performance_score},
  };
  if (objective.success) {
    objective_json["all_passed"] = objective.all_passed;
    objective_json["passed_tests"] = objective.passed_tests;
    objective_json["total_tests"] = objective.total_tests;
    objective_json["time_score"] = 1.0;
  } else {
    objective_json["error"] = objective.error;
  }

  const auto& subjective = assessment.subjective;
  nlohmann::json subjective_json = {
      {"provided", subjective.provided},
      {"difficulty_rating", optional_number(subjective.difficulty_rating)},
      {"confidence_level", optional_number(subjective.confidence_level)},
      {"subjective_score", subjective.subjective_score},
  };
  if (subjective.provided) {
    subjective_json["difficulty_normalized"] = subjective.difficulty_normalized;
    subjective_json["confidence_normalized"] = subjective.confidence_normalized;
    subjective_json["notes"] = subjective.notes;
  }

  const auto& combined = assessment.combined;
  nlohmann::json combined_json = {
      {"combined_score", combined.combined_score},
      {"assessment", to_string(combined.assessment)},
      {"discrepancy", combined.discrepancy ? nlohmann::json(to_string(*combined.discrepancy)) : nlohmann::json()},
      {"objective_weight_used", combined.objective_weight_used},
      {"subjective_weight_used", combined.subjective_weight_used},
  };

  nlohmann::json out = {
      {"objective_metrics", std::move(objective_json)},
      {"subjective_metrics", std::move(subjective_json)},
      {"combined_assessment", std::move(combined_json)},
      {"recommendations", assessment.recommendations},
      {"summary", feedback_summary(assessment)},
  };
  if (assessment.perception) {
    out["perception"] = to_json(*assessment.perception);
  }
  return out;
}

} // namespace adapt::grading

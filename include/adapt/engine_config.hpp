#pragma once

#include <chrono>

namespace adapt {

struct EstimatorConfig {
  double initial_theta = 0.0;
  double prior_mean = 0.0;
  double prior_std = 1.0;
  int quadrature_points = 41;
  double theta_min = -4.0;
  double theta_max = 4.0;
  // Same-topic answers taken into account by update_theta.
  int history_window = 4;
  // Observations required before update_theta moves the estimate.
  int min_answers = 2;
  int mle_max_iterations = 20;
  double mle_tolerance = 0.001;

  void validate() const;
};

struct SelectionConfig {
  // Stage 2 shortlist size (K best items by information).
  int shortlist_size = 10;
  // Distinct recently answered items excluded by recommended_items().
  int recent_exclusion_window = 5;
  int finalist_count = 3;
  int performance_window = 5;
  double wrong_recency_multiplier = 2.0;
  double wrong_count_weight = 0.1;
  // Per-attempt deadline for a blocking ranking collaborator; must be positive.
  std::chrono::milliseconds ranking_timeout{5000};
  int ranking_retries = 1;

  void validate() const;
};

// Blend of grader results and self-reported ratings in a feedback assessment.
struct FeedbackConfig {
  double objective_weight = 0.7;
  double subjective_weight = 0.3;

  void validate() const;
};

struct EngineConfig {
  EstimatorConfig estimator;
  SelectionConfig selection;
  FeedbackConfig feedback;
  double mastery_threshold = 1.2;

  void validate() const;
};

// Overlays ADAPT_* environment variables on top of `base`.
EngineConfig config_from_env(EngineConfig base = {});

} // namespace adapt

#include "adapt/engine_config.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace adapt {
namespace {

const char* env_value(const char* name) {
  const char* value = std::getenv(name);
  if (!value || *value == '\0') {
    return nullptr;
  }
  return value;
}

void overlay_double(const char* name, double& target) {
  const char* value = env_value(name);
  if (!value) {
    return;
  }
  std::size_t consumed = 0;
  try {
    target = std::stod(value, &consumed);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string("Expected number in ") + name + ": " + value);
  }
  if (consumed != std::string(value).size()) {
    throw std::invalid_argument(std::string("Expected number in ") + name + ": " + value);
  }
}

void overlay_int(const char* name, int& target) {
  const char* value = env_value(name);
  if (!value) {
    return;
  }
  std::size_t consumed = 0;
  try {
    target = std::stoi(value, &consumed);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string("Expected integer in ") + name + ": " + value);
  }
  if (consumed != std::string(value).size()) {
    throw std::invalid_argument(std::string("Expected integer in ") + name + ": " + value);
  }
}

} // namespace

void EstimatorConfig::validate() const {
  if (!std::isfinite(theta_min) || !std::isfinite(theta_max) || theta_min >= theta_max) {
    throw std::invalid_argument("theta_min must be less than theta_max");
  }
  if (quadrature_points < 2) {
    throw std::invalid_argument("quadrature_points must be at least 2");
  }
  if (!(prior_std > 0.0)) {
    throw std::invalid_argument("prior_std must be positive");
  }
  if (!std::isfinite(prior_mean) || !std::isfinite(initial_theta)) {
    throw std::invalid_argument("prior_mean and initial_theta must be finite");
  }
  if (history_window < 0) {
    throw std::invalid_argument("history_window must not be negative");
  }
  if (min_answers < 1) {
    throw std::invalid_argument("min_answers must be at least 1");
  }
  if (mle_max_iterations < 1) {
    throw std::invalid_argument("mle_max_iterations must be at least 1");
  }
  if (!(mle_tolerance > 0.0)) {
    throw std::invalid_argument("mle_tolerance must be positive");
  }
}

void SelectionConfig::validate() const {
  if (shortlist_size < 1) {
    throw std::invalid_argument("shortlist_size must be at least 1");
  }
  if (recent_exclusion_window < 0) {
    throw std::invalid_argument("recent_exclusion_window must not be negative");
  }
  if (finalist_count < 1) {
    throw std::invalid_argument("finalist_count must be at least 1");
  }
  if (performance_window < 1) {
    throw std::invalid_argument("performance_window must be at least 1");
  }
  if (wrong_recency_multiplier < 1.0) {
    throw std::invalid_argument("wrong_recency_multiplier must be at least 1");
  }
  if (wrong_count_weight < 0.0) {
    throw std::invalid_argument("wrong_count_weight must not be negative");
  }
  if (ranking_timeout.count() <= 0) {
    throw std::invalid_argument("ranking_timeout must be positive");
  }
  if (ranking_retries < 0 || ranking_retries > 1) {
    throw std::invalid_argument("ranking_retries must be 0 or 1");
  }
}

void FeedbackConfig::validate() const {
  if (!std::isfinite(objective_weight) || objective_weight < 0.0) {
    throw std::invalid_argument("objective_weight must be a non-negative number");
  }
  if (!std::isfinite(subjective_weight) || subjective_weight < 0.0) {
    throw std::invalid_argument("subjective_weight must be a non-negative number");
  }
}

void EngineConfig::validate() const {
  estimator.validate();
  selection.validate();
  feedback.validate();
  if (!std::isfinite(mastery_threshold)) {
    throw std::invalid_argument("mastery_threshold must be finite");
  }
}

EngineConfig config_from_env(EngineConfig base) {
  auto& est = base.estimator;
  overlay_double("ADAPT_INITIAL_THETA", est.initial_theta);
  overlay_double("ADAPT_MASTERY_THRESHOLD", base.mastery_threshold);
  overlay_double("ADAPT_EAP_PRIOR_MEAN", est.prior_mean);
  overlay_double("ADAPT_EAP_PRIOR_STD", est.prior_std);
  overlay_int("ADAPT_EAP_QUADRATURE_POINTS", est.quadrature_points);
  overlay_double("ADAPT_EAP_THETA_MIN", est.theta_min);
  overlay_double("ADAPT_EAP_THETA_MAX", est.theta_max);
  overlay_int("ADAPT_EAP_HISTORY_WINDOW", est.history_window);
  overlay_int("ADAPT_EAP_MIN_ANSWERS", est.min_answers);

  auto& sel = base.selection;
  overlay_int("ADAPT_K_BEST_ITEMS", sel.shortlist_size);
  overlay_int("ADAPT_RECENT_WINDOW", sel.recent_exclusion_window);
  int timeout_ms = static_cast<int>(sel.ranking_timeout.count());
  overlay_int("ADAPT_RANKING_TIMEOUT_MS", timeout_ms);
  sel.ranking_timeout = std::chrono::milliseconds(timeout_ms);

  overlay_double("ADAPT_OBJECTIVE_WEIGHT", base.feedback.objective_weight);
  overlay_double("ADAPT_SUBJECTIVE_WEIGHT", base.feedback.subjective_weight);

  base.validate();
  return base;
}

} // namespace adapt

#include "adapt/ability_estimator.hpp"

#include "debug_log.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace adapt {

AbilityEstimator::AbilityEstimator(EstimatorConfig config) : config_(config) {
  config_.validate();
  const int count = config_.quadrature_points;
  const double step = (config_.theta_max - config_.theta_min) / static_cast<double>(count - 1);
  grid_.reserve(static_cast<std::size_t>(count));
  log_prior_.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    // Pin the last point so rounding never pushes it past theta_max.
    const double theta = (i == count - 1) ? config_.theta_max : config_.theta_min + step * i;
    grid_.push_back(theta);
    log_prior_.push_back(irt::safe_log(irt::normal_pdf(theta, config_.prior_mean, config_.prior_std)));
  }
}

double AbilityEstimator::clamp(double theta) const {
  if (std::isnan(theta)) {
    return config_.initial_theta;
  }
  return std::clamp(theta, config_.theta_min, config_.theta_max);
}

double AbilityEstimator::fallback(std::optional<double> current_theta) const {
  return current_theta ? *current_theta : config_.initial_theta;
}

double AbilityEstimator::estimate_eap(const std::vector<irt::Response>& responses,
                                      std::optional<double> current_theta) const {
  if (responses.empty()) {
    return fallback(current_theta);
  }

  std::vector<double> log_weights;
  log_weights.reserve(grid_.size());
  for (std::size_t i = 0; i < grid_.size(); ++i) {
    log_weights.push_back(log_prior_[i] + irt::log_likelihood(grid_[i], responses));
  }

  const double max_log = *std::max_element(log_weights.begin(), log_weights.end());
  if (!std::isfinite(max_log)) {
    debug::log(debug::Channel::Estimator, "EAP: non-finite log posterior, keeping current theta");
    return fallback(current_theta);
  }

  double weight_sum = 0.0;
  double weighted_theta = 0.0;
  for (std::size_t i = 0; i < grid_.size(); ++i) {
    const double weight = std::exp(log_weights[i] - max_log);
    weight_sum += weight;
    weighted_theta += grid_[i] * weight;
  }
  if (!(weight_sum > 0.0) || !std::isfinite(weight_sum) || !std::isfinite(weighted_theta)) {
    debug::log(debug::Channel::Estimator, "EAP: degenerate posterior mass, keeping current theta");
    return fallback(current_theta);
  }

  return clamp(weighted_theta / weight_sum);
}

double AbilityEstimator::estimate_mle(const std::vector<irt::Response>& responses,
                                      std::optional<double> initial_theta) const {
  if (responses.empty()) {
    return fallback(initial_theta);
  }

  double theta = clamp(fallback(initial_theta));
  for (int iteration = 0; iteration < config_.mle_max_iterations; ++iteration) {
    double first = 0.0;
    double second = 0.0;
    for (const auto& response : responses) {
      const ItemParams& item = response.params;
      if (std::fabs(item.a * (theta - item.b)) > irt::kExponentLimit) {
        continue;
      }
      const double p = irt::probability_correct(theta, item);
      // Probability with the guessing floor removed.
      const double p_star = (p - item.c) / (1.0 - item.c);
      if (response.correct) {
        first += item.a * (1.0 - p_star);
      } else {
        first -= item.a * p_star;
      }
      second -= item.a * item.a * p_star * (1.0 - p_star);
    }

    if (second == 0.0) {
      break;
    }
    const double delta = -first / second;
    theta = clamp(theta + delta);
    if (std::fabs(delta) < config_.mle_tolerance) {
      break;
    }
  }
  return theta;
}

double AbilityEstimator::update_theta(double current_theta,
                                      const ItemParams& item,
                                      bool correct,
                                      const std::vector<const Outcome*>& topic_history) const {
  const std::size_t window = static_cast<std::size_t>(config_.history_window);
  const std::size_t first = topic_history.size() > window ? topic_history.size() - window : 0;

  std::vector<irt::Response> responses;
  responses.reserve(topic_history.size() - first + 1);
  for (std::size_t i = first; i < topic_history.size(); ++i) {
    const Outcome* outcome = topic_history[i];
    if (!outcome || !outcome->params) {
      continue;
    }
    responses.push_back(irt::Response{*outcome->params, outcome->correct});
  }
  responses.push_back(irt::Response{item, correct});

  if (responses.size() < static_cast<std::size_t>(config_.min_answers)) {
    if (debug::enabled(debug::Channel::Estimator)) {
      std::ostringstream oss;
      oss << "update_theta: " << responses.size() << " observation(s), need "
          << config_.min_answers << "; theta held at " << current_theta;
      debug::log(debug::Channel::Estimator, oss.str());
    }
    return clamp(current_theta);
  }

  return estimate_eap(responses, current_theta);
}

} // namespace adapt

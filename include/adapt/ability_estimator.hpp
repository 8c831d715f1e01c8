#pragma once

#include "engine_config.hpp"
#include "item_response.hpp"
#include "types.hpp"

#include <optional>
#include <vector>

namespace adapt {

/**
 * AbilityEstimator turns (item, outcome) sequences into a theta estimate.
 * EAP integrates the posterior over a fixed quadrature grid spanning
 * [theta_min, theta_max] under a normal prior; MLE runs Newton-Raphson.
 * Both are pure and never throw on degenerate input.
 */
class AbilityEstimator {
public:
  explicit AbilityEstimator(EstimatorConfig config = {});

  const EstimatorConfig& config() const noexcept { return config_; }
  const std::vector<double>& grid() const { return grid_; }

  double clamp(double theta) const;

  double estimate_eap(const std::vector<irt::Response>& responses,
                      std::optional<double> current_theta = std::nullopt) const;

  double estimate_mle(const std::vector<irt::Response>& responses,
                      std::optional<double> initial_theta = std::nullopt) const;

  // `topic_history` must already be restricted to the item's topic and be in
  // chronological order; only its last `history_window` entries are used.
  double update_theta(double current_theta,
                      const ItemParams& item,
                      bool correct,
                      const std::vector<const Outcome*>& topic_history) const;

private:
  double fallback(std::optional<double> current_theta) const;

  EstimatorConfig config_;
  std::vector<double> grid_;
  std::vector<double> log_prior_;
};

} // namespace adapt

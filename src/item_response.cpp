#include "adapt/item_response.hpp"

#include <algorithm>
#include <cmath>

namespace adapt::irt {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

double probability_correct(double theta, const ItemParams& params) {
  const double exponent = -params.a * (theta - params.b);
  if (exponent > kExponentLimit) {
    return std::clamp(params.c, 0.0, 1.0);
  }
  if (exponent < -kExponentLimit) {
    return 1.0;
  }
  const double p = params.c + (1.0 - params.c) / (1.0 + std::exp(exponent));
  return std::clamp(p, 0.0, 1.0);
}

double information(double theta, const ItemParams& params) {
  const double p = probability_correct(theta, params);
  if (p <= kProbabilityFloor || p >= kProbabilityCeiling) {
    return 0.0;
  }
  const double exponent = -params.a * (theta - params.b);
  if (std::fabs(exponent) > kExponentLimit) {
    return 0.0;
  }
  const double exp_term = std::exp(exponent);
  const double denominator = (1.0 + exp_term) * (1.0 + exp_term);
  if (denominator == 0.0) {
    return 0.0;
  }
  const double p_prime = params.a * (1.0 - params.c) * exp_term / denominator;
  const double info = (p_prime * p_prime) / (p * (1.0 - p));
  return std::max(0.0, info);
}

double likelihood(double theta, const std::vector<Response>& responses) {
  double value = 1.0;
  for (const auto& response : responses) {
    const double p = probability_correct(theta, response.params);
    value *= response.correct ? p : (1.0 - p);
  }
  return value;
}

double log_likelihood(double theta, const std::vector<Response>& responses) {
  double value = 0.0;
  for (const auto& response : responses) {
    const double p = probability_correct(theta, response.params);
    value += response.correct ? safe_log(p) : safe_log(1.0 - p);
  }
  return value;
}

double safe_log(double value) {
  return std::log(std::max(value, kLogFloor));
}

double normal_pdf(double x, double mean, double std_dev) {
  const double z = (x - mean) / std_dev;
  return std::exp(-0.5 * z * z) / (std_dev * std::sqrt(2.0 * kPi));
}

double difficulty_match(double theta, const ItemParams& params) {
  return std::fabs(params.b - theta);
}

std::vector<RankedItem> rank_by_information(double theta, const std::vector<const Item*>& items) {
  std::vector<RankedItem> ranked;
  ranked.reserve(items.size());
  for (const Item* item : items) {
    if (!item) continue;
    ranked.push_back(RankedItem{item, information(theta, item->params)});
  }
  std::stable_sort(ranked.begin(), ranked.end(), [](const RankedItem& lhs, const RankedItem& rhs) {
    return lhs.information > rhs.information;
  });
  return ranked;
}

const Item* most_informative(double theta, const std::vector<const Item*>& items) {
  const Item* best = nullptr;
  double best_info = -1.0;
  for (const Item* item : items) {
    if (!item) continue;
    const double info = information(theta, item->params);
    if (info > best_info) {
      best_info = info;
      best = item;
    }
  }
  return best;
}

} // namespace adapt::irt

#pragma once

#include "types.hpp"

#include <vector>

namespace adapt::irt {

// Exponent magnitude beyond which the logistic is treated as saturated.
constexpr double kExponentLimit = 500.0;
// Information is zero outside (kProbabilityFloor, kProbabilityCeiling).
constexpr double kProbabilityFloor = 0.001;
constexpr double kProbabilityCeiling = 0.999;
constexpr double kLogFloor = 1e-10;

struct Response {
  ItemParams params;
  bool correct = false;
};

struct RankedItem {
  const Item* item = nullptr;
  double information = 0.0;
};

// 3PL: c + (1 - c) / (1 + exp(-a (theta - b))), clamped into [0, 1].
double probability_correct(double theta, const ItemParams& params);

// Fisher information (p')^2 / (p (1 - p)).
double information(double theta, const ItemParams& params);

double likelihood(double theta, const std::vector<Response>& responses);

// Assumes local independence of responses given theta.
double log_likelihood(double theta, const std::vector<Response>& responses);

double safe_log(double value);
double normal_pdf(double x, double mean, double std_dev);

// |b - theta|; zero is a perfect difficulty match.
double difficulty_match(double theta, const ItemParams& params);

// Descending by information; equal values keep their input order.
std::vector<RankedItem> rank_by_information(double theta, const std::vector<const Item*>& items);

const Item* most_informative(double theta, const std::vector<const Item*>& items);

} // namespace adapt::irt

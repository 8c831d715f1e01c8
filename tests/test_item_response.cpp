#include "adapt/item_response.hpp"
#include "adapt/types.hpp"

#include <cmath>
#include <iostream>
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

bool near(double lhs, double rhs, double tolerance = 1e-9) {
  return std::fabs(lhs - rhs) <= tolerance;
}

adapt::Item make_item(const std::string& id, double a, double b, double c = 0.0) {
  adapt::Item item;
  item.id = id;
  item.topic = "T";
  item.params = adapt::ItemParams{a, b, c};
  return item;
}

void test_probability(TestSuite& suite) {
  const adapt::ItemParams item{1.0, 0.0, 0.25};
  suite.require(near(adapt::irt::probability_correct(0.0, item), 0.625),
                "probability at theta == b should be c + (1-c)/2");
  suite.require(near(adapt::irt::probability_correct(-10.0, item), 0.25, 1e-3),
                "probability far below b should approach the guessing floor");
  suite.require(near(adapt::irt::probability_correct(10.0, item), 1.0, 1e-3),
                "probability far above b should approach 1");

  const adapt::ItemParams steep{5.0, 0.0, 0.2};
  suite.require(adapt::irt::probability_correct(-200.0, steep) == 0.2,
                "exponent beyond the limit should return c exactly");
  suite.require(adapt::irt::probability_correct(200.0, steep) == 1.0,
                "exponent beyond the negative limit should return 1 exactly");

  double previous = -1.0;
  bool monotone = true;
  bool bounded = true;
  for (double theta = -6.0; theta <= 6.0; theta += 0.25) {
    const double p = adapt::irt::probability_correct(theta, item);
    monotone = monotone && p >= previous;
    bounded = bounded && p >= 0.0 && p <= 1.0;
    previous = p;
  }
  suite.require(monotone, "probability should be non-decreasing in theta");
  suite.require(bounded, "probability should stay within [0, 1]");
}

void test_information(TestSuite& suite) {
  const adapt::ItemParams item{1.5, 0.0, 0.0};
  const double at_b = adapt::irt::information(0.0, item);
  // 2PL at theta == b: a^2 * 0.25
  suite.require(near(at_b, 1.5 * 1.5 * 0.25, 1e-9), "2PL information at b should be a^2/4");
  suite.require(at_b > adapt::irt::information(1.0, item), "information should peak near b");
  suite.require(adapt::irt::information(-20.0, item) == 0.0,
                "information should be zero when p is below the floor");
  suite.require(adapt::irt::information(20.0, item) == 0.0,
                "information should be zero when p is above the ceiling");

  bool non_negative = true;
  for (double theta = -4.0; theta <= 4.0; theta += 0.5) {
    non_negative = non_negative && adapt::irt::information(theta, adapt::ItemParams{0.8, 1.0, 0.3}) >= 0.0;
  }
  suite.require(non_negative, "information should never be negative");
}

void test_likelihood(TestSuite& suite) {
  const std::vector<adapt::irt::Response> responses{
      {adapt::ItemParams{1.0, 0.0, 0.25}, true},
      {adapt::ItemParams{1.0, 0.0, 0.25}, false},
  };
  suite.require(near(adapt::irt::likelihood(0.0, responses), 0.625 * 0.375),
                "likelihood should be the product of response probabilities");
  suite.require(near(adapt::irt::log_likelihood(0.0, responses), std::log(0.625) + std::log(0.375)),
                "log-likelihood should be the sum of response logs");
  suite.require(adapt::irt::log_likelihood(0.0, {}) == 0.0, "empty log-likelihood should be zero");
  suite.require(near(adapt::irt::safe_log(0.0), std::log(adapt::irt::kLogFloor)),
                "safe_log should floor zero at epsilon");
  suite.require(std::isfinite(adapt::irt::log_likelihood(
                    0.0, {{adapt::ItemParams{5.0, -200.0, 0.0}, false}})),
                "log-likelihood of an impossible miss should stay finite");
  suite.require(near(adapt::irt::normal_pdf(0.0, 0.0, 1.0), 0.3989422804014327, 1e-12),
                "standard normal density at 0");
}

void test_ranking(TestSuite& suite) {
  const auto easy = make_item("easy", 1.0, -2.0);
  const auto matched = make_item("matched", 1.0, 0.0);
  const auto twin = make_item("twin", 1.0, 0.0);
  const auto hard = make_item("hard", 1.0, 2.5);
  const std::vector<const adapt::Item*> items{&easy, &matched, &twin, &hard};

  const auto ranked = adapt::irt::rank_by_information(0.0, items);
  suite.require(ranked.size() == 4, "ranking should keep every item");
  suite.require(ranked[0].item == &matched && ranked[1].item == &twin,
                "ties should keep catalog order");
  suite.require(ranked[3].item == &hard, "least informative item should rank last");
  suite.require(adapt::irt::most_informative(0.0, items) == &matched,
                "most_informative should return the first maximum");
  suite.require(adapt::irt::most_informative(0.0, {}) == nullptr,
                "most_informative of nothing should be null");
  suite.require(near(adapt::irt::difficulty_match(0.5, hard.params), 2.0),
                "difficulty match should be |b - theta|");
}

} // namespace

int main() {
  TestSuite suite;

  test_probability(suite);
  test_information(suite);
  test_likelihood(suite);
  test_ranking(suite);

  if (!suite.ok) {
    std::cerr << "Item response tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Item response tests passed" << std::endl;
  return 0;
}

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace adapt::grading {

struct TestResult {
  int number = 0;
  nlohmann::json input;
  nlohmann::json expected;
  nlohmann::json actual;
  bool passed = false;
  bool visible = true;
  std::string error;
};

// What the external grader hands back for one submission. Only `passed`
// drives ability estimation; the rest is stored with the Outcome.
struct GradingReport {
  bool success = true;
  std::string error;
  std::vector<TestResult> tests;
  int total_tests = 0;
  int passed_tests = 0;
  double pass_rate = 0.0;
  bool passed = false;
  nlohmann::json extra = nlohmann::json::object();
};

// Counts tests and derives pass_rate. `passed` requires at least one test and
// pass_rate >= pass_threshold.
GradingReport summarize(std::vector<TestResult> tests, double pass_threshold = 1.0);

// Report for a submission that could not be run at all.
GradingReport failed_run(const std::string& error);

std::string summary_line(const GradingReport& report);
std::vector<std::string> detailed_feedback(const GradingReport& report);

// Pass rate plus up to 0.2 for finishing under five minutes, capped at 1.
double quality_score(const GradingReport& report, double time_taken);

nlohmann::json to_json(const GradingReport& report);
GradingReport report_from_json(const nlohmann::json& json_report);

} // namespace adapt::grading

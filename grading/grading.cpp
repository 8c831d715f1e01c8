#include "grading.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace adapt::grading {

namespace {

constexpr double kReferenceSolveSeconds = 300.0;
constexpr double kMaxTimeBonus = 0.2;

bool read_bool(const nlohmann::json& obj, const char* key, bool fallback) {
  if (!obj.contains(key) || obj[key].is_null()) {
    return fallback;
  }
  if (!obj[key].is_boolean()) {
    throw std::invalid_argument(std::string("Expected bool for field '") + key + "'");
  }
  return obj[key].get<bool>();
}

nlohmann::json read_value(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  return it == obj.end() ? nlohmann::json() : *it;
}

TestResult test_from_json(const nlohmann::json& obj, int fallback_number) {
  if (!obj.is_object()) {
    throw std::invalid_argument("Expected object for field 'tests[]'");
  }
  TestResult test;
  test.number = fallback_number;
  if (obj.contains("test_num")) {
    if (!obj["test_num"].is_number_integer()) {
      throw std::invalid_argument("Expected integer for field 'test_num'");
    }
    test.number = obj["test_num"].get<int>();
  }
  test.input = read_value(obj, "input");
  test.expected = read_value(obj, "expected_output");
  test.actual = read_value(obj, "actual_output");
  test.passed = read_bool(obj, "passed", false);
  test.visible = read_bool(obj, "visible", true);
  if (obj.contains("error") && obj["error"].is_string()) {
    test.error = obj["error"].get<std::string>();
  }
  return test;
}

} // namespace

GradingReport summarize(std::vector<TestResult> tests, double pass_threshold) {
  GradingReport report;
  report.tests = std::move(tests);
  report.total_tests = static_cast<int>(report.tests.size());
  report.passed_tests = static_cast<int>(std::count_if(
      report.tests.begin(), report.tests.end(), [](const TestResult& t) { return t.passed; }));
  report.pass_rate = report.total_tests > 0
                         ? static_cast<double>(report.passed_tests) / report.total_tests
                         : 0.0;
  report.passed = report.total_tests > 0 && report.pass_rate >= pass_threshold;
  return report;
}

GradingReport failed_run(const std::string& error) {
  GradingReport report;
  report.success = false;
  report.error = error;
  return report;
}

std::string summary_line(const GradingReport& report) {
  if (!report.success) {
    return "Error: " + (report.error.empty() ? std::string("Unknown error") : report.error);
  }
  std::ostringstream oss;
  if (report.total_tests > 0 && report.passed_tests == report.total_tests) {
    oss << "All tests passed! (" << report.passed_tests << "/" << report.total_tests << ")";
  } else {
    oss << (report.total_tests - report.passed_tests) << " test(s) failed. Passed: "
        << report.passed_tests << "/" << report.total_tests;
  }
  return oss.str();
}

std::vector<std::string> detailed_feedback(const GradingReport& report) {
  if (!report.success) {
    return {report.error.empty() ? std::string("Unknown error") : report.error};
  }
  std::vector<std::string> out;
  int hidden_failed = 0;
  for (const auto& test : report.tests) {
    if (test.passed) {
      continue;
    }
    if (!test.visible) {
      ++hidden_failed;
      continue;
    }
    std::ostringstream oss;
    oss << "Test " << test.number << " failed:\n";
    oss << "  Input: " << test.input.dump() << "\n";
    oss << "  Expected: " << test.expected.dump() << "\n";
    if (!test.actual.is_null()) {
      oss << "  Got: " << test.actual.dump() << "\n";
    }
    if (!test.error.empty()) {
      oss << "  Error: " << test.error << "\n";
    }
    out.push_back(oss.str());
  }
  if (hidden_failed > 0) {
    out.push_back(std::to_string(hidden_failed) +
                  " hidden test(s) failed. These tests check edge cases and special conditions.");
  }
  return out;
}

double quality_score(const GradingReport& report, double time_taken) {
  if (!report.success) {
    return 0.0;
  }
  const double time_factor = std::max(0.0, 1.0 - time_taken / kReferenceSolveSeconds);
  return std::min(1.0, report.pass_rate + time_factor * kMaxTimeBonus);
}

nlohmann::json to_json(const GradingReport& report) {
  nlohmann::json tests = nlohmann::json::array();
  for (const auto& test : report.tests) {
    nlohmann::json entry = {
        {"test_num", test.number},
        {"input", test.input},
        {"expected_output", test.expected},
        {"passed", test.passed},
        {"visible", test.visible},
    };
    if (!test.actual.is_null()) {
      entry["actual_output"] = test.actual;
    }
    if (!test.error.empty()) {
      entry["error"] = test.error;
    }
    tests.push_back(std::move(entry));
  }
  nlohmann::json out = {
      {"success", report.success},
      {"tests", std::move(tests)},
      {"total_tests", report.total_tests},
      {"passed_tests", report.passed_tests},
      {"pass_rate", report.pass_rate},
      {"passed", report.passed},
  };
  if (!report.error.empty()) {
    out["error"] = report.error;
  }
  if (!report.extra.is_null() && !report.extra.empty()) {
    out["extra"] = report.extra;
  }
  return out;
}

GradingReport report_from_json(const nlohmann::json& json_report) {
  if (!json_report.is_object()) {
    throw std::invalid_argument("Grading report must be an object");
  }
  std::vector<TestResult> tests;
  if (json_report.contains("tests") && !json_report["tests"].is_null()) {
    const auto& array = json_report["tests"];
    if (!array.is_array()) {
      throw std::invalid_argument("Expected array for field 'tests'");
    }
    for (std::size_t i = 0; i < array.size(); ++i) {
      tests.push_back(test_from_json(array[i], static_cast<int>(i) + 1));
    }
  }

  GradingReport report = summarize(std::move(tests));
  report.success = read_bool(json_report, "success", true);
  if (json_report.contains("error") && json_report["error"].is_string()) {
    report.error = json_report["error"].get<std::string>();
  }
  if (json_report.contains("pass_rate") && !json_report["pass_rate"].is_null()) {
    if (!json_report["pass_rate"].is_number()) {
      throw std::invalid_argument("Expected number for field 'pass_rate'");
    }
    report.pass_rate = std::clamp(json_report["pass_rate"].get<double>(), 0.0, 1.0);
  }
  report.passed = read_bool(json_report, "passed", report.passed);
  if (json_report.contains("extra") && !json_report["extra"].is_null()) {
    report.extra = json_report["extra"];
  }
  return report;
}

} // namespace adapt::grading

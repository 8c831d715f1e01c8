#include "json_bridge.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace adapt::bridge {
namespace {

// Guessing floor assumed for catalog items that do not state one.
constexpr double kDefaultGuessing = 0.25;

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.contains(key)) {
    return false;
  }
  const auto& value = obj[key];
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

void require_object(const nlohmann::json& value, std::string_view what) {
  if (!value.is_object()) {
    throw std::invalid_argument("Expected object for " + std::string(what));
  }
}

int json_to_int(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<int>();
  }
  if (value.is_number_float()) {
    return static_cast<int>(std::lround(value.get<double>()));
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

double json_to_double(const nlohmann::json& value, std::string_view key) {
  if (!value.is_number()) {
    throw std::invalid_argument("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

bool json_to_bool(const nlohmann::json& value, std::string_view key) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number_integer()) {
    const int v = value.get<int>();
    if (v == 0 || v == 1) {
      return v != 0;
    }
  }
  throw std::invalid_argument("Expected bool for field '" + std::string(key) + "'");
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

std::vector<std::string> json_to_string_vector(const nlohmann::json& value, std::string_view key) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array<string> for field '" + std::string(key) + "'");
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for (const auto& entry : value) {
    out.push_back(json_to_string(entry, key));
  }
  return out;
}

std::vector<TestCase> json_to_tests(const nlohmann::json& value, std::string_view key) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array for field '" + std::string(key) + "'");
  }
  std::vector<TestCase> out;
  out.reserve(value.size());
  for (const auto& entry : value) {
    out.push_back(test_case_from_json(entry));
  }
  return out;
}

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
  if (value.has_value()) {
    return value.value();
  }
  return nullptr;
}

} // namespace

nlohmann::json to_json(const ItemParams& params) {
  return {{"alpha", params.a}, {"beta", params.b}, {"c", params.c}};
}

nlohmann::json to_json(const TestCase& test) {
  return {{"input", test.input}, {"output", test.output}, {"is_unordered", test.unordered}};
}

TestCase test_case_from_json(const nlohmann::json& json_test) {
  require_object(json_test, "test case");
  TestCase test;
  test.input = json_test.contains("input") ? json_test["input"] : nlohmann::json();
  test.output = json_test.contains("output") ? json_test["output"] : nlohmann::json();
  assign_if_present(json_test, "is_unordered", [&](const nlohmann::json& value) {
    test.unordered = json_to_bool(value, "is_unordered");
  });
  return test;
}

nlohmann::json to_json(const Item& item) {
  nlohmann::json json_item = nlohmann::json::object();
  json_item["name"] = item.id;
  json_item["topic"] = item.topic;
  json_item["description"] = item.description;
  json_item["alpha"] = item.params.a;
  json_item["beta"] = item.params.b;
  json_item["c"] = item.params.c;
  json_item["init_code"] = item.init_code;
  json_item["is_unordered"] = item.unordered;
  nlohmann::json tests = nlohmann::json::array();
  for (const auto& test : item.tests) {
    tests.push_back(to_json(test));
  }
  json_item["tests"] = tests;
  nlohmann::json hidden = nlohmann::json::array();
  for (const auto& test : item.hidden_tests) {
    hidden.push_back(to_json(test));
  }
  json_item["hidden_tests"] = hidden;
  return json_item;
}

Item item_from_json(const nlohmann::json& json_item) {
  require_object(json_item, "item");
  Item item;
  item.params.c = kDefaultGuessing;
  if (!assign_if_present(json_item, "name", [&](const nlohmann::json& value) {
        item.id = json_to_string(value, "name");
      })) {
    assign_if_present(json_item, "id", [&](const nlohmann::json& value) {
      item.id = json_to_string(value, "id");
    });
  }
  assign_if_present(json_item, "topic", [&](const nlohmann::json& value) {
    item.topic = json_to_string(value, "topic");
  });
  assign_if_present(json_item, "description", [&](const nlohmann::json& value) {
    item.description = json_to_string(value, "description");
  });
  if (!assign_if_present(json_item, "alpha", [&](const nlohmann::json& value) {
        item.params.a = json_to_double(value, "alpha");
      })) {
    assign_if_present(json_item, "a", [&](const nlohmann::json& value) {
      item.params.a = json_to_double(value, "a");
    });
  }
  if (!assign_if_present(json_item, "beta", [&](const nlohmann::json& value) {
        item.params.b = json_to_double(value, "beta");
      })) {
    assign_if_present(json_item, "b", [&](const nlohmann::json& value) {
      item.params.b = json_to_double(value, "b");
    });
  }
  assign_if_present(json_item, "c", [&](const nlohmann::json& value) {
    item.params.c = json_to_double(value, "c");
  });
  assign_if_present(json_item, "init_code", [&](const nlohmann::json& value) {
    item.init_code = json_to_string(value, "init_code");
  });
  assign_if_present(json_item, "is_unordered", [&](const nlohmann::json& value) {
    item.unordered = json_to_bool(value, "is_unordered");
  });
  assign_if_present(json_item, "tests", [&](const nlohmann::json& value) {
    item.tests = json_to_tests(value, "tests");
  });
  assign_if_present(json_item, "hidden_tests", [&](const nlohmann::json& value) {
    item.hidden_tests = json_to_tests(value, "hidden_tests");
  });
  item.validate();
  return item;
}

std::vector<Item> items_from_json(const nlohmann::json& json_items) {
  const nlohmann::json* array = &json_items;
  if (json_items.is_object()) {
    if (!json_items.contains("questions")) {
      throw std::invalid_argument("Expected 'questions' array in item bank");
    }
    array = &json_items["questions"];
  }
  if (!array->is_array()) {
    throw std::invalid_argument("Expected array of items");
  }
  std::vector<Item> items;
  items.reserve(array->size());
  for (const auto& entry : *array) {
    items.push_back(item_from_json(entry));
  }
  return items;
}

nlohmann::json to_json(const Outcome& outcome) {
  nlohmann::json json_outcome = nlohmann::json::object();
  json_outcome["question_name"] = outcome.item_id;
  json_outcome["topic"] = outcome.topic;
  if (outcome.params) {
    json_outcome["alpha"] = outcome.params->a;
    json_outcome["beta"] = outcome.params->b;
    json_outcome["c"] = outcome.params->c;
  } else {
    json_outcome["alpha"] = nullptr;
    json_outcome["beta"] = nullptr;
    json_outcome["c"] = nullptr;
  }
  json_outcome["timestamp"] = outcome.timestamp;
  json_outcome["correct"] = outcome.correct;
  json_outcome["time_taken"] = outcome.time_taken;
  json_outcome["theta_before"] = outcome.theta_before;
  json_outcome["theta_after"] = outcome.theta_after;
  json_outcome["test_results"] = outcome.test_results;
  json_outcome["subjective_feedback"] = outcome.subjective_feedback;
  return json_outcome;
}

Outcome outcome_from_json(const nlohmann::json& json_outcome) {
  require_object(json_outcome, "answer_history entry");
  Outcome outcome;
  if (!json_outcome.contains("question_name")) {
    throw std::invalid_argument("Missing field 'question_name'");
  }
  outcome.item_id = json_to_string(json_outcome["question_name"], "question_name");
  assign_if_present(json_outcome, "topic", [&](const nlohmann::json& value) {
    outcome.topic = json_to_string(value, "topic");
  });

  std::optional<double> a;
  std::optional<double> b;
  std::optional<double> c;
  assign_if_present(json_outcome, "alpha", [&](const nlohmann::json& value) {
    a = json_to_double(value, "alpha");
  });
  assign_if_present(json_outcome, "beta", [&](const nlohmann::json& value) {
    b = json_to_double(value, "beta");
  });
  assign_if_present(json_outcome, "c", [&](const nlohmann::json& value) {
    c = json_to_double(value, "c");
  });
  if (a && b && c) {
    outcome.params = ItemParams{*a, *b, *c};
  }

  assign_if_present(json_outcome, "timestamp", [&](const nlohmann::json& value) {
    outcome.timestamp = json_to_string(value, "timestamp");
  });
  assign_if_present(json_outcome, "correct", [&](const nlohmann::json& value) {
    outcome.correct = json_to_bool(value, "correct");
  });
  assign_if_present(json_outcome, "time_taken", [&](const nlohmann::json& value) {
    outcome.time_taken = json_to_double(value, "time_taken");
  });
  assign_if_present(json_outcome, "theta_before", [&](const nlohmann::json& value) {
    outcome.theta_before = json_to_double(value, "theta_before");
  });
  assign_if_present(json_outcome, "theta_after", [&](const nlohmann::json& value) {
    outcome.theta_after = json_to_double(value, "theta_after");
  });
  if (json_outcome.contains("test_results")) {
    outcome.test_results = json_outcome["test_results"];
  }
  if (json_outcome.contains("subjective_feedback")) {
    outcome.subjective_feedback = json_outcome["subjective_feedback"];
  }
  return outcome;
}

nlohmann::json to_json(const LearnerProfile& profile) {
  nlohmann::json json_profile = nlohmann::json::object();
  json_profile["user_id"] = profile.learner_id;
  nlohmann::json thetas = nlohmann::json::object();
  for (const auto& entry : profile.theta_by_topic) {
    thetas[entry.first] = entry.second;
  }
  json_profile["theta_by_topic"] = thetas;
  nlohmann::json statuses = nlohmann::json::object();
  for (const auto& entry : profile.concept_status) {
    statuses[entry.first] = to_string(entry.second);
  }
  json_profile["concept_status"] = statuses;
  nlohmann::json history = nlohmann::json::array();
  for (const auto& outcome : profile.history) {
    history.push_back(to_json(outcome));
  }
  json_profile["answer_history"] = history;
  return json_profile;
}

LearnerProfile learner_profile_from_json(const nlohmann::json& json_profile) {
  require_object(json_profile, "learner profile");
  LearnerProfile profile;
  assign_if_present(json_profile, "user_id", [&](const nlohmann::json& value) {
    profile.learner_id = json_to_string(value, "user_id");
  });
  assign_if_present(json_profile, "theta_by_topic", [&](const nlohmann::json& value) {
    require_object(value, "field 'theta_by_topic'");
    for (auto it = value.begin(); it != value.end(); ++it) {
      profile.theta_by_topic[it.key()] = json_to_double(it.value(), "theta_by_topic." + it.key());
    }
  });
  assign_if_present(json_profile, "concept_status", [&](const nlohmann::json& value) {
    require_object(value, "field 'concept_status'");
    for (auto it = value.begin(); it != value.end(); ++it) {
      profile.concept_status[it.key()] =
          concept_status_from_string(json_to_string(it.value(), "concept_status." + it.key()));
    }
  });
  assign_if_present(json_profile, "answer_history", [&](const nlohmann::json& value) {
    if (!value.is_array()) {
      throw std::invalid_argument("Expected array for field 'answer_history'");
    }
    profile.history.reserve(value.size());
    for (const auto& entry : value) {
      profile.history.push_back(outcome_from_json(entry));
    }
  });
  return profile;
}

nlohmann::json to_json(const EngineConfig& config) {
  const auto& est = config.estimator;
  const auto& sel = config.selection;
  return {
      {"initial_theta", est.initial_theta},
      {"mastery_threshold", config.mastery_threshold},
      {"prior_mean", est.prior_mean},
      {"prior_std", est.prior_std},
      {"quadrature_points", est.quadrature_points},
      {"theta_min", est.theta_min},
      {"theta_max", est.theta_max},
      {"history_window", est.history_window},
      {"min_answers", est.min_answers},
      {"mle_max_iterations", est.mle_max_iterations},
      {"mle_tolerance", est.mle_tolerance},
      {"shortlist_size", sel.shortlist_size},
      {"recent_exclusion_window", sel.recent_exclusion_window},
      {"finalist_count", sel.finalist_count},
      {"performance_window", sel.performance_window},
      {"wrong_recency_multiplier", sel.wrong_recency_multiplier},
      {"wrong_count_weight", sel.wrong_count_weight},
      {"ranking_timeout_ms", static_cast<std::int64_t>(sel.ranking_timeout.count())},
      {"ranking_retries", sel.ranking_retries},
      {"objective_weight", config.feedback.objective_weight},
      {"subjective_weight", config.feedback.subjective_weight},
  };
}

EngineConfig engine_config_from_json(const nlohmann::json& json_config, EngineConfig base) {
  if (json_config.is_null()) {
    base.validate();
    return base;
  }
  require_object(json_config, "engine config");
  auto& est = base.estimator;
  auto& sel = base.selection;
  const auto set_double = [&](const char* key, double& target) {
    assign_if_present(json_config, key, [&](const nlohmann::json& value) { target = json_to_double(value, key); });
  };
  const auto set_int = [&](const char* key, int& target) {
    assign_if_present(json_config, key, [&](const nlohmann::json& value) { target = json_to_int(value, key); });
  };
  set_double("initial_theta", est.initial_theta);
  set_double("mastery_threshold", base.mastery_threshold);
  set_double("prior_mean", est.prior_mean);
  set_double("prior_std", est.prior_std);
  set_int("quadrature_points", est.quadrature_points);
  set_double("theta_min", est.theta_min);
  set_double("theta_max", est.theta_max);
  set_int("history_window", est.history_window);
  set_int("min_answers", est.min_answers);
  set_int("mle_max_iterations", est.mle_max_iterations);
  set_double("mle_tolerance", est.mle_tolerance);
  set_int("shortlist_size", sel.shortlist_size);
  set_int("recent_exclusion_window", sel.recent_exclusion_window);
  set_int("finalist_count", sel.finalist_count);
  set_int("performance_window", sel.performance_window);
  set_double("wrong_recency_multiplier", sel.wrong_recency_multiplier);
  set_double("wrong_count_weight", sel.wrong_count_weight);
  assign_if_present(json_config, "ranking_timeout_ms", [&](const nlohmann::json& value) {
    sel.ranking_timeout = std::chrono::milliseconds(json_to_int(value, "ranking_timeout_ms"));
  });
  set_int("ranking_retries", sel.ranking_retries);
  set_double("objective_weight", base.feedback.objective_weight);
  set_double("subjective_weight", base.feedback.subjective_weight);
  base.validate();
  return base;
}

std::vector<ConceptGraph::Node> concept_nodes_from_json(const nlohmann::json& json_nodes) {
  if (!json_nodes.is_array()) {
    throw std::invalid_argument("Expected array for field 'concepts'");
  }
  std::vector<ConceptGraph::Node> nodes;
  nodes.reserve(json_nodes.size());
  for (const auto& entry : json_nodes) {
    require_object(entry, "concept");
    ConceptGraph::Node node;
    if (!entry.contains("name")) {
      throw std::invalid_argument("Missing field 'name' in concept");
    }
    node.name = json_to_string(entry["name"], "name");
    assign_if_present(entry, "prerequisites", [&](const nlohmann::json& value) {
      node.prerequisites = json_to_string_vector(value, "prerequisites");
    });
    nodes.push_back(std::move(node));
  }
  return nodes;
}

EngineSetup engine_setup_from_json(const nlohmann::json& json_setup, EngineConfig base) {
  require_object(json_setup, "engine setup");
  EngineSetup setup;
  setup.config = json_setup.contains("config") ? engine_config_from_json(json_setup["config"], base)
                                               : engine_config_from_json(nullptr, base);
  assign_if_present(json_setup, "concepts", [&](const nlohmann::json& value) {
    setup.concepts = concept_nodes_from_json(value);
  });
  if (!assign_if_present(json_setup, "items", [&](const nlohmann::json& value) {
        setup.items = items_from_json(value);
      })) {
    assign_if_present(json_setup, "questions", [&](const nlohmann::json& value) {
      setup.items = items_from_json(value);
    });
  }
  assign_if_present(json_setup, "profile", [&](const nlohmann::json& value) {
    setup.profile = learner_profile_from_json(value);
  });
  assign_if_present(json_setup, "user_id", [&](const nlohmann::json& value) {
    setup.learner_id = json_to_string(value, "user_id");
  });
  return setup;
}

nlohmann::json to_json(const Interaction& interaction) {
  return {
      {"timestamp", interaction.timestamp},
      {"action", interaction.action},
      {"details", interaction.details},
  };
}

Interaction interaction_from_json(const nlohmann::json& json_interaction) {
  require_object(json_interaction, "interaction");
  Interaction interaction;
  if (!json_interaction.contains("action")) {
    throw std::invalid_argument("Missing field 'action' in interaction");
  }
  interaction.action = json_to_string(json_interaction["action"], "action");
  assign_if_present(json_interaction, "timestamp", [&](const nlohmann::json& value) {
    interaction.timestamp = json_to_string(value, "timestamp");
  });
  assign_if_present(json_interaction, "details", [&](const nlohmann::json& value) {
    interaction.details = value;
  });
  return interaction;
}

nlohmann::json to_json(const TopicStatistics& statistics) {
  return {
      {"topic", statistics.topic},
      {"total_questions", statistics.total_items},
      {"total_attempts", statistics.total_attempts},
      {"correct_attempts", statistics.correct_attempts},
      {"accuracy", statistics.accuracy},
      {"current_theta", statistics.current_theta},
      {"status", to_string(statistics.status)},
  };
}

nlohmann::json to_json(const RecentPerformance& performance) {
  return {
      {"attempts", performance.attempts},
      {"correct", performance.correct},
      {"accuracy", performance.accuracy},
      {"avg_time", performance.average_time},
  };
}

nlohmann::json to_json(const RecordResult& result) {
  return {
      {"outcome", to_json(result.outcome)},
      {"status_before", to_string(result.status_before)},
      {"status_after", to_string(result.status_after)},
      {"unlocked", result.unlocked},
      {"persisted", result.persisted},
  };
}

nlohmann::json to_json(const TopicProgress& progress) {
  return {
      {"topic", progress.topic},
      {"theta", progress.theta},
      {"status", to_string(progress.status)},
      {"progress_percent", progress.progress_percent},
      {"attempts", progress.attempts},
      {"mastery_threshold", progress.mastery_threshold},
  };
}

nlohmann::json to_json(const OverallProgress& progress) {
  return {
      {"total_topics", progress.total_topics},
      {"mastered", progress.mastered},
      {"in_progress", progress.in_progress},
      {"locked", progress.locked},
      {"overall_progress_percent", progress.overall_progress_percent},
      {"total_attempts", progress.total_attempts},
      {"current_focus", optional_to_json(progress.current_focus)},
  };
}

nlohmann::json to_json(const Selection& selection) {
  nlohmann::json json_selection = nlohmann::json::object();
  json_selection["type"] = "item";
  json_selection["item"] = to_json(*selection.item);
  json_selection["topic"] = selection.topic;
  json_selection["explanation"] = selection.explanation;
  json_selection["source"] = to_string(selection.source);
  json_selection["review"] = selection.review;
  nlohmann::json shortlist = nlohmann::json::array();
  for (const auto& entry : selection.shortlist) {
    shortlist.push_back({{"name", entry.item->id}, {"information", entry.information}});
  }
  json_selection["shortlist"] = shortlist;
  nlohmann::json finalists = nlohmann::json::array();
  for (const auto& entry : selection.finalists) {
    // Unseen items have infinite priority, which JSON cannot carry.
    nlohmann::json priority = std::isfinite(entry.priority) ? nlohmann::json(entry.priority) : nlohmann::json();
    finalists.push_back({{"name", entry.item->id}, {"priority", priority}});
  }
  json_selection["finalists"] = finalists;
  return json_selection;
}

nlohmann::json to_json(const NoSelection& none) {
  return {
      {"type", "none"},
      {"topic", optional_to_json(none.topic)},
      {"reason", none.reason},
  };
}

nlohmann::json to_json(const Next& next) {
  if (const auto* selection = std::get_if<Selection>(&next)) {
    return to_json(*selection);
  }
  return to_json(std::get<NoSelection>(next));
}

nlohmann::json to_json(const SelectionExplanation& explanation) {
  return {
      {"question_name", explanation.item_id},
      {"topic", explanation.topic},
      {"your_ability", explanation.ability},
      {"question_difficulty", explanation.difficulty},
      {"difficulty_level", to_string(explanation.band)},
      {"probability_correct", explanation.probability_correct},
      {"information_value", explanation.information},
      {"difficulty_match", explanation.difficulty_match},
      {"reason", explanation.reason},
  };
}

nlohmann::json to_json(const TopicReadiness& readiness) {
  return {
      {"topic", readiness.topic},
      {"status", to_string(readiness.status)},
      {"theta", readiness.theta},
      {"readiness_score", readiness.readiness_score},
      {"prerequisites_met", readiness.prerequisites_met},
      {"prerequisites", readiness.prerequisites},
      {"can_start", readiness.can_start},
  };
}

} // namespace adapt::bridge

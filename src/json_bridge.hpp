#pragma once

#include "adapt/assessment_engine.hpp"
#include "adapt/concept_graph.hpp"
#include "adapt/engine_config.hpp"
#include "adapt/learner_state.hpp"
#include "adapt/selection_policy.hpp"
#include "adapt/types.hpp"

#include <vector>

#include <nlohmann/json.hpp>

namespace adapt::bridge {

nlohmann::json to_json(const ItemParams& params);

nlohmann::json to_json(const TestCase& test);
TestCase test_case_from_json(const nlohmann::json& json_test);

nlohmann::json to_json(const Item& item);
Item item_from_json(const nlohmann::json& json_item);
// Accepts an array of items or an object with a "questions" array.
std::vector<Item> items_from_json(const nlohmann::json& json_items);

nlohmann::json to_json(const Outcome& outcome);
Outcome outcome_from_json(const nlohmann::json& json_outcome);

nlohmann::json to_json(const LearnerProfile& profile);
LearnerProfile learner_profile_from_json(const nlohmann::json& json_profile);

nlohmann::json to_json(const EngineConfig& config);
// Missing keys keep their defaults; the result is validated.
EngineConfig engine_config_from_json(const nlohmann::json& json_config, EngineConfig base = {});

// [{"name": ..., "prerequisites": [...]}, ...] in canonical order.
std::vector<ConceptGraph::Node> concept_nodes_from_json(const nlohmann::json& json_nodes);

// Reads "config", "concepts", "items" (or "questions"), "profile" and
// "user_id". Ranker, store and clock are left for the host to wire.
EngineSetup engine_setup_from_json(const nlohmann::json& json_setup, EngineConfig base = {});

// {"timestamp", "action", "details"}; details default to an empty object.
nlohmann::json to_json(const Interaction& interaction);
Interaction interaction_from_json(const nlohmann::json& json_interaction);

nlohmann::json to_json(const TopicStatistics& statistics);

nlohmann::json to_json(const RecentPerformance& performance);
nlohmann::json to_json(const RecordResult& result);
nlohmann::json to_json(const TopicProgress& progress);
nlohmann::json to_json(const OverallProgress& progress);

nlohmann::json to_json(const Selection& selection);
nlohmann::json to_json(const NoSelection& none);
nlohmann::json to_json(const Next& next);
nlohmann::json to_json(const SelectionExplanation& explanation);
nlohmann::json to_json(const TopicReadiness& readiness);

} // namespace adapt::bridge

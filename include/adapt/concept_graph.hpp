#pragma once

#include "types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace adapt {

/**
 * Static prerequisite DAG plus the mastery state machine
 * (locked -> opened -> mastered) evaluated over a caller-owned StatusMap.
 *
 * The order of the nodes passed to the constructor is the canonical concept
 * ordering used by every query that returns a list or picks "the first".
 * Construction throws std::invalid_argument on duplicate concepts, unknown
 * prerequisites or cycles.
 */
class ConceptGraph {
public:
  struct Node {
    std::string name;
    std::vector<std::string> prerequisites;
  };

  explicit ConceptGraph(std::vector<Node> nodes);

  const std::vector<std::string>& concepts() const { return order_; }
  bool contains(const std::string& concept_name) const;

  const std::vector<std::string>& prerequisites(const std::string& concept_name) const;
  std::set<std::string> all_prerequisites(const std::string& concept_name) const;
  const std::vector<std::string>& dependents(const std::string& concept_name) const;

  // True when every direct prerequisite is mastered.
  bool can_unlock(const std::string& concept_name, const StatusMap& status) const;
  // Locked and can_unlock.
  bool should_unlock(const std::string& concept_name, const StatusMap& status) const;
  std::vector<std::string> unlockable_concepts(const StatusMap& status) const;
  std::vector<std::string> available_concepts(const StatusMap& status) const;
  std::vector<std::string> concepts_with_status(const StatusMap& status, ConceptStatus wanted) const;

  std::optional<std::string> next_concept_to_learn(const StatusMap& status) const;

  int concept_level(const std::string& concept_name) const;

  ConceptStatus initial_status(const std::string& concept_name) const;
  StatusMap initial_statuses() const;

  static ConceptStatus status_of(const StatusMap& status, const std::string& concept_name);
  static bool is_valid_transition(ConceptStatus from, ConceptStatus to);

  // locked -> opened; throws std::logic_error unless should_unlock holds.
  void open(const std::string& concept_name, StatusMap& status) const;
  // opened -> mastered, then opens each direct dependent that became
  // unlockable. Returns the concepts it opened.
  std::vector<std::string> master(const std::string& concept_name, StatusMap& status) const;

  nlohmann::json to_json() const;

private:
  void require_known(const std::string& concept_name) const;
  void check_acyclic() const;

  std::vector<std::string> order_;
  std::map<std::string, std::vector<std::string>> prerequisites_;
  std::map<std::string, std::vector<std::string>> dependents_;
  std::map<std::string, int> levels_;
};

} // namespace adapt

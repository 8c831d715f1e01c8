#include "adapt/concept_graph.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>

namespace adapt {

namespace {

enum class Mark {
  Unvisited,
  Active,
  Done
};

} // namespace

ConceptGraph::ConceptGraph(std::vector<Node> nodes) {
  for (auto& node : nodes) {
    if (node.name.empty()) {
      throw std::invalid_argument("Concept name must not be empty");
    }
    if (prerequisites_.count(node.name) > 0) {
      throw std::invalid_argument("Duplicate concept: " + node.name);
    }
    order_.push_back(node.name);
    dependents_[node.name];
    prerequisites_.emplace(node.name, std::move(node.prerequisites));
  }
  for (const auto& name : order_) {
    for (const auto& prereq : prerequisites_.at(name)) {
      if (prerequisites_.count(prereq) == 0) {
        throw std::invalid_argument("Concept '" + name + "' lists unknown prerequisite '" + prereq + "'");
      }
      dependents_[prereq].push_back(name);
    }
  }
  check_acyclic();

  std::function<int(const std::string&)> level_of = [&](const std::string& name) -> int {
    auto it = levels_.find(name);
    if (it != levels_.end()) {
      return it->second;
    }
    int level = 0;
    for (const auto& prereq : prerequisites_.at(name)) {
      level = std::max(level, level_of(prereq) + 1);
    }
    levels_[name] = level;
    return level;
  };
  for (const auto& name : order_) {
    level_of(name);
  }
}

void ConceptGraph::check_acyclic() const {
  std::map<std::string, Mark> marks;
  std::function<void(const std::string&)> visit = [&](const std::string& name) {
    Mark& mark = marks[name];
    if (mark == Mark::Done) {
      return;
    }
    if (mark == Mark::Active) {
      throw std::invalid_argument("Prerequisite cycle through concept '" + name + "'");
    }
    mark = Mark::Active;
    for (const auto& prereq : prerequisites_.at(name)) {
      visit(prereq);
    }
    marks[name] = Mark::Done;
  };
  for (const auto& name : order_) {
    visit(name);
  }
}

bool ConceptGraph::contains(const std::string& concept_name) const {
  return prerequisites_.count(concept_name) > 0;
}

void ConceptGraph::require_known(const std::string& concept_name) const {
  if (!contains(concept_name)) {
    throw std::out_of_range("Unknown concept: " + concept_name);
  }
}

const std::vector<std::string>& ConceptGraph::prerequisites(const std::string& concept_name) const {
  require_known(concept_name);
  return prerequisites_.at(concept_name);
}

std::set<std::string> ConceptGraph::all_prerequisites(const std::string& concept_name) const {
  require_known(concept_name);
  std::set<std::string> out;
  std::vector<std::string> pending{concept_name};
  while (!pending.empty()) {
    const std::string current = pending.back();
    pending.pop_back();
    for (const auto& prereq : prerequisites_.at(current)) {
      if (out.insert(prereq).second) {
        pending.push_back(prereq);
      }
    }
  }
  return out;
}

const std::vector<std::string>& ConceptGraph::dependents(const std::string& concept_name) const {
  require_known(concept_name);
  return dependents_.at(concept_name);
}

ConceptStatus ConceptGraph::status_of(const StatusMap& status, const std::string& concept_name) {
  auto it = status.find(concept_name);
  return it == status.end() ? ConceptStatus::Locked : it->second;
}

bool ConceptGraph::can_unlock(const std::string& concept_name, const StatusMap& status) const {
  for (const auto& prereq : prerequisites(concept_name)) {
    if (status_of(status, prereq) != ConceptStatus::Mastered) {
      return false;
    }
  }
  return true;
}

bool ConceptGraph::should_unlock(const std::string& concept_name, const StatusMap& status) const {
  return status_of(status, concept_name) == ConceptStatus::Locked && can_unlock(concept_name, status);
}

std::vector<std::string> ConceptGraph::unlockable_concepts(const StatusMap& status) const {
  std::vector<std::string> out;
  for (const auto& name : order_) {
    if (should_unlock(name, status)) {
      out.push_back(name);
    }
  }
  return out;
}

std::vector<std::string> ConceptGraph::available_concepts(const StatusMap& status) const {
  std::vector<std::string> out;
  for (const auto& name : order_) {
    if (status_of(status, name) != ConceptStatus::Locked) {
      out.push_back(name);
    }
  }
  return out;
}

std::vector<std::string> ConceptGraph::concepts_with_status(const StatusMap& status,
                                                            ConceptStatus wanted) const {
  std::vector<std::string> out;
  for (const auto& name : order_) {
    if (status_of(status, name) == wanted) {
      out.push_back(name);
    }
  }
  return out;
}

std::optional<std::string> ConceptGraph::next_concept_to_learn(const StatusMap& status) const {
  for (const auto& name : order_) {
    if (status_of(status, name) == ConceptStatus::Opened) {
      return name;
    }
  }
  for (const auto& name : order_) {
    if (should_unlock(name, status)) {
      return name;
    }
  }
  return std::nullopt;
}

int ConceptGraph::concept_level(const std::string& concept_name) const {
  require_known(concept_name);
  return levels_.at(concept_name);
}

ConceptStatus ConceptGraph::initial_status(const std::string& concept_name) const {
  return prerequisites(concept_name).empty() ? ConceptStatus::Opened : ConceptStatus::Locked;
}

StatusMap ConceptGraph::initial_statuses() const {
  StatusMap out;
  for (const auto& name : order_) {
    out[name] = initial_status(name);
  }
  return out;
}

bool ConceptGraph::is_valid_transition(ConceptStatus from, ConceptStatus to) {
  return (from == ConceptStatus::Locked && to == ConceptStatus::Opened) ||
         (from == ConceptStatus::Opened && to == ConceptStatus::Mastered);
}

void ConceptGraph::open(const std::string& concept_name, StatusMap& status) const {
  const ConceptStatus current = status_of(status, concept_name);
  if (!is_valid_transition(current, ConceptStatus::Opened)) {
    throw std::logic_error("Cannot open concept '" + concept_name + "' from status " + to_string(current));
  }
  if (!can_unlock(concept_name, status)) {
    throw std::logic_error("Concept '" + concept_name + "' has unmastered prerequisites");
  }
  status[concept_name] = ConceptStatus::Opened;
}

std::vector<std::string> ConceptGraph::master(const std::string& concept_name, StatusMap& status) const {
  require_known(concept_name);
  const ConceptStatus current = status_of(status, concept_name);
  if (!is_valid_transition(current, ConceptStatus::Mastered)) {
    throw std::logic_error("Cannot master concept '" + concept_name + "' from status " + to_string(current));
  }
  status[concept_name] = ConceptStatus::Mastered;

  std::vector<std::string> opened;
  for (const auto& dependent : dependents_.at(concept_name)) {
    if (should_unlock(dependent, status)) {
      status[dependent] = ConceptStatus::Opened;
      opened.push_back(dependent);
    }
  }
  return opened;
}

nlohmann::json ConceptGraph::to_json() const {
  nlohmann::json prereqs = nlohmann::json::object();
  nlohmann::json deps = nlohmann::json::object();
  nlohmann::json levels = nlohmann::json::object();
  for (const auto& name : order_) {
    prereqs[name] = prerequisites_.at(name);
    deps[name] = dependents_.at(name);
    levels[name] = levels_.at(name);
  }
  return {
      {"concepts", order_},
      {"prerequisites", prereqs},
      {"dependents", deps},
      {"levels", levels},
  };
}

} // namespace adapt

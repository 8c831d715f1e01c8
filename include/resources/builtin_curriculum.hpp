#pragma once

#include "adapt/concept_graph.hpp"

#include <string_view>
#include <vector>

namespace adapt::builtin::Recursion {

inline constexpr std::string_view kBasics = "Recursion Basics";
inline constexpr std::string_view kBacktracking = "Backtracking";
inline constexpr std::string_view kDynamicProgramming = "Dynamic Programming & Advanced Recursion";

inline std::vector<ConceptGraph::Node> nodes() {
  return {
      {std::string(kBasics), {}},
      {std::string(kBacktracking), {std::string(kBasics)}},
      {std::string(kDynamicProgramming), {std::string(kBacktracking)}},
  };
}

} // namespace adapt::builtin::Recursion

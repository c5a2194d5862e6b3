#pragma once

#include "mcts/concepts/ProblemConcept.hpp"

#include <ostream>
#include <vector>

namespace mcts {

/*
 * A snapshot of the root statistics of a search, taken by Manager::search_results().
 *
 * Children appear in legal-action enumeration order. best_index is the position of the robust
 * child in that vector, or -1 if the root has no children.
 */
template <concepts::Problem Problem>
struct SearchResults {
  using Action = Problem::Action;

  struct ChildStats {
    Action action;
    int N;
    double Q;
  };

  // Prints one row per root child. Requires Action to support operator<<.
  void print(std::ostream&) const;

  friend std::ostream& operator<<(std::ostream& os, const SearchResults& results) {
    results.print(os);
    return os;
  }

  std::vector<ChildStats> children;
  int root_N = 0;
  double root_Q = 0;
  int tree_size = 0;
  int num_iterations = 0;
  int best_index = -1;
};

}  // namespace mcts

#include "inline/mcts/SearchResults.inl"

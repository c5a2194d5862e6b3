#pragma once

#include <numbers>

namespace mcts {

/*
 * ManagerParams pertains to a single mcts::Manager instance.
 *
 * By contrast, SearchParams pertains to each individual Manager::run() call.
 */
struct ManagerParams {
  auto make_options_description();
  bool operator==(const ManagerParams& other) const = default;

  // Throws mcts::InvalidConfiguration if any field is out of range.
  void validate() const;

  // The c in Q + c * sqrt(ln(N_parent) / N_child).
  double exploration_constant = std::numbers::sqrt2;

  // A rollout that needs more transitions than this is reported as RolloutNonTermination.
  int max_rollout_depth = 1 << 16;

  // If false, expansion picks the first untried action in enumeration order. If true, the rollout
  // policy picks among the untried actions, so a weighted policy also biases expansion.
  bool random_expansion = false;
};

}  // namespace mcts

#include "inline/mcts/ManagerParams.inl"

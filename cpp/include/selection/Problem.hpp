#pragma once

#include "mcts/RolloutPolicy.hpp"

#include <boost/dynamic_bitset.hpp>

#include <functional>
#include <ostream>
#include <random>
#include <vector>

namespace selection {

/*
 * State of a "choose up to k of n candidates" problem.
 *
 * Candidates are identified by their index in [0, n). A candidate is either selected or still in
 * the pool, never both.
 */
struct State {
  bool operator==(const State& other) const = default;
  int num_selected() const { return selected.size(); }

  std::vector<int> selected;     // in selection order
  boost::dynamic_bitset<> pool;  // remaining candidates
  int budget = 0;                // number of candidates that may still be selected
};

std::ostream& operator<<(std::ostream&, const State&);

/*
 * Combinatorial selection without replacement: starting from an empty selection, add one candidate
 * per action until the budget is used up or the pool is empty. The reward of a terminal state is
 * the caller's objective evaluated over the selected indices.
 *
 * Transitions are deterministic; the prng argument of apply() is unused. Randomness comes from the
 * rollout policy.
 */
class Problem {
 public:
  using State = selection::State;
  using Action = int;
  using objective_t = std::function<double(const std::vector<int>& selected)>;

  // Throws mcts::InvalidConfiguration if pool_size or budget is negative, or objective is empty.
  Problem(int pool_size, int budget, objective_t objective);

  int pool_size() const { return pool_size_; }
  int budget() const { return budget_; }

  // Empty selection, full pool, full budget.
  State initial_state() const;

  // The remaining candidates, in ascending index order. Empty for a terminal state.
  std::vector<Action> legal_actions(const State&) const;

  bool is_terminal(const State& state) const { return state.budget <= 0 || state.pool.none(); }

  // Throws std::invalid_argument if state is terminal or action is not in the pool.
  State apply(const State&, Action, std::mt19937&) const;

  // Throws std::invalid_argument if state is not terminal.
  double reward(const State&) const;

 private:
  const int pool_size_;
  const int budget_;
  const objective_t objective_;
};

/*
 * Rollout policy that picks a remaining candidate i with probability proportional to prior[i], the
 * way a sampling distribution over the pool would. prior must have one non-negative entry per
 * candidate; otherwise throws mcts::InvalidConfiguration.
 */
mcts::RolloutPolicy<Problem> make_prior_rollout_policy(const Problem&, std::vector<double> prior);

// Maps the selected indices of state to the caller's items, in selection order.
template <typename T>
std::vector<T> get_selected(const State& state, const std::vector<T>& items);

}  // namespace selection

#include "inline/selection/Problem.inl"

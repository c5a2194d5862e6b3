#pragma once

#include "mcts/Manager.hpp"
#include "mcts/ManagerParams.hpp"
#include "mcts/RolloutPolicy.hpp"
#include "mcts/SearchParams.hpp"
#include "mcts/SearchResults.hpp"
#include "mcts/concepts/ProblemConcept.hpp"

#include <random>
#include <vector>

namespace mcts {

/*
 * Drives a problem from an initial state to a terminal state, one decision at a time.
 *
 * For each decision, a fresh Manager is built at the current state, searched with search_params,
 * and its best_action() is committed by applying it to the state. No part of a tree is carried
 * over to the next decision.
 */
template <concepts::Problem Problem>
struct SequentialPlanner {
  using State = Problem::State;
  using Action = Problem::Action;
  using Manager = mcts::Manager<Problem>;
  using RolloutPolicy = mcts::RolloutPolicy<Problem>;
  using SearchResults = mcts::SearchResults<Problem>;

  struct Result {
    std::vector<Action> actions;  // committed actions, in order
    std::vector<SearchResults> decisions;  // the search that produced each committed action
    State final_state;
    double reward;
  };

  // If initial_state is already terminal, returns it with no actions.
  static Result plan(const Problem& problem, const State& initial_state,
                     const ManagerParams& manager_params, const SearchParams& search_params,
                     std::mt19937& prng,
                     RolloutPolicy rollout_policy = make_uniform_rollout_policy<Problem>());
};

}  // namespace mcts

#include "inline/mcts/SequentialPlanner.inl"

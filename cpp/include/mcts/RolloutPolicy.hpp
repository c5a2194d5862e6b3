#pragma once

#include "mcts/concepts/ProblemConcept.hpp"

#include <functional>
#include <random>
#include <vector>

namespace mcts {

/*
 * A RolloutPolicy picks the action to take at each step of a simulation. It is handed the current
 * (non-terminal) state and its legal actions, and returns an index into that action vector.
 *
 * The policy must draw any randomness from the passed-in prng.
 */
template <concepts::Problem Problem>
using RolloutPolicy = std::function<int(const typename Problem::State&,
                                        const std::vector<typename Problem::Action>&,
                                        std::mt19937&)>;

// Picks uniformly at random among the legal actions. This is the default rollout policy.
template <concepts::Problem Problem>
RolloutPolicy<Problem> make_uniform_rollout_policy();

/*
 * Picks action a with probability proportional to weight_func(state, a). Weights must be
 * non-negative. If every weight at some step is zero, that step falls back to a uniform choice.
 */
template <concepts::Problem Problem>
RolloutPolicy<Problem> make_weighted_rollout_policy(
  std::function<double(const typename Problem::State&, const typename Problem::Action&)>
    weight_func);

}  // namespace mcts

#include "inline/mcts/RolloutPolicy.inl"

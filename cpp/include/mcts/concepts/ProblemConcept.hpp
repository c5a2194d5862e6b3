#pragma once

#include <concepts>
#include <random>
#include <vector>

namespace mcts {

namespace concepts {

/*
 * All problem classes P searched by mcts::Manager<P> must satisfy mcts::concepts::Problem<P>.
 *
 * A problem owns the semantics of its states; the search machinery treats P::State as opaque and
 * only copies it around. The four operations are:
 *
 * legal_actions(state): every action applicable in state, in a fixed enumeration order. Must be
 *   empty iff is_terminal(state).
 *
 * is_terminal(state): true iff no further actions exist.
 *
 * apply(state, action, prng): returns the successor state. Stochastic problems draw from prng, so
 *   the same (state, action) pair may yield different successors across calls.
 *
 * reward(state): the outcome of a terminal state, from the perspective of the decision-maker.
 *   Larger is better.
 */
template <class P>
concept Problem = requires(const P& problem, const typename P::State& state,
                           const typename P::Action& action, std::mt19937& prng) {
  requires std::copyable<typename P::State>;
  requires std::copyable<typename P::Action>;
  requires std::equality_comparable<typename P::Action>;

  { problem.legal_actions(state) } -> std::same_as<std::vector<typename P::Action>>;
  { problem.is_terminal(state) } -> std::same_as<bool>;
  { problem.apply(state, action, prng) } -> std::same_as<typename P::State>;
  { problem.reward(state) } -> std::same_as<double>;
};

}  // namespace concepts

}  // namespace mcts

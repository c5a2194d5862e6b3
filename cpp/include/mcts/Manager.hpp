#pragma once

#include "mcts/ManagerParams.hpp"
#include "mcts/Node.hpp"
#include "mcts/RolloutPolicy.hpp"
#include "mcts/SearchParams.hpp"
#include "mcts/SearchResults.hpp"
#include "mcts/concepts/ProblemConcept.hpp"

#include <memory>
#include <random>

namespace mcts {

/*
 * The Manager class is the main entry point for doing MCTS searches.
 *
 * It owns the search tree, rooted at the state it was constructed with. Each call to run() performs
 * iterations of the 4-phase loop:
 *
 * 1. Selection: descend from the root via UCT while the current node is non-terminal and fully
 *    expanded.
 * 2. Expansion: if the reached node is non-terminal, expand one of its untried actions.
 * 3. Simulation: roll out from the new node to a terminal state using the rollout policy.
 * 4. Backpropagation: add the reward to every node from the new node up to the root.
 *
 * An iteration whose rollout throws is undone before the exception propagates: the node it expanded
 * is removed again, so the tree only ever reflects completed iterations.
 *
 * Successive run() calls keep growing the same tree. best_action() then recommends the robust child
 * of the root.
 *
 * All randomness (random expansion, rollouts, stochastic transitions) is drawn from the prng passed
 * at construction, which must outlive the Manager. A fixed seed reproduces the search exactly.
 */
template <concepts::Problem Problem>
class Manager {
 public:
  using State = Problem::State;
  using Action = Problem::Action;
  using Node = mcts::Node<Problem>;
  using RolloutPolicy = mcts::RolloutPolicy<Problem>;
  using SearchResults = mcts::SearchResults<Problem>;

  // Throws mcts::InvalidConfiguration if params is invalid.
  Manager(const Problem& problem, const State& root_state, const ManagerParams& params,
          std::mt19937& prng,
          RolloutPolicy rollout_policy = make_uniform_rollout_policy<Problem>());

  Manager(const Manager&) = delete;
  Manager& operator=(const Manager&) = delete;

  /*
   * Runs iterations until the limit in search_params is reached.
   *
   * Throws mcts::InvalidConfiguration if search_params is invalid, and mcts::InvalidExpansion if
   * the root is terminal (there is no decision to search). In both cases no iteration is run.
   */
  void run(const SearchParams& search_params);

  /*
   * Returns the action of the robust child of the root: highest visit count, ties broken by highest
   * mean value, then by legal-action enumeration order.
   *
   * Throws mcts::EmptyTree if no iteration has completed.
   */
  Action best_action() const;

  SearchResults search_results() const;

  // Index into node->edges() of the robust child, or -1 if node has no children.
  static int get_robust_child_index(const Node* node);

  const Node* root() const { return root_.get(); }
  const Problem& problem() const { return problem_; }
  const ManagerParams& params() const { return params_; }
  int num_iterations() const { return num_iterations_; }

 private:
  void iterate();
  Node* select();
  Node* expand(Node* node);
  double simulate(const Node* node);
  void backpropagate(Node* leaf, double reward);

  const Problem problem_;
  const ManagerParams params_;
  std::mt19937& prng_;
  RolloutPolicy rollout_policy_;
  std::unique_ptr<Node> root_;
  int num_iterations_ = 0;
};

}  // namespace mcts

#include "inline/mcts/Manager.inl"

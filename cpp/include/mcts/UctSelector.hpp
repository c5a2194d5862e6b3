#pragma once

#include "mcts/Node.hpp"
#include "mcts/concepts/ProblemConcept.hpp"

#include <Eigen/Core>

namespace mcts {

/*
 * Computes the UCT score of every child of a node:
 *
 * UCT(i) = Q(i) + c * sqrt(ln(N_parent) / N(i))
 *
 * A child with N(i) == 0 scores +inf, so every child is tried once before any child is revisited.
 *
 * The per-child arrays are kept as public members so that callers (and tests) can inspect how a
 * decision was made.
 */
template <concepts::Problem Problem>
struct UctSelector {
  using Node = mcts::Node<Problem>;
  using LocalArray = Eigen::Array<double, Eigen::Dynamic, 1>;

  UctSelector(const Node* node, double exploration_constant);

  // Index of the highest-scoring child. Ties go to the lowest index, which is the first child in
  // legal-action enumeration order.
  int select() const;

  LocalArray N;    // child visit count
  LocalArray Q;    // child mean value
  LocalArray UCT;  // score
};

}  // namespace mcts

#include "inline/mcts/UctSelector.inl"

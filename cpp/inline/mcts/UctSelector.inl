#include "mcts/UctSelector.hpp"

#include "util/Asserts.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace mcts {

template <concepts::Problem Problem>
UctSelector<Problem>::UctSelector(const Node* node, double exploration_constant)
    : N(node->num_children()), Q(N.rows()), UCT(N.rows()) {
  RELEASE_ASSERT(node->num_children() > 0, "UCT selection on a node without children");

  for (int i = 0; i < node->num_children(); ++i) {
    const auto& stats = node->get_child(i)->stats();
    N(i) = stats.N;
    Q(i) = stats.Q();
  }

  // N_parent >= 1 whenever a child has been visited; the clamp only matters for an unvisited
  // parent, where every child scores +inf anyway.
  double log_parent_N = std::log(std::max(node->stats().N, 1));

  constexpr double kInf = std::numeric_limits<double>::infinity();
  for (int i = 0; i < UCT.rows(); ++i) {
    UCT(i) = N(i) > 0 ? Q(i) + exploration_constant * std::sqrt(log_parent_N / N(i)) : kInf;
  }
}

template <concepts::Problem Problem>
int UctSelector<Problem>::select() const {
  int best = 0;
  for (int i = 1; i < UCT.rows(); ++i) {
    if (UCT(i) > UCT(best)) best = i;
  }
  return best;
}

}  // namespace mcts

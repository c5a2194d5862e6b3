#include "mcts/Manager.hpp"

#include "mcts/Exceptions.hpp"
#include "mcts/UctSelector.hpp"
#include "util/Asserts.hpp"
#include "util/CppUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <chrono>
#include <utility>

namespace mcts {

template <concepts::Problem Problem>
Manager<Problem>::Manager(const Problem& problem, const State& root_state,
                          const ManagerParams& params, std::mt19937& prng,
                          RolloutPolicy rollout_policy)
    : problem_(problem),
      params_(params),
      prng_(prng),
      rollout_policy_(std::move(rollout_policy)),
      root_(std::make_unique<Node>(problem_, root_state)) {
  params_.validate();
  if (!rollout_policy_) {
    throw InvalidConfiguration("Empty rollout policy");
  }
}

template <concepts::Problem Problem>
void Manager<Problem>::run(const SearchParams& search_params) {
  search_params.validate();
  if (root_->is_terminal()) {
    throw InvalidExpansion("Cannot search from a terminal root state");
  }

  int num_iterations_before = num_iterations_;
  auto start = std::chrono::steady_clock::now();

  if (search_params.limit == SearchParams::kIterationLimit) {
    for (int i = 0; i < search_params.num_iterations; ++i) {
      iterate();
    }
  } else {
    do {
      iterate();
    } while (std::chrono::steady_clock::now() - start < search_params.time_budget());
  }

  int64_t elapsed_ns = util::to_ns(std::chrono::steady_clock::now() - start);
  LOG_DEBUG("MCTS run: {} iterations in {}ns (total={} tree_size={})",
            num_iterations_ - num_iterations_before, elapsed_ns, num_iterations_,
            root_->tree_size());
}

template <concepts::Problem Problem>
typename Manager<Problem>::Action Manager<Problem>::best_action() const {
  int i = get_robust_child_index(root_.get());
  if (i < 0 || root_->stats().N == 0) {
    throw EmptyTree("best_action() requested with no completed iteration ({} root children)",
                    root_->num_children());
  }
  return root_->child_action(i);
}

template <concepts::Problem Problem>
typename Manager<Problem>::SearchResults Manager<Problem>::search_results() const {
  SearchResults results;
  for (int i = 0; i < root_->num_children(); ++i) {
    const auto& stats = root_->get_child(i)->stats();
    results.children.push_back({root_->child_action(i), stats.N, stats.Q()});
  }
  results.root_N = root_->stats().N;
  results.root_Q = root_->stats().Q();
  results.tree_size = root_->tree_size();
  results.num_iterations = num_iterations_;
  results.best_index = get_robust_child_index(root_.get());
  return results;
}

template <concepts::Problem Problem>
int Manager<Problem>::get_robust_child_index(const Node* node) {
  int best = -1;
  int best_N = 0;
  double best_Q = 0;
  for (int i = 0; i < node->num_children(); ++i) {
    const auto& stats = node->get_child(i)->stats();
    int N = stats.N;
    double Q = stats.Q();
    if (best < 0 || N > best_N || (N == best_N && Q > best_Q)) {
      best = i;
      best_N = N;
      best_Q = Q;
    }
  }
  return best;
}

template <concepts::Problem Problem>
void Manager<Problem>::iterate() {
  Node* node = select();
  if (node->is_terminal()) {
    backpropagate(node, simulate(node));
    num_iterations_++;
    return;
  }

  Node* child = expand(node);
  double reward;
  try {
    reward = simulate(child);
  } catch (...) {
    // A failed iteration leaves the tree as it found it.
    node->retract(child);
    throw;
  }
  backpropagate(child, reward);
  num_iterations_++;
}

template <concepts::Problem Problem>
typename Manager<Problem>::Node* Manager<Problem>::select() {
  Node* node = root_.get();
  while (!node->is_terminal() && node->fully_expanded()) {
    UctSelector<Problem> selector(node, params_.exploration_constant);
    node = node->get_child(selector.select());
  }
  return node;
}

template <concepts::Problem Problem>
typename Manager<Problem>::Node* Manager<Problem>::expand(Node* node) {
  int k = 0;
  int n = node->num_untried_actions();
  if (params_.random_expansion && n > 1) {
    k = rollout_policy_(node->state(), node->untried_actions(), prng_);
    RELEASE_ASSERT(k >= 0 && k < n, "rollout policy returned {} (num_untried={})", k, n);
  }
  return node->expand(problem_, k, prng_);
}

// The rollout works on a transient copy of the state. The persistent tree is never touched.
template <concepts::Problem Problem>
double Manager<Problem>::simulate(const Node* node) {
  if (node->is_terminal()) {
    return problem_.reward(node->state());
  }

  State state = node->state();
  int depth = 0;
  while (!problem_.is_terminal(state)) {
    if (depth >= params_.max_rollout_depth) {
      throw RolloutNonTermination("Rollout did not reach a terminal state within {} transitions",
                                  params_.max_rollout_depth);
    }
    std::vector<Action> actions = problem_.legal_actions(state);
    RELEASE_ASSERT(!actions.empty(), "non-terminal rollout state has no legal actions");

    int a = rollout_policy_(state, actions, prng_);
    RELEASE_ASSERT(a >= 0 && a < (int)actions.size(), "rollout policy returned {} (num_actions={})",
                   a, actions.size());
    state = problem_.apply(state, actions[a], prng_);
    depth++;
  }
  return problem_.reward(state);
}

template <concepts::Problem Problem>
void Manager<Problem>::backpropagate(Node* leaf, double reward) {
  for (Node* node = leaf; node; node = node->parent()) {
    node->update(reward);
  }
  DEBUG_ASSERT(root_->stats().N == num_iterations_ + 1);
}

}  // namespace mcts

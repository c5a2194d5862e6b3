#include "mcts/Node.hpp"

#include "mcts/Exceptions.hpp"
#include "util/Asserts.hpp"

#include <algorithm>
#include <numeric>

namespace mcts {

template <concepts::Problem Problem>
Node<Problem>::StableData::StableData(const Problem& problem, const State& s)
    : state(s), terminal(problem.is_terminal(s)) {
  if (!terminal) {
    legal_actions = problem.legal_actions(s);
    RELEASE_ASSERT(!legal_actions.empty(), "non-terminal state has no legal actions");
  }
}

template <concepts::Problem Problem>
Node<Problem>::Node(const Problem& problem, const State& state, Node* parent)
    : stable_data_(problem, state), parent_(parent) {
  untried_.resize(stable_data_.legal_actions.size());
  std::iota(untried_.begin(), untried_.end(), 0);
}

template <concepts::Problem Problem>
void Node<Problem>::update(double reward) {
  stats_.N++;
  stats_.W += reward;
}

template <concepts::Problem Problem>
const typename Node<Problem>::Action& Node<Problem>::child_action(int i) const {
  return stable_data_.legal_actions[edges_[i].action_index];
}

template <concepts::Problem Problem>
const Node<Problem>* Node<Problem>::find_child(const Action& action) const {
  for (const Edge& edge : edges_) {
    if (stable_data_.legal_actions[edge.action_index] == action) return edge.child.get();
  }
  return nullptr;
}

template <concepts::Problem Problem>
const typename Node<Problem>::Action& Node<Problem>::untried_action(int k) const {
  return stable_data_.legal_actions[untried_[k]];
}

template <concepts::Problem Problem>
typename Node<Problem>::ActionVec Node<Problem>::untried_actions() const {
  ActionVec actions;
  actions.reserve(untried_.size());
  for (int a : untried_) {
    actions.push_back(stable_data_.legal_actions[a]);
  }
  return actions;
}

template <concepts::Problem Problem>
Node<Problem>* Node<Problem>::expand(const Problem& problem, int k, std::mt19937& prng) {
  if (is_terminal()) {
    throw InvalidExpansion("Cannot expand a terminal node");
  }
  if (untried_.empty()) {
    throw InvalidExpansion("Cannot expand a fully-expanded node ({} children)", edges_.size());
  }
  if (k < 0 || k >= (int)untried_.size()) {
    throw InvalidExpansion("Untried-action index {} out of range [0, {})", k, untried_.size());
  }

  int action_index = untried_[k];
  State child_state = problem.apply(state(), stable_data_.legal_actions[action_index], prng);
  auto child = std::make_unique<Node>(problem, child_state, this);
  Node* out = child.get();

  untried_.erase(untried_.begin() + k);
  auto pos = std::find_if(edges_.begin(), edges_.end(),
                          [&](const Edge& e) { return e.action_index > action_index; });
  edges_.insert(pos, Edge{action_index, std::move(child)});

  DEBUG_ASSERT(edges_.size() + untried_.size() == stable_data_.legal_actions.size());
  return out;
}

template <concepts::Problem Problem>
void Node<Problem>::retract(const Node* child) {
  auto it = std::find_if(edges_.begin(), edges_.end(),
                         [&](const Edge& e) { return e.child.get() == child; });
  RELEASE_ASSERT(it != edges_.end(), "retract() of a node that is not a child");
  RELEASE_ASSERT(child->stats().N == 0 && child->num_children() == 0,
                 "retract() of a visited child (N={})", child->stats().N);

  int action_index = it->action_index;
  edges_.erase(it);
  untried_.insert(std::upper_bound(untried_.begin(), untried_.end(), action_index), action_index);

  DEBUG_ASSERT(edges_.size() + untried_.size() == stable_data_.legal_actions.size());
}

template <concepts::Problem Problem>
int Node<Problem>::tree_size() const {
  int size = 1;
  for (const Edge& edge : edges_) {
    size += edge.child->tree_size();
  }
  return size;
}

}  // namespace mcts

#pragma once

#include "mcts/concepts/ProblemConcept.hpp"

#include <memory>
#include <random>
#include <vector>

namespace mcts {

/*
 * A Node consists of 3 main data members:
 *
 * StableData: write-once data that is fixed for the lifetime of the node
 * Stats: values that get updated throughout MCTS via backpropagation
 * Edge[]: owning edges to children nodes, needed for tree traversal
 *
 * Edges are kept sorted by the position of their action in the legal-action enumeration of this
 * node, regardless of the order in which they were expanded. Together with the untried-action
 * list, they partition the legal actions: every legal action is either untried or has exactly one
 * edge.
 *
 * The parent pointer is non-owning. A parent exclusively owns its children, and a Node is never
 * shared across branches, so the tree is a strict out-tree.
 */
template <concepts::Problem Problem>
class Node {
 public:
  using State = Problem::State;
  using Action = Problem::Action;
  using ActionVec = std::vector<Action>;

  struct StableData {
    StableData(const Problem&, const State&);

    State state;
    ActionVec legal_actions;  // empty iff terminal
    bool terminal;
  };

  struct Stats {
    double Q() const { return N ? W / N : 0.0; }

    int N = 0;     // visit count
    double W = 0;  // sum of rollout rewards
  };

  struct Edge {
    int action_index;  // index into stable_data().legal_actions
    std::unique_ptr<Node> child;
  };
  using edge_vec_t = std::vector<Edge>;

  Node(const Problem&, const State&, Node* parent = nullptr);
  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  const StableData& stable_data() const { return stable_data_; }
  const State& state() const { return stable_data_.state; }
  bool is_terminal() const { return stable_data_.terminal; }

  Node* parent() const { return parent_; }
  bool is_root() const { return parent_ == nullptr; }

  const Stats& stats() const { return stats_; }

  // Records one rollout through this node.
  void update(double reward);

  int num_children() const { return edges_.size(); }
  const edge_vec_t& edges() const { return edges_; }
  const Action& child_action(int i) const;
  const Node* get_child(int i) const { return edges_[i].child.get(); }
  Node* get_child(int i) { return edges_[i].child.get(); }

  // Returns the child reached via action, or nullptr if action has not been expanded.
  const Node* find_child(const Action& action) const;

  int num_untried_actions() const { return untried_.size(); }
  const Action& untried_action(int k) const;
  ActionVec untried_actions() const;
  bool fully_expanded() const { return untried_.empty(); }

  // Applies the k'th untried action, attaches the resulting state as a new child (N = 0, W = 0),
  // and returns that child.
  //
  // Throws mcts::InvalidExpansion if this node is terminal, has no untried actions, or if k is out
  // of range.
  Node* expand(const Problem&, int k, std::mt19937& prng);

  // Undoes expand(): removes child, which must be an unvisited leaf child of this node, and puts
  // its action back among the untried ones.
  void retract(const Node* child);

  // Number of nodes in the subtree rooted at this node, including this node.
  int tree_size() const;

 private:
  StableData stable_data_;
  Node* parent_;
  Stats stats_;
  edge_vec_t edges_;
  std::vector<int> untried_;  // indices into stable_data_.legal_actions, ascending
};

}  // namespace mcts

#include "inline/mcts/Node.inl"

#include "mcts/Exceptions.hpp"
#include "mcts/Manager.hpp"
#include "mcts/ManagerParams.hpp"
#include "mcts/Node.hpp"
#include "mcts/RolloutPolicy.hpp"
#include "mcts/SearchParams.hpp"
#include "mcts/SearchResults.hpp"
#include "mcts/SequentialPlanner.hpp"
#include "mcts/UctSelector.hpp"
#include "mcts/concepts/ProblemConcept.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exceptions.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cmath>
#include <limits>
#include <numbers>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// One decision among n arms, each with a fixed reward.
struct Bandit {
  struct State {
    int arm = -1;
  };
  using Action = int;

  Bandit(std::vector<double> v) : values(std::move(v)) {}

  State initial_state() const { return State{}; }

  std::vector<Action> legal_actions(const State& state) const {
    std::vector<Action> actions;
    if (state.arm >= 0) return actions;
    for (int i = 0; i < (int)values.size(); ++i) actions.push_back(i);
    return actions;
  }
  bool is_terminal(const State& state) const { return state.arm >= 0; }
  State apply(const State&, Action action, std::mt19937&) const { return State{action}; }
  double reward(const State& state) const { return values[state.arm]; }

  std::vector<double> values;
};

// A chain of binary choices. The reward is the fraction of 1s chosen.
struct Chain {
  struct State {
    int depth = 0;
    int ones = 0;
  };
  using Action = int;

  std::vector<Action> legal_actions(const State& state) const {
    if (is_terminal(state)) return {};
    return {0, 1};
  }
  bool is_terminal(const State& state) const { return state.depth >= length; }
  State apply(const State& state, Action action, std::mt19937&) const {
    return State{state.depth + 1, state.ones + action};
  }
  double reward(const State& state) const { return state.ones * 1.0 / length; }

  int length = 4;
};

// Action 0 adds 0.4 to the total. Action 1 adds 1 or 0 with equal probability.
struct Coin {
  struct State {
    int step = 0;
    double total = 0;
  };
  using Action = int;

  std::vector<Action> legal_actions(const State& state) const {
    if (is_terminal(state)) return {};
    return {0, 1};
  }
  bool is_terminal(const State& state) const { return state.step >= 3; }
  State apply(const State& state, Action action, std::mt19937& prng) const {
    double gain = action == 0 ? 0.4 : util::Random::uniform_sample(prng, 0, 2);
    return State{state.step + 1, state.total + gain};
  }
  double reward(const State& state) const { return state.total; }
};

// From the entrance, one action leads into an endless corridor and the other exits at once.
struct Corridor {
  struct State {
    int steps = 0;
    int branch = -1;  // -1 at the entrance
  };
  using Action = int;

  std::vector<Action> legal_actions(const State& state) const {
    if (is_terminal(state)) return {};
    if (state.branch < 0) return {0, 1};
    return {corridor};
  }
  bool is_terminal(const State& state) const { return state.branch == exit_action(); }
  State apply(const State& state, Action action, std::mt19937&) const {
    return State{state.steps + 1, action};
  }
  double reward(const State&) const { return 1; }

  int exit_action() const { return 1 - corridor; }

  int corridor = 0;
};

// Never reaches a terminal state.
struct Treadmill {
  struct State {
    int steps = 0;
  };
  using Action = int;

  std::vector<Action> legal_actions(const State&) const { return {0}; }
  bool is_terminal(const State&) const { return false; }
  State apply(const State& state, Action, std::mt19937&) const { return State{state.steps + 1}; }
  double reward(const State&) const { return 0; }
};

static_assert(mcts::concepts::Problem<Bandit>);
static_assert(mcts::concepts::Problem<Chain>);
static_assert(mcts::concepts::Problem<Coin>);
static_assert(mcts::concepts::Problem<Treadmill>);
static_assert(mcts::concepts::Problem<Corridor>);
static_assert(!mcts::concepts::Problem<int>);

template <typename Node>
void validate_tree(const Node* node) {
  int child_N_sum = 0;
  for (int i = 0; i < node->num_children(); ++i) {
    const Node* child = node->get_child(i);
    EXPECT_EQ(child->parent(), node);
    child_N_sum += child->stats().N;
    if (i > 0) {
      EXPECT_LT(node->edges()[i - 1].action_index, node->edges()[i].action_index);
    }
    validate_tree(child);
  }

  EXPECT_EQ(node->num_children() + node->num_untried_actions(),
            (int)node->stable_data().legal_actions.size());
  EXPECT_GE(node->stats().N, child_N_sum);

  if (node->is_terminal()) {
    EXPECT_EQ(node->num_children(), 0);
  } else if (node->is_root()) {
    EXPECT_EQ(node->stats().N, child_N_sum);
  } else {
    // The first visit of a non-root node is its own rollout; every later visit passes through.
    EXPECT_EQ(node->stats().N, child_N_sum + 1);
  }
}

template <typename Node>
void expect_identical_trees(const Node* a, const Node* b) {
  ASSERT_EQ(a->stats().N, b->stats().N);
  ASSERT_EQ(a->stats().W, b->stats().W);
  ASSERT_EQ(a->num_children(), b->num_children());
  for (int i = 0; i < a->num_children(); ++i) {
    ASSERT_EQ(a->child_action(i), b->child_action(i));
    expect_identical_trees(a->get_child(i), b->get_child(i));
  }
}

class NodeTest : public testing::Test {
 protected:
  using Node = mcts::Node<Bandit>;

  NodeTest() : bandit_({0.1, 0.9, 0.5}), prng_(1) {}

  Bandit bandit_;
  std::mt19937 prng_;
};

TEST_F(NodeTest, construction) {
  Node root(bandit_, bandit_.initial_state());
  EXPECT_TRUE(root.is_root());
  EXPECT_FALSE(root.is_terminal());
  EXPECT_EQ(root.stats().N, 0);
  EXPECT_EQ(root.stats().Q(), 0);
  EXPECT_EQ(root.num_children(), 0);
  EXPECT_EQ(root.num_untried_actions(), 3);
  EXPECT_FALSE(root.fully_expanded());
  EXPECT_EQ(root.untried_actions(), (std::vector<int>{0, 1, 2}));
  EXPECT_EQ(root.tree_size(), 1);
}

TEST_F(NodeTest, expand_keeps_enumeration_order) {
  Node root(bandit_, bandit_.initial_state());

  Node* child = root.expand(bandit_, 2, prng_);
  EXPECT_EQ(child->parent(), &root);
  EXPECT_EQ(child->state().arm, 2);
  EXPECT_TRUE(child->is_terminal());
  EXPECT_EQ(child->stats().N, 0);
  EXPECT_EQ(root.untried_actions(), (std::vector<int>{0, 1}));

  root.expand(bandit_, 0, prng_);
  ASSERT_EQ(root.num_children(), 2);
  EXPECT_EQ(root.child_action(0), 0);
  EXPECT_EQ(root.child_action(1), 2);
  EXPECT_EQ(root.untried_action(0), 1);

  root.expand(bandit_, 0, prng_);
  EXPECT_TRUE(root.fully_expanded());
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(root.child_action(i), i);
  }
  EXPECT_EQ(root.find_child(2), root.get_child(2));
  EXPECT_EQ(root.tree_size(), 4);
}

TEST_F(NodeTest, invalid_expansion) {
  Node root(bandit_, bandit_.initial_state());
  EXPECT_THROW(root.expand(bandit_, 3, prng_), mcts::InvalidExpansion);
  EXPECT_THROW(root.expand(bandit_, -1, prng_), mcts::InvalidExpansion);

  Node* child = root.expand(bandit_, 1, prng_);
  EXPECT_THROW(child->expand(bandit_, 0, prng_), mcts::InvalidExpansion);
  EXPECT_EQ(root.find_child(0), nullptr);

  root.expand(bandit_, 0, prng_);
  root.expand(bandit_, 0, prng_);
  EXPECT_THROW(root.expand(bandit_, 0, prng_), mcts::InvalidExpansion);
  EXPECT_EQ(root.num_children(), 3);
}

TEST_F(NodeTest, retract) {
  Node root(bandit_, bandit_.initial_state());
  Node* child2 = root.expand(bandit_, 2, prng_);
  root.expand(bandit_, 0, prng_);

  root.retract(child2);
  ASSERT_EQ(root.num_children(), 1);
  EXPECT_EQ(root.child_action(0), 0);
  EXPECT_EQ(root.untried_actions(), (std::vector<int>{1, 2}));
  EXPECT_EQ(root.tree_size(), 2);

  Node* child0 = root.get_child(0);
  child0->update(1.0);
  EXPECT_THROW(root.retract(child0), util::ReleaseAssertionError);
  EXPECT_THROW(root.retract(&root), util::ReleaseAssertionError);
}

TEST_F(NodeTest, update) {
  Node root(bandit_, bandit_.initial_state());
  root.update(1.0);
  root.update(0.5);
  EXPECT_EQ(root.stats().N, 2);
  EXPECT_DOUBLE_EQ(root.stats().W, 1.5);
  EXPECT_DOUBLE_EQ(root.stats().Q(), 0.75);
}

class UctTest : public NodeTest {
 protected:
  using UctSelector = mcts::UctSelector<Bandit>;
  using Manager = mcts::Manager<Bandit>;

  UctTest() : root_(bandit_, bandit_.initial_state()) {
    for (int i = 0; i < 3; ++i) {
      root_.expand(bandit_, 0, prng_);
    }
  }

  void visit(int i, double reward) {
    root_.get_child(i)->update(reward);
    root_.update(reward);
  }

  Node root_;
};

TEST_F(UctTest, unvisited_child_first) {
  visit(0, 1.0);
  visit(0, 1.0);
  visit(1, 0.0);

  UctSelector selector(&root_, std::numbers::sqrt2);
  EXPECT_EQ(selector.UCT(2), std::numeric_limits<double>::infinity());
  EXPECT_EQ(selector.select(), 2);
}

TEST_F(UctTest, score) {
  visit(0, 1.0);
  visit(0, 1.0);
  visit(1, 0.0);
  visit(2, 0.5);

  double c = 1.0;
  UctSelector selector(&root_, c);
  double log_N = std::log(4.0);
  EXPECT_NEAR(selector.UCT(0), 1.0 + c * std::sqrt(log_N / 2), 1e-12);
  EXPECT_NEAR(selector.UCT(1), 0.0 + c * std::sqrt(log_N / 1), 1e-12);
  EXPECT_NEAR(selector.UCT(2), 0.5 + c * std::sqrt(log_N / 1), 1e-12);
  EXPECT_EQ(selector.select(), 0);

  // Pure exploitation
  EXPECT_EQ(UctSelector(&root_, 0.0).select(), 0);

  // Heavy exploration favors the less-visited children.
  EXPECT_EQ(UctSelector(&root_, 100.0).select(), 2);
}

TEST_F(UctTest, ties_go_to_first_child) {
  visit(0, 0.5);
  visit(1, 0.5);
  visit(2, 0.5);

  UctSelector selector(&root_, std::numbers::sqrt2);
  EXPECT_EQ(selector.select(), 0);
}

TEST_F(UctTest, robust_child) {
  EXPECT_EQ(Manager::get_robust_child_index(root_.get_child(0)), -1);

  // All unvisited: first child.
  EXPECT_EQ(Manager::get_robust_child_index(&root_), 0);

  visit(0, 0.5);
  visit(0, 0.5);
  visit(1, 0.5);
  visit(1, 1.0);
  visit(2, 1.0);
  // Children 0 and 1 tie on N; child 1 has the higher mean.
  EXPECT_EQ(Manager::get_robust_child_index(&root_), 1);

  visit(2, 0.0);
  visit(2, 0.0);
  // Child 2 has the most visits despite the lowest mean.
  EXPECT_EQ(Manager::get_robust_child_index(&root_), 2);
}

TEST_F(UctTest, robust_child_full_tie) {
  visit(1, 0.25);
  visit(2, 0.25);
  visit(0, 0.25);
  EXPECT_EQ(Manager::get_robust_child_index(&root_), 0);
}

TEST(RolloutPolicy, uniform) {
  std::mt19937 prng(2);
  Bandit bandit({0, 0, 0, 0});
  auto policy = mcts::make_uniform_rollout_policy<Bandit>();
  std::vector<int> actions = bandit.legal_actions(bandit.initial_state());

  std::array<int, 4> counts = {};
  for (int i = 0; i < 2000; ++i) {
    int k = policy(bandit.initial_state(), actions, prng);
    ASSERT_GE(k, 0);
    ASSERT_LT(k, 4);
    counts[k]++;
  }
  for (int c : counts) {
    EXPECT_GT(c, 300);
  }
}

TEST(RolloutPolicy, weighted) {
  std::mt19937 prng(2);
  Bandit bandit({0, 0, 0});
  std::vector<int> actions = bandit.legal_actions(bandit.initial_state());

  auto only_last = mcts::make_weighted_rollout_policy<Bandit>(
    [](const Bandit::State&, const int& action) { return action == 2 ? 1.0 : 0.0; });
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(only_last(bandit.initial_state(), actions, prng), 2);
  }

  auto all_zero = mcts::make_weighted_rollout_policy<Bandit>(
    [](const Bandit::State&, const int&) { return 0.0; });
  std::set<int> seen;
  for (int i = 0; i < 100; ++i) {
    seen.insert(all_zero(bandit.initial_state(), actions, prng));
  }
  EXPECT_EQ(seen.size(), 3u);

  auto negative = mcts::make_weighted_rollout_policy<Bandit>(
    [](const Bandit::State&, const int&) { return -1.0; });
  EXPECT_THROW(negative(bandit.initial_state(), actions, prng), util::ReleaseAssertionError);
}

TEST(ManagerParams, validate) {
  mcts::ManagerParams params;
  EXPECT_NO_THROW(params.validate());

  params.exploration_constant = 0;
  EXPECT_NO_THROW(params.validate());

  params.exploration_constant = -0.1;
  EXPECT_THROW(params.validate(), mcts::InvalidConfiguration);

  params.exploration_constant = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(params.validate(), mcts::InvalidConfiguration);

  params.exploration_constant = std::numeric_limits<double>::infinity();
  EXPECT_THROW(params.validate(), mcts::InvalidConfiguration);

  params = mcts::ManagerParams();
  params.max_rollout_depth = 0;
  EXPECT_THROW(params.validate(), mcts::InvalidConfiguration);
}

TEST(SearchParams, validate) {
  using SearchParams = mcts::SearchParams;
  using namespace std::chrono_literals;

  EXPECT_NO_THROW(SearchParams::make_iteration_params(1).validate());
  EXPECT_THROW(SearchParams::make_iteration_params(0).validate(), mcts::InvalidConfiguration);
  EXPECT_THROW(SearchParams::make_iteration_params(-3).validate(), mcts::InvalidConfiguration);

  EXPECT_NO_THROW(SearchParams::make_time_params(1ms).validate());
  EXPECT_THROW(SearchParams::make_time_params(0ns).validate(), mcts::InvalidConfiguration);
  EXPECT_THROW(SearchParams::make_time_params(-5ns).validate(), mcts::InvalidConfiguration);
}

TEST(Params, cmdline) {
  namespace po2 = boost_util::program_options;

  mcts::ManagerParams manager_params;
  mcts::SearchParams search_params;

  po2::options_description raw_desc("Test options");
  auto desc = raw_desc.add(manager_params.make_options_description())
                .add(search_params.make_options_description());

  std::vector<std::string> args = {"-c", "0.5", "--random-expansion", "--iterations", "7",
                                   "--max-rollout-depth", "9"};
  po2::parse_args(desc, args);

  EXPECT_DOUBLE_EQ(manager_params.exploration_constant, 0.5);
  EXPECT_TRUE(manager_params.random_expansion);
  EXPECT_EQ(manager_params.max_rollout_depth, 9);
  EXPECT_EQ(search_params.num_iterations, 7);
  EXPECT_EQ(search_params.limit, mcts::SearchParams::kIterationLimit);
}

class ManagerTest : public testing::Test {
 protected:
  using SearchParams = mcts::SearchParams;

  ManagerTest() : prng_(1234) {}

  template <typename Problem>
  static typename Problem::State initial_state(const Problem&) {
    return typename Problem::State{};
  }

  std::mt19937 prng_;
  mcts::ManagerParams params_;
};

TEST_F(ManagerTest, invalid_configuration) {
  Bandit bandit({1, 2});

  mcts::ManagerParams bad = params_;
  bad.exploration_constant = -1;
  EXPECT_THROW((mcts::Manager<Bandit>(bandit, bandit.initial_state(), bad, prng_)),
               mcts::InvalidConfiguration);

  bad = params_;
  bad.max_rollout_depth = 0;
  EXPECT_THROW((mcts::Manager<Bandit>(bandit, bandit.initial_state(), bad, prng_)),
               mcts::InvalidConfiguration);

  EXPECT_THROW((mcts::Manager<Bandit>(bandit, bandit.initial_state(), params_, prng_,
                                      mcts::RolloutPolicy<Bandit>())),
               mcts::InvalidConfiguration);

  mcts::Manager<Bandit> manager(bandit, bandit.initial_state(), params_, prng_);
  EXPECT_THROW(manager.run(SearchParams::make_iteration_params(0)), mcts::InvalidConfiguration);
  EXPECT_THROW(manager.run(SearchParams::make_time_params(std::chrono::nanoseconds(0))),
               mcts::InvalidConfiguration);
  EXPECT_EQ(manager.num_iterations(), 0);
  EXPECT_EQ(manager.root()->stats().N, 0);
}

TEST_F(ManagerTest, empty_tree) {
  Bandit bandit({1, 2});
  mcts::Manager<Bandit> manager(bandit, bandit.initial_state(), params_, prng_);
  EXPECT_THROW(manager.best_action(), mcts::EmptyTree);
  EXPECT_EQ(manager.search_results().best_index, -1);
}

TEST_F(ManagerTest, terminal_root) {
  Bandit bandit({1, 2});
  mcts::Manager<Bandit> manager(bandit, Bandit::State{1}, params_, prng_);
  EXPECT_THROW(manager.run(SearchParams::make_iteration_params(10)), mcts::InvalidExpansion);
  EXPECT_EQ(manager.num_iterations(), 0);
  EXPECT_THROW(manager.best_action(), mcts::EmptyTree);
}

TEST_F(ManagerTest, single_iteration) {
  Bandit bandit({1, 2});
  mcts::Manager<Bandit> manager(bandit, bandit.initial_state(), params_, prng_);
  manager.run(SearchParams::make_iteration_params(1));

  const auto* root = manager.root();
  EXPECT_EQ(root->stats().N, 1);
  ASSERT_EQ(root->num_children(), 1);
  EXPECT_EQ(root->child_action(0), 0);
  EXPECT_EQ(root->get_child(0)->stats().N, 1);
  EXPECT_DOUBLE_EQ(root->get_child(0)->stats().W, 1);
  EXPECT_EQ(manager.best_action(), 0);
}

TEST_F(ManagerTest, bandit_finds_best_arm) {
  Bandit bandit({0.1, 0.9, 0.5});
  mcts::Manager<Bandit> manager(bandit, bandit.initial_state(), params_, prng_);
  manager.run(SearchParams::make_iteration_params(300));

  EXPECT_EQ(manager.best_action(), 1);
  EXPECT_EQ(manager.root()->stats().N, 300);
  validate_tree(manager.root());
}

TEST_F(ManagerTest, visit_counts) {
  Chain chain;
  mcts::Manager<Chain> manager(chain, initial_state(chain), params_, prng_);
  manager.run(SearchParams::make_iteration_params(200));

  const auto* root = manager.root();
  EXPECT_EQ(manager.num_iterations(), 200);
  EXPECT_EQ(root->stats().N, 200);
  int sum = 0;
  for (int i = 0; i < root->num_children(); ++i) {
    sum += root->get_child(i)->stats().N;
  }
  EXPECT_EQ(sum, 200);
  validate_tree(root);

  // An iteration adds at most one node.
  EXPECT_LE(root->tree_size(), 201);
  EXPECT_LE(root->tree_size(), (1 << (chain.length + 1)) - 1);
}

TEST_F(ManagerTest, runs_accumulate) {
  Chain chain;
  mcts::Manager<Chain> manager(chain, initial_state(chain), params_, prng_);
  manager.run(SearchParams::make_iteration_params(10));
  manager.run(SearchParams::make_iteration_params(15));

  EXPECT_EQ(manager.num_iterations(), 25);
  EXPECT_EQ(manager.root()->stats().N, 25);
  validate_tree(manager.root());
}

TEST_F(ManagerTest, first_expansion_order) {
  Chain chain;
  mcts::Manager<Chain> manager(chain, initial_state(chain), params_, prng_);
  manager.run(SearchParams::make_iteration_params(1));
  EXPECT_EQ(manager.root()->child_action(0), 0);
}

TEST_F(ManagerTest, random_expansion) {
  Bandit bandit({0, 0, 0, 0, 0});
  params_.random_expansion = true;

  std::set<int> first_actions;
  for (int seed = 1; seed <= 30; ++seed) {
    std::mt19937 prng(seed);
    mcts::Manager<Bandit> manager(bandit, bandit.initial_state(), params_, prng);
    manager.run(SearchParams::make_iteration_params(1));
    first_actions.insert(manager.root()->child_action(0));
  }
  EXPECT_GT(first_actions.size(), 1u);
}

TEST_F(ManagerTest, deterministic_given_seed) {
  Coin coin;
  params_.random_expansion = true;

  std::mt19937 prng1(99);
  std::mt19937 prng2(99);
  mcts::Manager<Coin> manager1(coin, initial_state(coin), params_, prng1);
  mcts::Manager<Coin> manager2(coin, initial_state(coin), params_, prng2);
  manager1.run(SearchParams::make_iteration_params(150));
  manager2.run(SearchParams::make_iteration_params(150));

  expect_identical_trees(manager1.root(), manager2.root());
  EXPECT_EQ(manager1.best_action(), manager2.best_action());
  validate_tree(manager1.root());
}

TEST_F(ManagerTest, time_budget) {
  Chain chain;
  mcts::Manager<Chain> manager(chain, initial_state(chain), params_, prng_);

  // A budget shorter than one iteration still runs one iteration.
  manager.run(SearchParams::make_time_params(std::chrono::nanoseconds(1)));
  EXPECT_GE(manager.num_iterations(), 1);

  manager.run(SearchParams::make_time_params(std::chrono::milliseconds(5)));
  EXPECT_GT(manager.num_iterations(), 1);
  EXPECT_EQ(manager.root()->stats().N, manager.num_iterations());
  validate_tree(manager.root());
}

TEST_F(ManagerTest, rollout_depth_guard) {
  Chain chain;
  chain.length = 5;

  // One expansion step plus four rollout steps reaches the end of the chain.
  params_.max_rollout_depth = 4;
  mcts::Manager<Chain> ok(chain, initial_state(chain), params_, prng_);
  EXPECT_NO_THROW(ok.run(SearchParams::make_iteration_params(1)));

  params_.max_rollout_depth = 3;
  mcts::Manager<Chain> too_shallow(chain, initial_state(chain), params_, prng_);
  EXPECT_THROW(too_shallow.run(SearchParams::make_iteration_params(1)),
               mcts::RolloutNonTermination);
}

TEST_F(ManagerTest, rollout_non_termination) {
  Treadmill treadmill;
  params_.max_rollout_depth = 10;
  mcts::Manager<Treadmill> manager(treadmill, initial_state(treadmill), params_, prng_);
  EXPECT_THROW(manager.run(SearchParams::make_iteration_params(1)), mcts::RolloutNonTermination);
}

TEST_F(ManagerTest, failed_first_iteration_leaves_empty_tree) {
  Corridor corridor;
  corridor.corridor = 0;
  params_.max_rollout_depth = 10;
  mcts::Manager<Corridor> manager(corridor, initial_state(corridor), params_, prng_);

  EXPECT_THROW(manager.run(SearchParams::make_iteration_params(5)), mcts::RolloutNonTermination);
  EXPECT_EQ(manager.num_iterations(), 0);
  EXPECT_EQ(manager.root()->stats().N, 0);
  EXPECT_EQ(manager.root()->num_children(), 0);
  EXPECT_EQ(manager.root()->num_untried_actions(), 2);
  EXPECT_THROW(manager.best_action(), mcts::EmptyTree);
  EXPECT_EQ(manager.search_results().best_index, -1);
  validate_tree(manager.root());
}

TEST_F(ManagerTest, failed_iteration_keeps_completed_ones) {
  Corridor corridor;
  corridor.corridor = 1;
  params_.max_rollout_depth = 10;
  mcts::Manager<Corridor> manager(corridor, initial_state(corridor), params_, prng_);

  EXPECT_THROW(manager.run(SearchParams::make_iteration_params(5)), mcts::RolloutNonTermination);
  EXPECT_EQ(manager.num_iterations(), 1);
  EXPECT_EQ(manager.root()->stats().N, 1);
  ASSERT_EQ(manager.root()->num_children(), 1);
  EXPECT_EQ(manager.root()->untried_actions(), (std::vector<int>{1}));
  EXPECT_EQ(manager.best_action(), 0);
  validate_tree(manager.root());
}

TEST_F(ManagerTest, expansion_follows_rollout_policy) {
  Bandit bandit({0, 0, 0, 0});
  params_.random_expansion = true;
  auto policy = mcts::make_weighted_rollout_policy<Bandit>(
    [](const Bandit::State&, const int& action) { return action == 3 ? 1.0 : 0.0; });

  for (int seed = 1; seed <= 10; ++seed) {
    std::mt19937 prng(seed);
    mcts::Manager<Bandit> manager(bandit, bandit.initial_state(), params_, prng, policy);
    manager.run(SearchParams::make_iteration_params(1));
    EXPECT_EQ(manager.root()->child_action(0), 3);
  }
}

TEST_F(ManagerTest, search_results) {
  Bandit bandit({0.1, 0.9, 0.5});
  mcts::Manager<Bandit> manager(bandit, bandit.initial_state(), params_, prng_);
  manager.run(SearchParams::make_iteration_params(50));

  auto results = manager.search_results();
  EXPECT_EQ(results.num_iterations, 50);
  EXPECT_EQ(results.root_N, 50);
  EXPECT_EQ(results.tree_size, 4);
  ASSERT_EQ(results.children.size(), 3u);
  EXPECT_EQ(results.children[results.best_index].action, manager.best_action());

  int sum = 0;
  for (const auto& c : results.children) {
    sum += c.N;
  }
  EXPECT_EQ(sum, 50);
  EXPECT_NEAR(results.children[1].Q, 0.9, 1e-9);

  std::ostringstream ss;
  ss << results;
  EXPECT_NE(ss.str().find("iterations=50"), std::string::npos);
  EXPECT_NE(ss.str().find("*"), std::string::npos);
}

TEST_F(ManagerTest, weighted_rollouts) {
  // Rollouts that always pick 1 score the 1-branch higher from its first visit on.
  Chain chain;
  auto policy = mcts::make_weighted_rollout_policy<Chain>(
    [](const Chain::State&, const int& action) { return action == 1 ? 1.0 : 0.0; });
  mcts::Manager<Chain> manager(chain, initial_state(chain), params_, prng_, policy);
  manager.run(SearchParams::make_iteration_params(100));
  EXPECT_EQ(manager.best_action(), 1);
}

TEST(SequentialPlanner, chain) {
  using Planner = mcts::SequentialPlanner<Chain>;

  Chain chain;
  chain.length = 3;
  std::mt19937 prng(5);
  Planner::Result result =
    Planner::plan(chain, Chain::State{}, mcts::ManagerParams(),
                  mcts::SearchParams::make_iteration_params(200), prng);

  EXPECT_EQ(result.actions, (std::vector<int>{1, 1, 1}));
  ASSERT_EQ(result.decisions.size(), 3u);
  EXPECT_EQ(result.decisions[0].root_N, 200);
  EXPECT_EQ(result.final_state.depth, 3);
  EXPECT_EQ(result.final_state.ones, 3);
  EXPECT_DOUBLE_EQ(result.reward, 1.0);
}

TEST(SequentialPlanner, terminal_initial_state) {
  using Planner = mcts::SequentialPlanner<Chain>;

  Chain chain;
  std::mt19937 prng(5);
  Planner::Result result =
    Planner::plan(chain, Chain::State{chain.length, 1}, mcts::ManagerParams(),
                  mcts::SearchParams::make_iteration_params(10), prng);

  EXPECT_TRUE(result.actions.empty());
  EXPECT_TRUE(result.decisions.empty());
  EXPECT_DOUBLE_EQ(result.reward, 1.0 / chain.length);
}

TEST(SequentialPlanner, invalid_configuration) {
  using Planner = mcts::SequentialPlanner<Chain>;

  Chain chain;
  std::mt19937 prng(5);
  EXPECT_THROW(Planner::plan(chain, Chain::State{}, mcts::ManagerParams(),
                             mcts::SearchParams::make_iteration_params(0), prng),
               mcts::InvalidConfiguration);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }

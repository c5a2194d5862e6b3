#include "selection/Problem.hpp"

#include "mcts/Exceptions.hpp"
#include "util/BoostUtil.hpp"

#include <format>
#include <stdexcept>
#include <utility>

namespace selection {

inline std::ostream& operator<<(std::ostream& os, const State& state) {
  os << "selected=[";
  for (int i = 0; i < state.num_selected(); ++i) {
    if (i) os << ", ";
    os << state.selected[i];
  }
  os << "] pool=" << state.pool.count() << " budget=" << state.budget;
  return os;
}

inline Problem::Problem(int pool_size, int budget, objective_t objective)
    : pool_size_(pool_size), budget_(budget), objective_(std::move(objective)) {
  if (pool_size_ < 0) {
    throw mcts::InvalidConfiguration("Invalid pool size: {}", pool_size_);
  }
  if (budget_ < 0) {
    throw mcts::InvalidConfiguration("Invalid budget: {}", budget_);
  }
  if (!objective_) {
    throw mcts::InvalidConfiguration("Empty objective");
  }
}

inline State Problem::initial_state() const {
  State state;
  state.pool.resize(pool_size_);
  state.pool.set();
  state.budget = budget_;
  return state;
}

inline std::vector<Problem::Action> Problem::legal_actions(const State& state) const {
  if (is_terminal(state)) return {};
  return boost_util::get_set_indices(state.pool);
}

inline State Problem::apply(const State& state, Action action, std::mt19937&) const {
  if (is_terminal(state)) {
    throw std::invalid_argument(
      std::format("Cannot select candidate {}: state is terminal", action));
  }
  if (action < 0 || action >= (int)state.pool.size() || !state.pool.test(action)) {
    throw std::invalid_argument(std::format("Candidate {} is not in the pool", action));
  }

  State next = state;
  next.selected.push_back(action);
  next.pool.reset(action);
  next.budget--;
  return next;
}

inline double Problem::reward(const State& state) const {
  if (!is_terminal(state)) {
    throw std::invalid_argument(
      std::format("reward() of a non-terminal state ({} selected, budget {})",
                  state.num_selected(), state.budget));
  }
  return objective_(state.selected);
}

inline mcts::RolloutPolicy<Problem> make_prior_rollout_policy(const Problem& problem,
                                                              std::vector<double> prior) {
  if ((int)prior.size() != problem.pool_size()) {
    throw mcts::InvalidConfiguration("Prior size {} does not match pool size {}", prior.size(),
                                     problem.pool_size());
  }
  for (double p : prior) {
    if (!(p >= 0)) {
      throw mcts::InvalidConfiguration("Invalid prior weight: {}", p);
    }
  }

  return mcts::make_weighted_rollout_policy<Problem>(
    [prior = std::move(prior)](const State&, const Problem::Action& action) {
      return prior[action];
    });
}

template <typename T>
std::vector<T> get_selected(const State& state, const std::vector<T>& items) {
  std::vector<T> out;
  out.reserve(state.selected.size());
  for (int i : state.selected) {
    out.push_back(items.at(i));
  }
  return out;
}

}  // namespace selection

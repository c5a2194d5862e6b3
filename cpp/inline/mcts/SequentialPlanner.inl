#include "mcts/SequentialPlanner.hpp"

#include "util/LoggingUtil.hpp"

#include <utility>

namespace mcts {

template <concepts::Problem Problem>
typename SequentialPlanner<Problem>::Result SequentialPlanner<Problem>::plan(
  const Problem& problem, const State& initial_state, const ManagerParams& manager_params,
  const SearchParams& search_params, std::mt19937& prng, RolloutPolicy rollout_policy) {
  manager_params.validate();
  search_params.validate();

  std::vector<Action> actions;
  std::vector<SearchResults> decisions;
  State state = initial_state;

  while (!problem.is_terminal(state)) {
    Manager manager(problem, state, manager_params, prng, rollout_policy);
    manager.run(search_params);

    Action action = manager.best_action();
    decisions.push_back(manager.search_results());
    actions.push_back(action);
    LOG_DEBUG("Decision {}: committed after {} iterations", actions.size(),
              manager.num_iterations());

    state = problem.apply(state, action, prng);
  }

  double reward = problem.reward(state);
  return Result{std::move(actions), std::move(decisions), std::move(state), reward};
}

}  // namespace mcts

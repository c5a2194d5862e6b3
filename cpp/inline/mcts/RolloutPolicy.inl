#include "mcts/RolloutPolicy.hpp"

#include "util/Asserts.hpp"
#include "util/Random.hpp"

#include <utility>

namespace mcts {

template <concepts::Problem Problem>
RolloutPolicy<Problem> make_uniform_rollout_policy() {
  using State = Problem::State;
  using Action = Problem::Action;

  return [](const State&, const std::vector<Action>& actions, std::mt19937& prng) -> int {
    return util::Random::uniform_sample(prng, 0, (int)actions.size());
  };
}

template <concepts::Problem Problem>
RolloutPolicy<Problem> make_weighted_rollout_policy(
  std::function<double(const typename Problem::State&, const typename Problem::Action&)>
    weight_func) {
  using State = Problem::State;
  using Action = Problem::Action;

  return [weight_func = std::move(weight_func)](const State& state,
                                                const std::vector<Action>& actions,
                                                std::mt19937& prng) -> int {
    std::vector<double> weights;
    weights.reserve(actions.size());
    double total = 0;
    for (const Action& action : actions) {
      double w = weight_func(state, action);
      RELEASE_ASSERT(w >= 0, "negative rollout weight {}", w);
      weights.push_back(w);
      total += w;
    }
    if (total <= 0) {
      return util::Random::uniform_sample(prng, 0, (int)actions.size());
    }
    return util::Random::weighted_sample(prng, weights.begin(), weights.end());
  };
}

}  // namespace mcts

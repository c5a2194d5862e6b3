#include "mcts/ManagerParams.hpp"

#include "mcts/Exceptions.hpp"
#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

#include <cmath>

namespace mcts {

inline auto ManagerParams::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Manager options");

  return desc
    .template add_option<"exploration-constant", 'c'>(
      po2::default_value("{:.3f}", &exploration_constant), "UCT exploration constant")
    .template add_hidden_option<"max-rollout-depth">(
      po::value<int>(&max_rollout_depth)->default_value(max_rollout_depth),
      "max number of transitions in a single rollout")
    .template add_flag<"random-expansion", "first-expansion">(
      &random_expansion, "expand a uniformly random untried action",
      "expand the first untried action");
}

inline void ManagerParams::validate() const {
  if (!std::isfinite(exploration_constant) || exploration_constant < 0) {
    throw InvalidConfiguration("Invalid exploration constant: {}", exploration_constant);
  }
  if (max_rollout_depth <= 0) {
    throw InvalidConfiguration("Invalid max rollout depth: {}", max_rollout_depth);
  }
}

}  // namespace mcts

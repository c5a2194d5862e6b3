#include "mcts/ManagerParams.hpp"
#include "mcts/RolloutPolicy.hpp"
#include "mcts/SearchParams.hpp"
#include "mcts/SequentialPlanner.hpp"
#include "selection/Objectives.hpp"
#include "selection/Problem.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exceptions.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <format>
#include <iostream>
#include <string>
#include <vector>

/*
 * Picks up to --budget candidates out of --values, one MCTS decision at a time.
 *
 * Example:
 *
 * select_items --values 5 3 8 4 --budget 2 --iterations 500 --seed 1
 *
 * With --costs, the objective becomes sum(values) - penalty * max(0, sum(costs) - capacity).
 */
struct Args {
  std::vector<double> values;
  std::vector<double> costs;
  std::vector<double> prior;
  int budget = 1;
  double capacity = 0;
  double penalty = 1;
  bool show_search_results = false;

  auto make_options_description();
};

auto Args::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Program options");

  return desc
    .add_option<"values", 'v'>(po::value<std::vector<double>>(&values)->multitoken(),
                                        "candidate values (required)")
    .add_option<"budget", 'k'>(po::value<int>(&budget)->default_value(budget),
                                        "max number of candidates to select")
    .add_option<"costs">(po::value<std::vector<double>>(&costs)->multitoken(),
                                  "candidate costs. If given, enables the capacity penalty")
    .add_option<"capacity">(po2::default_value("{:.2f}", &capacity),
                                     "total cost allowed before the penalty kicks in")
    .add_option<"penalty">(po2::default_value("{:.2f}", &penalty),
                                    "penalty per unit of cost above capacity")
    .add_hidden_option<"prior">(po::value<std::vector<double>>(&prior)->multitoken(),
                                         "rollout sampling weight of each candidate")
    .add_flag<"show-search-results", "hide-search-results">(
      &show_search_results, "print the root statistics of every decision",
      "do not print root statistics");
}

template <typename T>
std::string to_string(const std::vector<T>& v) {
  std::string s;
  for (size_t i = 0; i < v.size(); ++i) {
    s += std::format("{}{}", i ? ", " : "", v[i]);
  }
  return "[" + s + "]";
}

int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    Args args;
    util::Logging::Params log_params;
    util::Random::Params random_params;
    mcts::ManagerParams manager_params;
    mcts::SearchParams search_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.add_option<"help", 'h'>("help (most used options)")
                  .add_option<"help-full">("help (all options)")
                  .add(args.make_options_description())
                  .add(manager_params.make_options_description())
                  .add(search_params.make_options_description())
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    bool help_full = vm.count("help-full");
    bool help = vm.count("help");
    if (help || help_full) {
      po2::Settings::help_full = help_full;
      std::cout << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);
    util::Random::init(random_params);

    if (args.values.empty()) {
      throw util::CleanException("--values is required");
    }
    if (search_params.time_budget_ns > 0) {
      search_params.limit = mcts::SearchParams::kTimeLimit;
    }

    using Planner = mcts::SequentialPlanner<selection::Problem>;

    selection::Problem::objective_t objective =
      args.costs.empty()
        ? selection::objectives::sum_of_values(args.values)
        : selection::objectives::penalized_sum(args.values, args.costs, args.capacity,
                                               args.penalty);
    selection::Problem problem((int)args.values.size(), args.budget, objective);

    Planner::RolloutPolicy rollout_policy =
      args.prior.empty() ? mcts::make_uniform_rollout_policy<selection::Problem>()
                         : selection::make_prior_rollout_policy(problem, args.prior);

    std::mt19937& prng = util::Random::default_prng();
    Planner::Result result = Planner::plan(problem, problem.initial_state(), manager_params,
                                           search_params, prng, rollout_policy);

    if (args.show_search_results) {
      for (size_t i = 0; i < result.decisions.size(); ++i) {
        std::cout << std::format("Decision {}:", i + 1) << std::endl;
        std::cout << result.decisions[i] << std::endl;
      }
    }

    std::vector<double> selected = selection::get_selected(result.final_state, args.values);
    LOG_INFO("Selected candidates: {}", to_string(result.final_state.selected));
    LOG_INFO("Selected values: {}", to_string(selected));
    LOG_INFO("Objective: {}", result.reward);
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}

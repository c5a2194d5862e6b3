#include "mcts/SearchParams.hpp"

#include "mcts/Exceptions.hpp"
#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace mcts {

inline SearchParams SearchParams::make_iteration_params(int num_iterations) {
  SearchParams params;
  params.limit = kIterationLimit;
  params.num_iterations = num_iterations;
  return params;
}

inline SearchParams SearchParams::make_time_params(std::chrono::nanoseconds time_budget) {
  SearchParams params;
  params.limit = kTimeLimit;
  params.num_iterations = 0;
  params.time_budget_ns = time_budget.count();
  return params;
}

// The cmdline layer does not touch the limit field. Programs switch to kTimeLimit themselves when
// --time-budget-ns is positive.
inline auto SearchParams::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Search options");

  return desc
    .template add_option<"iterations", 'i'>(
      po::value<int>(&num_iterations)->default_value(num_iterations),
      "number of MCTS iterations per decision")
    .template add_option<"time-budget-ns">(
      po::value<int64_t>(&time_budget_ns)->default_value(time_budget_ns),
      "wall-clock budget per decision, in nanoseconds. If positive, overrides --iterations");
}

inline void SearchParams::validate() const {
  if (limit == kIterationLimit) {
    if (num_iterations <= 0) {
      throw InvalidConfiguration("Invalid iteration count: {}", num_iterations);
    }
  } else if (limit == kTimeLimit) {
    if (time_budget_ns <= 0) {
      throw InvalidConfiguration("Invalid time budget: {}ns", time_budget_ns);
    }
  } else {
    throw InvalidConfiguration("Unknown search limit: {}", int(limit));
  }
}

}  // namespace mcts

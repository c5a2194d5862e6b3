#pragma once

#include <chrono>
#include <cstdint>

namespace mcts {

/*
 * SearchParams pertain to a single call to mcts::Manager::run(): they specify when the search
 * loop stops. Even given a single Manager instance, different run() calls can have different
 * SearchParams.
 *
 * A search is limited either by a number of iterations or by a wall-clock budget. The wall-clock
 * budget is only checked between iterations, and at least one iteration always runs.
 *
 * By contrast, mcts::ManagerParams pertains to a single Manager instance.
 */
struct SearchParams {
  enum limit_t : int8_t { kIterationLimit, kTimeLimit };

  static SearchParams make_iteration_params(int num_iterations);
  static SearchParams make_time_params(std::chrono::nanoseconds time_budget);

  auto make_options_description();
  bool operator==(const SearchParams& other) const = default;

  // Throws mcts::InvalidConfiguration if the active limit is not positive.
  void validate() const;

  std::chrono::nanoseconds time_budget() const { return std::chrono::nanoseconds(time_budget_ns); }

  limit_t limit = kIterationLimit;
  int num_iterations = 1000;
  int64_t time_budget_ns = 0;
};

}  // namespace mcts

#include "inline/mcts/SearchParams.inl"

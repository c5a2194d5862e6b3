#pragma once

#include "selection/Problem.hpp"

#include <vector>

namespace selection {

namespace objectives {

// Sum of values[i] over the selected candidates i.
Problem::objective_t sum_of_values(std::vector<double> values);

/*
 * Knapsack-style objective with a soft capacity constraint:
 *
 * sum(values[i]) - penalty * max(0, sum(costs[i]) - capacity)
 *
 * Throws mcts::InvalidConfiguration if values and costs differ in size, or if penalty is negative.
 */
Problem::objective_t penalized_sum(std::vector<double> values, std::vector<double> costs,
                                   double capacity, double penalty);

}  // namespace objectives

}  // namespace selection

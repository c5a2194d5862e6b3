#include "selection/Objectives.hpp"

#include "mcts/Exceptions.hpp"

#include <algorithm>
#include <utility>

namespace selection {

namespace objectives {

Problem::objective_t sum_of_values(std::vector<double> values) {
  return [values = std::move(values)](const std::vector<int>& selected) {
    double total = 0;
    for (int i : selected) {
      total += values.at(i);
    }
    return total;
  };
}

Problem::objective_t penalized_sum(std::vector<double> values, std::vector<double> costs,
                                   double capacity, double penalty) {
  if (values.size() != costs.size()) {
    throw mcts::InvalidConfiguration("values/costs size mismatch ({} vs {})", values.size(),
                                     costs.size());
  }
  if (!(penalty >= 0)) {
    throw mcts::InvalidConfiguration("Invalid penalty: {}", penalty);
  }

  return [values = std::move(values), costs = std::move(costs), capacity,
          penalty](const std::vector<int>& selected) {
    double value = 0;
    double cost = 0;
    for (int i : selected) {
      value += values.at(i);
      cost += costs.at(i);
    }
    return value - penalty * std::max(0.0, cost - capacity);
  };
}

}  // namespace objectives

}  // namespace selection

#include "mcts/SearchResults.hpp"

#include <format>
#include <sstream>

namespace mcts {

template <concepts::Problem Problem>
void SearchResults<Problem>::print(std::ostream& os) const {
  os << std::format("iterations={} tree_size={} root_N={} root_Q={:.4f}\n", num_iterations,
                    tree_size, root_N, root_Q);
  os << std::format("{:>3} {:>12} {:>8} {:>10}\n", "", "action", "N", "Q");

  for (int i = 0; i < (int)children.size(); ++i) {
    const ChildStats& c = children[i];
    std::ostringstream ss;
    ss << c.action;
    const char* marker = i == best_index ? "*" : "";
    os << std::format("{:>3} {:>12} {:>8} {:>10.4f}\n", marker, ss.str(), c.N, c.Q);
  }
}

}  // namespace mcts

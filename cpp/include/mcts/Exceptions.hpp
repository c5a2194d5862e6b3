#pragma once

#include "util/Exceptions.hpp"

namespace mcts {

// Invalid search configuration: non-positive iteration count or time budget, bad exploration
// constant, bad rollout depth guard, malformed problem parameters. This is the caller's fault, not
// a bug, so it is a util::CleanException.
class InvalidConfiguration : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

// best_action() was requested before any root child was expanded.
class EmptyTree : public util::Exception {
 public:
  using util::Exception::Exception;
};

// Expansion was attempted on a terminal node, or on a node with no untried actions.
class InvalidExpansion : public util::Exception {
 public:
  using util::Exception::Exception;
};

// A rollout exceeded ManagerParams::max_rollout_depth transitions without reaching a terminal
// state.
class RolloutNonTermination : public util::Exception {
 public:
  using util::Exception::Exception;
};

}  // namespace mcts

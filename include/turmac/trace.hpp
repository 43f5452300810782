#pragma once

#include "turmac/machine.hpp"
#include <vector>

namespace turmac {

// Everything a report needs about one run
struct Trace {
  std::vector<Symbol> input;   // tape before the first step
  std::vector<Move> moves;     // in execution order
  std::vector<Symbol> output;  // tape after the last step
  bool halted = false;
};

// Runs the machine from its current configuration and records the run.
// max_steps bounds the run (<= 0 = no limit).
Trace Record(Machine& machine, long max_steps = 0);

}  // namespace turmac

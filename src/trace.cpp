#include "turmac/trace.hpp"
#include <utility>

namespace turmac {

Trace Record(Machine& machine, long max_steps) {
  Trace trace;
  trace.input = machine.tape().Snapshot();

  RunResult result = machine.Run(max_steps);
  trace.moves = std::move(result.moves);
  trace.halted = result.halted;

  trace.output = machine.tape().Snapshot();
  return trace;
}

}  // namespace turmac

#include "turmac/program.hpp"
#include <stdexcept>
#include <utility>

namespace turmac {

StateIndex::StateIndex(int value) : value_(value) {
  if (value < 0) {
    throw std::invalid_argument("State index must be non-negative: " + std::to_string(value));
  }
}

Program::Program(std::vector<State> states) : states_(std::move(states)) {}

void Program::AddState(const State& state) {
  states_.push_back(state);
}

const Behavior& Program::Lookup(StateIndex state, Symbol scanned) const {
  return Lookup(state.value(), scanned);
}

const Behavior& Program::Lookup(int state, Symbol scanned) const {
  if (state < 1) {
    throw std::out_of_range("State " + std::to_string(state) +
                            " is out of range: program is 1-based");
  }
  if (state > size()) {
    throw std::out_of_range("State " + std::to_string(state) +
                            " is out of range: program has " +
                            std::to_string(size()) + " states");
  }
  return states_[state - 1][scanned];
}

bool Program::Validate(std::string* error) const {
  if (states_.empty()) {
    if (error) *error = "Program has no states";
    return false;
  }

  for (int i = 0; i < size(); ++i) {
    const State& state = states_[i];
    for (const Behavior* b : {&state.on_blank, &state.on_mark}) {
      if (b->next.value() > size()) {
        if (error) {
          *error = "State " + std::to_string(i + 1) + " transitions to unknown state " +
                   std::to_string(b->next.value());
        }
        return false;
      }
    }
  }

  return true;
}

}  // namespace turmac

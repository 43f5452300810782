#include "turmac/machine.hpp"
#include <utility>

namespace turmac {

Move::Move(std::vector<Symbol> symbols, int from_square, int to_square,
           int from_state, int to_state)
    : symbols_(std::move(symbols)),
      from_square_(from_square),
      to_square_(to_square),
      from_state_(from_state),
      to_state_(to_state) {}

Machine::Machine(Tape tape, Program program)
    : tape_(std::move(tape)),
      program_(std::move(program)),
      head_(0),
      state_(StateIndex::Start()),
      steps_(0) {}

std::optional<Move> Machine::Step() {
  if (Halted()) return std::nullopt;

  const int from_square = head_;
  const StateIndex from_state = state_;

  // Scan
  Symbol scanned = tape_.Read(head_);
  const Behavior behavior = program_.Lookup(state_, scanned);

  // Stamp, even when the symbol does not change
  tape_.Write(head_, behavior.write);

  MoveHead(behavior.dir);
  state_ = behavior.next;
  ++steps_;

  return Move(tape_.Snapshot(), from_square, head_, from_state.value(), state_.value());
}

void Machine::MoveHead(Dir dir) {
  switch (dir) {
    case Dir::L:
      if (head_ == 0) {
        // The tape shifts under the head; position 0 is the new blank cell
        tape_.ExtendLeft();
      } else {
        --head_;
      }
      break;
    case Dir::R:
      if (head_ == tape_.size() - 1) {
        tape_.ExtendRight();
      }
      ++head_;
      break;
  }
}

std::vector<Move> Machine::RunToHalt() {
  std::vector<Move> moves;
  while (auto move = Step()) {
    moves.push_back(std::move(*move));
  }
  return moves;
}

RunResult Machine::Run(long max_steps) {
  RunResult result;
  result.halted = false;
  result.hit_limit = false;
  result.steps = 0;

  const bool bounded = max_steps > 0;
  while (!Halted()) {
    if (bounded && result.steps >= max_steps) {
      result.hit_limit = true;
      break;
    }
    auto move = Step();
    if (!move) break;
    result.moves.push_back(std::move(*move));
    ++result.steps;
  }

  result.halted = Halted();
  return result;
}

void Machine::Rewind() {
  head_ = 0;
  state_ = StateIndex::Start();
  steps_ = 0;
}

void Machine::LoadTape(Tape tape) {
  tape_ = std::move(tape);
}

bool Machine::Halted() const {
  return state_.IsHalt();
}

long Machine::Steps() const {
  return steps_;
}

}  // namespace turmac

#pragma once

#include "turmac/program.hpp"
#include "turmac/tape.hpp"
#include <optional>
#include <vector>

namespace turmac {

// Record of one completed step. The snapshot is taken after the step.
class Move {
public:
  Move(std::vector<Symbol> symbols, int from_square, int to_square,
       int from_state, int to_state);

  const std::vector<Symbol>& symbols() const { return symbols_; }
  int from_square() const { return from_square_; }
  int to_square() const { return to_square_; }
  int from_state() const { return from_state_; }
  int to_state() const { return to_state_; }

private:
  std::vector<Symbol> symbols_;
  int from_square_;
  int to_square_;
  int from_state_;
  int to_state_;
};

// Result of a bounded run
struct RunResult {
  bool halted;
  bool hit_limit;
  long steps;
  std::vector<Move> moves;
};

// Single-tape binary Turing machine
class Machine {
public:
  Machine(Tape tape, Program program);

  // Scan, stamp, move, transition. Returns nothing once halted.
  std::optional<Move> Step();

  // Steps until halted. Does not return for a machine that never halts.
  std::vector<Move> RunToHalt();

  // Steps until halted or until max_steps steps were taken. Any max_steps
  // <= 0 means no limit.
  RunResult Run(long max_steps);

  // Head back to 0 and state back to 1. The tape is left as is.
  void Rewind();

  // Replaces the tape. Pair with Rewind() for an independent run.
  void LoadTape(Tape tape);

  bool Halted() const;
  long Steps() const;
  int head() const { return head_; }
  StateIndex state() const { return state_; }
  const Tape& tape() const { return tape_; }
  const Program& program() const { return program_; }

private:
  void MoveHead(Dir dir);

  Tape tape_;
  Program program_;
  int head_;
  StateIndex state_;
  long steps_;
};

}  // namespace turmac

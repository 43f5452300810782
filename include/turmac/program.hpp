#pragma once

#include <string>
#include <vector>

namespace turmac {

//=============================================================================
// Symbols and directions
//=============================================================================

enum class Dir { L, R };

// A tape cell holds one of two symbols: blank ('o') or marked ('x').
using Symbol = bool;
constexpr Symbol kBlank = false;
constexpr Symbol kMark = true;

//=============================================================================
// State indices
//=============================================================================

// Index into a Program. Real states are 1-based; 0 is reserved for halt.
class StateIndex {
public:
  static StateIndex Halt() { return StateIndex(); }
  static StateIndex Start() { return StateIndex(1); }

  StateIndex() : value_(0) {}
  explicit StateIndex(int value);  // throws std::invalid_argument if negative

  bool IsHalt() const { return value_ == 0; }
  int value() const { return value_; }

  bool operator==(const StateIndex& other) const { return value_ == other.value_; }
  bool operator!=(const StateIndex& other) const { return value_ != other.value_; }

private:
  int value_;
};

//=============================================================================
// Program
//=============================================================================

// What the machine does after scanning a symbol: stamp, move, go to state.
struct Behavior {
  Symbol write;
  Dir dir;
  StateIndex next;

  bool operator==(const Behavior& other) const {
    return write == other.write && dir == other.dir && next == other.next;
  }
};

// A pair of behaviors keyed by the scanned symbol.
struct State {
  Behavior on_blank;
  Behavior on_mark;

  const Behavior& operator[](Symbol scanned) const {
    return scanned ? on_mark : on_blank;
  }

  bool operator==(const State& other) const {
    return on_blank == other.on_blank && on_mark == other.on_mark;
  }
};

// Transition table with 1-based state lookup.
class Program {
public:
  Program() = default;
  explicit Program(std::vector<State> states);

  void AddState(const State& state);

  // Behavior for (state, scanned). Throws std::out_of_range when the state
  // is 0 or past the end of the table.
  const Behavior& Lookup(StateIndex state, Symbol scanned) const;
  const Behavior& Lookup(int state, Symbol scanned) const;

  // Checks that every transition targets halt or an existing state.
  // The machine never calls this; bad targets otherwise surface at lookup.
  bool Validate(std::string* error = nullptr) const;

  int size() const { return static_cast<int>(states_.size()); }
  bool empty() const { return states_.empty(); }
  const std::vector<State>& states() const { return states_; }

private:
  std::vector<State> states_;
};

}  // namespace turmac

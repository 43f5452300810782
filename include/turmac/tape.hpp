#pragma once

#include "turmac/program.hpp"
#include <deque>
#include <vector>

namespace turmac {

// The visible window of an infinite two-way tape. Never empty.
//
// Growing on the left inserts a blank at position 0, so every position held
// by a caller before ExtendLeft() must be shifted by +1. Growing on the right
// leaves existing positions untouched.
class Tape {
public:
  Tape();
  explicit Tape(const std::vector<Symbol>& symbols);  // empty -> one blank cell

  // Both throw std::out_of_range outside [0, size()).
  Symbol Read(int position) const;
  void Write(int position, Symbol symbol);

  void ExtendLeft();
  void ExtendRight();

  int size() const { return static_cast<int>(cells_.size()); }
  std::vector<Symbol> Snapshot() const;

private:
  void CheckRange(int position) const;

  std::deque<Symbol> cells_;
};

}  // namespace turmac

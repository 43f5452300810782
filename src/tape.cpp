#include "turmac/tape.hpp"
#include <stdexcept>
#include <string>

namespace turmac {

Tape::Tape() : cells_(1, kBlank) {}

Tape::Tape(const std::vector<Symbol>& symbols) : cells_(symbols.begin(), symbols.end()) {
  if (cells_.empty()) {
    cells_.push_back(kBlank);
  }
}

Symbol Tape::Read(int position) const {
  CheckRange(position);
  return cells_[position];
}

void Tape::Write(int position, Symbol symbol) {
  CheckRange(position);
  cells_[position] = symbol;
}

void Tape::ExtendLeft() {
  cells_.push_front(kBlank);
}

void Tape::ExtendRight() {
  cells_.push_back(kBlank);
}

std::vector<Symbol> Tape::Snapshot() const {
  return std::vector<Symbol>(cells_.begin(), cells_.end());
}

void Tape::CheckRange(int position) const {
  if (position < 0 || position >= size()) {
    throw std::out_of_range("Tape position " + std::to_string(position) +
                            " is out of range [0, " + std::to_string(size()) + ")");
  }
}

}  // namespace turmac

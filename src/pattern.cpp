#include "turmac/pattern.hpp"
#include <cctype>
#include <stdexcept>

namespace turmac {

namespace {

std::string Trim(const std::string& s) {
  size_t begin = 0, end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

// Splits a program source into state patterns, keeping the line each came from
class SourceReader {
public:
  struct Entry {
    std::string text;
    int line;
  };

  explicit SourceReader(const std::string& src) : src_(src), pos_(0), line_(1) {}

  std::vector<Entry> ReadAll() {
    std::vector<Entry> entries;
    std::string current;
    int current_line = line_;
    while (pos_ < src_.size()) {
      char ch = src_[pos_];
      if (ch == '#') {
        while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
        continue;
      }
      if (ch == '\n' || ch == ';') {
        Flush(current, current_line, entries);
        if (ch == '\n') ++line_;
        current_line = line_;
        ++pos_;
        continue;
      }
      current += ch;
      ++pos_;
    }
    Flush(current, current_line, entries);
    return entries;
  }

private:
  void Flush(std::string& current, int line, std::vector<Entry>& entries) {
    std::string text = Trim(current);
    current.clear();
    if (!text.empty()) entries.push_back({text, line});
  }

  const std::string& src_;
  size_t pos_;
  int line_;
};

std::string RemoveSpaces(const std::string& s) {
  std::string out;
  for (char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c))) out += c;
  }
  return out;
}

}  // namespace

Symbol ParseSymbol(char c) {
  if (c == 'o') return kBlank;
  if (c == 'x') return kMark;
  throw std::runtime_error("Symbol should be either 'o' or 'x', got '" + std::string(1, c) + "'");
}

std::vector<Symbol> ParseSymbols(const std::string& pattern) {
  std::vector<Symbol> symbols;
  symbols.reserve(pattern.size());
  for (char c : pattern) {
    symbols.push_back(ParseSymbol(c));
  }
  return symbols;
}

Tape ParseTape(const std::string& pattern) {
  return Tape(ParseSymbols(pattern));
}

Behavior ParseBehavior(const std::string& pattern) {
  if (pattern.size() < 3) {
    throw std::runtime_error("Behavior too short: '" + pattern + "'");
  }

  char c1 = pattern[0];
  char c2 = pattern[1];
  std::string rest = pattern.substr(2);

  if (c1 != 'o' && c1 != 'x') {
    throw std::runtime_error("First character should be either 'o' or 'x' in '" + pattern + "'");
  }
  if (c2 != 'L' && c2 != 'R') {
    throw std::runtime_error("Second character should be either 'L' or 'R' in '" + pattern + "'");
  }
  for (char c : rest) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw std::runtime_error("Next state should be a non-negative number in '" + pattern + "'");
    }
  }

  int next = 0;
  try {
    next = std::stoi(rest);
  } catch (const std::out_of_range&) {
    throw std::runtime_error("Next state too large in '" + pattern + "'");
  }

  return {ParseSymbol(c1), c2 == 'R' ? Dir::R : Dir::L, StateIndex(next)};
}

State ParseState(const std::string& pattern) {
  std::string compact = RemoveSpaces(pattern);
  size_t comma = compact.find(',');
  if (comma == std::string::npos || compact.find(',', comma + 1) != std::string::npos) {
    throw std::runtime_error("State should be two behaviors separated by ',': '" + pattern + "'");
  }
  return {ParseBehavior(compact.substr(0, comma)), ParseBehavior(compact.substr(comma + 1))};
}

Program ParseProgram(const std::vector<std::string>& patterns) {
  Program program;
  for (const auto& pattern : patterns) {
    program.AddState(ParseState(pattern));
  }
  return program;
}

Program ParseProgramSource(const std::string& source) {
  SourceReader reader(source);
  Program program;
  for (const auto& entry : reader.ReadAll()) {
    try {
      program.AddState(ParseState(entry.text));
    } catch (const std::runtime_error& e) {
      throw std::runtime_error(std::string(e.what()) + " at line " + std::to_string(entry.line));
    }
  }
  return program;
}

char FormatSymbol(Symbol s) {
  return s ? 'x' : 'o';
}

std::string FormatSymbols(const std::vector<Symbol>& symbols) {
  std::string out;
  out.reserve(symbols.size());
  for (Symbol s : symbols) {
    out += FormatSymbol(s);
  }
  return out;
}

std::string FormatBehavior(const Behavior& behavior) {
  std::string out;
  out += FormatSymbol(behavior.write);
  out += (behavior.dir == Dir::R) ? 'R' : 'L';
  out += std::to_string(behavior.next.value());
  return out;
}

std::string FormatState(const State& state) {
  return FormatBehavior(state.on_blank) + "," + FormatBehavior(state.on_mark);
}

std::vector<std::string> FormatProgram(const Program& program) {
  std::vector<std::string> patterns;
  for (const auto& state : program.states()) {
    patterns.push_back(FormatState(state));
  }
  return patterns;
}

}  // namespace turmac

#pragma once

#include "turmac/program.hpp"
#include "turmac/tape.hpp"
#include <string>
#include <vector>

namespace turmac {

// Pattern notation:
//   symbol    'o' (blank) or 'x' (marked)
//   behavior  <symbol><L|R><next state>, e.g. xR2
//   state     <behavior on blank>,<behavior on mark>, e.g. oR0,oR2
//   program   list of states; list position i is state i+1
//
// All parse functions throw std::runtime_error on malformed input.

Symbol ParseSymbol(char c);
std::vector<Symbol> ParseSymbols(const std::string& pattern);
Tape ParseTape(const std::string& pattern);
Behavior ParseBehavior(const std::string& pattern);
State ParseState(const std::string& pattern);
Program ParseProgram(const std::vector<std::string>& patterns);

// Parse a program file: states separated by newlines or ';', '#' comments.
Program ParseProgramSource(const std::string& source);

char FormatSymbol(Symbol s);
std::string FormatSymbols(const std::vector<Symbol>& symbols);
std::string FormatBehavior(const Behavior& behavior);
std::string FormatState(const State& state);
std::vector<std::string> FormatProgram(const Program& program);

}  // namespace turmac

#pragma once

#include "turmac/trace.hpp"
#include <functional>
#include <string>
#include <vector>

namespace turmac {

// Produces the header shown next to the input row (is_input) or output row
using HeaderFn = std::function<std::string(const std::vector<Symbol>& symbols, bool is_input)>;

// "Input" / "Output"
std::string DefaultHeader(const std::vector<Symbol>& symbols, bool is_input);

// Unary numbers on the tape: each run of n marked cells encodes n - 1.
std::vector<int> DecodeUnary(const std::vector<Symbol>& symbols);

// DecodeUnary joined with spaces, e.g. "1 1"
std::string UnaryHeader(const std::vector<Symbol>& symbols, bool is_input);

// One table row such as │x│o│x│. The cell at pointer is bracketed
// (├x┤ or >x|); pass -1 for no pointer.
std::string RenderRow(const std::vector<Symbol>& symbols, int pointer, bool fancy = true);

// Table of the whole run: input row, one row per move, output row.
std::string RenderTrace(const Trace& trace, const HeaderFn& header = DefaultHeader,
                        bool fancy = true);

// Machine-readable report of a run
std::string TraceToYAML(const Trace& trace);

}  // namespace turmac

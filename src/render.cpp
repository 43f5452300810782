#include "turmac/render.hpp"
#include "turmac/pattern.hpp"
#include <algorithm>
#include <sstream>

namespace turmac {

namespace {

struct Glyphs {
  const char* sep;
  const char* pointer_left;
  const char* pointer_right;
};

const Glyphs kFancy = {"│", "├", "┤"};
const Glyphs kAscii = {"|", ">", "|"};

// Horizontal rule matching a row of `cells` cells, e.g. ┌─┬─┐
std::string RenderRule(size_t cells, const char* left, const char* mid, const char* right) {
  std::string out = left;
  for (size_t i = 0; i < cells; ++i) {
    if (i > 0) out += mid;
    out += "─";
  }
  out += right;
  return out;
}

// Cell written during a move. A left move off position 0 shifts the tape,
// so the stamped cell ends up at position 1 of the snapshot. The pointer
// goes on that written cell, not on the new blank cell at position 0.
int StampedCell(const Move& move) {
  if (move.from_square() == 0 && move.to_square() == 0) return 1;
  return move.from_square();
}

}  // namespace

std::string DefaultHeader(const std::vector<Symbol>&, bool is_input) {
  return is_input ? "Input" : "Output";
}

std::vector<int> DecodeUnary(const std::vector<Symbol>& symbols) {
  std::vector<int> numbers;
  int run = 0;
  for (Symbol s : symbols) {
    if (s == kMark) {
      ++run;
    } else if (run > 0) {
      numbers.push_back(run - 1);
      run = 0;
    }
  }
  if (run > 0) numbers.push_back(run - 1);
  return numbers;
}

std::string UnaryHeader(const std::vector<Symbol>& symbols, bool) {
  std::ostringstream out;
  bool first = true;
  for (int n : DecodeUnary(symbols)) {
    if (!first) out << " ";
    out << n;
    first = false;
  }
  return out.str();
}

std::string RenderRow(const std::vector<Symbol>& symbols, int pointer, bool fancy) {
  const Glyphs& g = fancy ? kFancy : kAscii;
  const int n = static_cast<int>(symbols.size());

  std::string out;
  for (int i = 0; i < n; ++i) {
    if (i == pointer) {
      out += g.pointer_left;
    } else if (pointer >= 0 && i - 1 == pointer) {
      out += g.pointer_right;
    } else {
      out += g.sep;
    }
    out += FormatSymbol(symbols[i]);
  }
  out += (n - 1 == pointer) ? g.pointer_right : g.sep;
  return out;
}

std::string RenderTrace(const Trace& trace, const HeaderFn& header, bool fancy) {
  std::vector<std::string> headers;
  std::vector<std::string> rows;

  headers.push_back(header(trace.input, true));
  rows.push_back(RenderRow(trace.input, -1, fancy));
  for (const auto& move : trace.moves) {
    headers.push_back("State " + std::to_string(move.from_state()));
    rows.push_back(RenderRow(move.symbols(), StampedCell(move), fancy));
  }
  headers.push_back(header(trace.output, false));
  rows.push_back(RenderRow(trace.output, -1, fancy));

  size_t header_size = 0;
  for (const auto& h : headers) header_size = std::max(header_size, h.size());
  header_size += 1;
  const std::string indent(header_size, ' ');

  std::vector<std::string> lines;
  for (size_t i = 0; i < headers.size(); ++i) {
    std::string h = headers[i];
    h.resize(header_size, ' ');
    lines.push_back(h + rows[i]);
  }

  if (fancy) {
    const size_t in_cells = trace.input.size();
    const size_t out_cells = trace.output.size();
    lines.insert(lines.begin(), indent + RenderRule(in_cells, "┌", "┬", "┐"));
    lines.insert(lines.begin() + 2, indent + RenderRule(in_cells, "├", "┼", "┤"));
    lines.insert(lines.end() - 1, indent + RenderRule(out_cells, "├", "┼", "┤"));
    lines.push_back(indent + RenderRule(out_cells, "└", "┴", "┘"));
  }

  std::ostringstream out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) out << "\n";
    out << lines[i];
  }
  return out.str();
}

std::string TraceToYAML(const Trace& trace) {
  std::ostringstream out;

  out << "input: " << FormatSymbols(trace.input) << "\n";
  out << "output: " << FormatSymbols(trace.output) << "\n";
  out << "halted: " << (trace.halted ? "true" : "false") << "\n";
  out << "steps: " << trace.moves.size() << "\n";

  if (trace.moves.empty()) {
    out << "moves: []\n";
    return out.str();
  }

  out << "moves:\n";
  for (const auto& move : trace.moves) {
    out << "  - {tape: " << FormatSymbols(move.symbols())
        << ", from_square: " << move.from_square()
        << ", to_square: " << move.to_square()
        << ", from_state: " << move.from_state()
        << ", to_state: " << move.to_state() << "}\n";
  }

  return out.str();
}

}  // namespace turmac

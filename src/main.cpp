#include "turmac/machine.hpp"
#include "turmac/pattern.hpp"
#include "turmac/program.hpp"
#include "turmac/render.hpp"
#include "turmac/trace.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

void PrintUsage(const char* prog) {
  std::cerr << "turmac - binary Turing machine emulator\n\n";
  std::cerr << "Usage: " << prog << " [options] <program.tm>\n";
  std::cerr << "       " << prog << " [options] -p <states>\n";
  std::cerr << "\nOptions:\n";
  std::cerr << "  -p <states>       Program inline, states separated by ';' (e.g. \"oR0,oR2;xL3,xR2\")\n";
  std::cerr << "  -t <tape>         Initial tape, e.g. xxoxx (default: o); may be repeated\n";
  std::cerr << "  -o <file>         Output file (default: stdout)\n";
  std::cerr << "  --max-steps <n>   Stop after n steps, 0 for no limit (default: 1000000)\n";
  std::cerr << "  --ascii           Plain ASCII table\n";
  std::cerr << "  --unary           Decode unary numbers in the input/output headers\n";
  std::cerr << "  --yaml            YAML report instead of a table\n";
  std::cerr << "  -v                Verbose output\n";
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  std::string input_file;
  std::string inline_program;
  std::string output_file;
  std::vector<std::string> tapes;
  long max_steps = 1000000;
  bool verbose = false;
  bool fancy = true;
  bool unary = false;
  bool yaml = false;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "-p" && i + 1 < argc) {
        inline_program = argv[++i];
      } else if (arg == "-t" && i + 1 < argc) {
        tapes.push_back(argv[++i]);
      } else if (arg == "-o" && i + 1 < argc) {
        output_file = argv[++i];
      } else if (arg == "--max-steps" && i + 1 < argc) {
        max_steps = std::stol(argv[++i]);
      } else if (arg == "--ascii") {
        fancy = false;
      } else if (arg == "--unary") {
        unary = true;
      } else if (arg == "--yaml") {
        yaml = true;
      } else if (arg == "-v") {
        verbose = true;
      } else if (arg[0] != '-') {
        input_file = arg;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        PrintUsage(argv[0]);
        return 1;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: Bad option value: " << e.what() << "\n";
    return 1;
  }

  if (input_file.empty() == inline_program.empty()) {
    std::cerr << "Error: Specify exactly one of a program file or -p\n";
    PrintUsage(argv[0]);
    return 1;
  }
  if (max_steps < 0) {
    std::cerr << "Error: --max-steps must not be negative\n";
    return 1;
  }
  if (tapes.empty()) {
    tapes.push_back("o");
  }

  std::string source = inline_program;
  if (!input_file.empty()) {
    std::ifstream ifs(input_file);
    if (!ifs) {
      std::cerr << "Error: Cannot open input file: " << input_file << "\n";
      return 1;
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    source = buffer.str();
  }

  bool all_halted = true;
  std::ostringstream report;

  try {
    if (verbose) std::cerr << "Parsing " << (input_file.empty() ? "inline program" : input_file)
                           << "...\n";
    turmac::Program program = turmac::ParseProgramSource(source);

    // Validate
    std::string error;
    if (!program.Validate(&error)) {
      std::cerr << "Error: Invalid program: " << error << "\n";
      return 1;
    }
    if (verbose) std::cerr << "  States: " << program.size() << "\n";

    turmac::Machine machine(turmac::Tape(), program);
    turmac::HeaderFn header = unary ? turmac::HeaderFn(turmac::UnaryHeader)
                                    : turmac::HeaderFn(turmac::DefaultHeader);

    for (size_t i = 0; i < tapes.size(); ++i) {
      machine.Rewind();
      machine.LoadTape(turmac::ParseTape(tapes[i]));
      if (verbose) std::cerr << "Running on tape \"" << tapes[i] << "\"...\n";

      turmac::Trace trace = turmac::Record(machine, max_steps);

      if (i > 0) report << (yaml ? "---\n" : "\n");
      if (yaml) {
        report << turmac::TraceToYAML(trace);
      } else {
        report << turmac::RenderTrace(trace, header, fancy) << "\n";
      }

      if (verbose) {
        std::cerr << "  Steps: " << trace.moves.size() << "\n";
        std::cerr << "  Final tape: " << turmac::FormatSymbols(trace.output) << "\n";
      }
      if (!trace.halted) {
        std::cerr << "WARNING: Hit step limit (" << max_steps << ") on tape \"" << tapes[i]
                  << "\"\n";
        all_halted = false;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  if (output_file.empty()) {
    std::cout << report.str();
  } else {
    std::ofstream ofs(output_file);
    if (!ofs) {
      std::cerr << "Error: Cannot open output file: " << output_file << "\n";
      return 1;
    }
    ofs << report.str();
    if (verbose) std::cerr << "Wrote " << output_file << "\n";
  }

  return all_halted ? 0 : 2;
}

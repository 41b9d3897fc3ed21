#include "tmi/display.hpp"
#include "tmi/errors.hpp"
#include "tmi/parser.hpp"
#include "tmi/simulator.hpp"
#include "tmi/terminal.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace {

struct Options {
  std::string rules_file;
  std::string input;
  double step_time = 0.25;
  int max_steps = 0;
  bool stepping = false;
  bool loop = false;
  tmi::DisplayOptions display;
};

void PrintUsage(const char* prog) {
  std::cerr << "TMI - Turing Machine Interpreter\n\n";
  std::cerr << "Usage: " << prog << " [options] <rules-file> [input]\n";
  std::cerr << "\nOptions:\n";
  std::cerr << "  --rules            Display the applied rule alongside the state\n";
  std::cerr << "  --step_time <sec>  Delay between steps (default: 0.25)\n";
  std::cerr << "  --fast             No delay between steps (same as --step_time 0)\n";
  std::cerr << "  --silent           Hide intermediate states\n";
  std::cerr << "  --verbose          Show tracking info beside each step\n";
  std::cerr << "  --live             Single, continuously changing state line\n";
  std::cerr << "  --max-steps <n>    Give up after n steps (default: unlimited)\n";
  std::cerr << "  -s                 Stepping mode: press a key for each step ('i' toggles verbose)\n";
  std::cerr << "  -l                 Loop mode: prompt for more input after each run\n";
}

// Manual driving, one keypress per step. Returns false on Ctrl+C.
bool RunStepping(tmi::Simulator& sim, tmi::Display& display) {
  while (!sim.Halted()) {
    char key = tmi::ReadKeypress();
    if (key == 3) return false;
    if (key == 'i') display.Options().verbose = !display.Options().verbose;

    sim.Step();
    display.PrintStep(sim);
  }
  return true;
}

void RunPaced(tmi::Simulator& sim, tmi::Display& display, const Options& opts) {
  while (!sim.Halted()) {
    if (opts.max_steps > 0 && sim.Steps() >= opts.max_steps) {
      throw tmi::StepLimitReached(opts.max_steps);
    }
    sim.Step();
    display.PrintStep(sim);

    if (!sim.Halted() && opts.step_time > 0) {
      std::this_thread::sleep_for(std::chrono::duration<double>(opts.step_time));
    }
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  Options opts;
  int positional = 0;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    try {
      if (arg == "--rules") {
        opts.display.show_rules = true;
      } else if (arg == "--step_time" && i + 1 < argc) {
        opts.step_time = std::stod(argv[++i]);
      } else if (arg == "--fast") {
        opts.step_time = 0;
      } else if (arg == "--silent") {
        opts.display.silent = true;
      } else if (arg == "--verbose") {
        opts.display.verbose = true;
      } else if (arg == "--live") {
        opts.display.live = true;
      } else if (arg == "--max-steps" && i + 1 < argc) {
        opts.max_steps = std::stoi(argv[++i]);
      } else if (arg == "-s") {
        opts.stepping = true;
      } else if (arg == "-l") {
        opts.loop = true;
      } else if (arg.empty() || arg[0] != '-') {
        if (positional == 0) {
          opts.rules_file = arg;
        } else if (positional == 1) {
          opts.input = arg;
        } else {
          std::cerr << "Unexpected argument: " << arg << "\n";
          PrintUsage(argv[0]);
          return 1;
        }
        ++positional;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        PrintUsage(argv[0]);
        return 1;
      }
    } catch (const std::logic_error&) {
      std::cerr << "Invalid value for " << arg << ": " << argv[i] << "\n";
      return 1;
    }
  }

  if (opts.rules_file.empty()) {
    std::cerr << "Error: No rules file specified\n";
    PrintUsage(argv[0]);
    return 1;
  }

  try {
    tmi::RuleFile file = tmi::LoadRuleFile(opts.rules_file);
    tmi::MachineConfig config = tmi::MachineConfig::FromSettings(file.settings);

    if (opts.display.verbose) {
      std::cerr << "Loaded " << file.rules.size() << " rules from " << opts.rules_file << "\n";
      for (const auto& [key, value] : file.settings) {
        std::cerr << "  " << key << ": " << value << "\n";
      }
      std::cerr << "Initial state: " << config.init << ", halting state: " << config.halt << "\n";
    }

    tmi::Simulator sim(std::move(file.rules), config, opts.max_steps);
    tmi::Display display(std::cout, opts.display);

    std::string tape = opts.input;
    do {
      if (tape.empty()) {
        std::cout << "\nInput additional tape.\n";
        if (!std::getline(std::cin, tape)) break;
        std::cout << "\n";
      }

      try {
        sim.AssignTape(tape);
        display.PrintState(sim);

        if (opts.stepping && !opts.display.silent) {
          if (!RunStepping(sim, display)) {
            std::cerr << "\nInterrupted\n";
            return 130;
          }
        } else if (opts.display.silent) {
          sim.Run();
          display.PrintStep(sim);
        } else {
          RunPaced(sim, display, opts);
        }
      } catch (const tmi::Error& e) {
        if (!opts.loop) throw;
        std::cerr << "\nError: " << e.what() << "\n";
      }

      tape.clear();
    } while (opts.loop);

  } catch (const std::exception& e) {
    std::cerr << "\nError: " << e.what() << "\n";
    return 1;
  }

  return 0;
}

#pragma once

#include "tmi/simulator.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace tmi {

struct DisplayOptions {
  bool show_rules = false;  // applied rule beside each state
  bool show_path = true;    // state path in the tracking block
  bool silent = false;      // only the halted state is printed
  bool verbose = false;     // tracking info on every line
  bool live = false;        // rewrite one line with '\r'
};

// Tape with blanks as spaces. With show_head a '|' goes before the head cell,
// otherwise a trailing space takes its place.
std::string FormatTape(const Tape& tape, int head, bool show_head);

// "[1, 1, 0]"
std::string FormatPath(const std::vector<State>& path);

// Writes machine progress lines to a stream
class Display {
public:
  Display(std::ostream& out, DisplayOptions options);

  // "<steps> (<state>): ><tape><" plus the optional rule / tracking parts.
  // silent_override prints even in silent mode.
  void PrintState(const Simulator& sim, bool show_head = false, bool silent_override = false);

  // Line for the step just taken; on halt also the tracking block
  void PrintStep(const Simulator& sim);

  // Steps, head moves and (optionally) path, one per line or space separated
  void PrintTracking(const Simulator& sim, bool newline = true);

  DisplayOptions& Options() { return options_; }

private:
  std::ostream& out_;
  DisplayOptions options_;
  size_t live_max_len_ = 0;
};

}  // namespace tmi

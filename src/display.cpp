#include "tmi/display.hpp"
#include <algorithm>
#include <cstdint>

namespace tmi {

namespace {

std::string Cell(const Symbol& symbol) {
  return symbol == kBlank ? " " : symbol;
}

}  // namespace

std::string FormatTape(const Tape& tape, int head, bool show_head) {
  std::string out;
  if (!show_head) {
    for (int64_t pos = tape.Left(); pos <= tape.Right(); ++pos) {
      out += Cell(tape.Get(static_cast<int>(pos)));
    }
    return out + " ";
  }

  // Widen to the head so the marker always has a place
  int64_t left = std::min(tape.Left(), head);
  int64_t right = std::max(tape.Right(), head);
  for (int64_t pos = left; pos <= right; ++pos) {
    if (pos == head) out += '|';
    out += Cell(tape.Get(static_cast<int>(pos)));
  }
  return out;
}

std::string FormatPath(const std::vector<State>& path) {
  std::string out = "[";
  for (size_t i = 0; i < path.size(); ++i) {
    if (i) out += ", ";
    out += path[i];
  }
  return out + "]";
}

Display::Display(std::ostream& out, DisplayOptions options)
    : out_(out), options_(options) {}

void Display::PrintState(const Simulator& sim, bool show_head, bool silent_override) {
  if (options_.silent && !silent_override) return;

  std::string line = std::to_string(sim.Steps()) + " (" + sim.CurrentState() + "): >" +
                     FormatTape(sim.CurrentTape(), sim.Head(), show_head) + "<";
  if (options_.show_rules) {
    line += " R: " + (sim.LastRule() ? ToString(*sim.LastRule()) : std::string("None"));
  }

  // Pad so a shorter live line fully covers the previous one
  std::string padding;
  if (options_.live) {
    live_max_len_ = std::max(live_max_len_, line.size());
    padding.assign(live_max_len_ - line.size(), ' ');
  }

  out_ << line;
  if (options_.verbose) {
    out_ << ' ';
    PrintTracking(sim, false);
  }
  out_ << padding << (options_.live ? '\r' : '\n');
  out_.flush();
}

void Display::PrintStep(const Simulator& sim) {
  if (!sim.Halted()) {
    PrintState(sim, true);
    return;
  }

  PrintState(sim, false, true);
  out_ << '\n';
  if (options_.live) out_ << '\n';
  PrintTracking(sim);
}

void Display::PrintTracking(const Simulator& sim, bool newline) {
  char end = newline ? '\n' : ' ';
  out_ << "Steps: " << sim.Steps() << end;
  out_ << "Head moves: " << sim.HeadMoves() << end;
  if (options_.show_path) {
    out_ << "State path: " << FormatPath(sim.Path()) << end;
  }
}

}  // namespace tmi

#pragma once

#include "tmi/parser.hpp"
#include "tmi/rules.hpp"
#include "tmi/tape.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tmi {

// Initial and halting labels, fixed for the lifetime of a Simulator
struct MachineConfig {
  State init = kDefaultInit;
  State halt = kDefaultHalt;

  // Defaults overridden by "init" / "halt" entries
  static MachineConfig FromSettings(const Settings& settings);
};

// Single-tape quintuple machine
class Simulator {
public:
  // max_steps bounds Run(); 0 means no bound
  explicit Simulator(RuleTable rules, MachineConfig config = {}, int max_steps = 0);

  // Replace the tape and reset state, head, counters and path
  void AssignTape(const std::string& input);

  // Apply one rule. Throws TapeBlank or RuleNotFound, leaving the machine
  // untouched in either case.
  void Step();

  // Step until halted, return the final tape
  const Tape& Run();

  bool Halted() const { return state_ == config_.halt; }

  const State& CurrentState() const { return state_; }
  int Head() const { return head_; }
  int Steps() const { return steps_; }
  int HeadMoves() const { return head_moves_; }
  const std::vector<State>& Path() const { return path_; }
  const std::optional<Rule>& LastRule() const { return last_rule_; }
  const Tape& CurrentTape() const { return tape_; }

  const RuleTable& Rules() const { return rules_; }
  const MachineConfig& Config() const { return config_; }

private:
  void Reset();

  RuleTable rules_;
  MachineConfig config_;
  int max_steps_;

  Tape tape_;
  State state_;
  int head_;
  int steps_;
  int head_moves_;
  std::vector<State> path_;
  std::optional<Rule> last_rule_;
};

}  // namespace tmi

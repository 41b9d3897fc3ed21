#include "tmi/simulator.hpp"
#include "tmi/errors.hpp"
#include <utility>

namespace tmi {

MachineConfig MachineConfig::FromSettings(const Settings& settings) {
  MachineConfig config;
  auto it = settings.find("init");
  if (it != settings.end()) config.init = it->second;
  it = settings.find("halt");
  if (it != settings.end()) config.halt = it->second;
  return config;
}

Simulator::Simulator(RuleTable rules, MachineConfig config, int max_steps)
    : rules_(std::move(rules)), config_(std::move(config)), max_steps_(max_steps) {
  Reset();
}

void Simulator::AssignTape(const std::string& input) {
  tape_ = Tape(input);
  Reset();
}

void Simulator::Reset() {
  state_ = config_.init;
  head_ = 0;
  steps_ = 0;
  head_moves_ = 0;
  path_.assign(1, config_.init);
  last_rule_.reset();
}

void Simulator::Step() {
  // Both checks happen before anything is written
  if (tape_.IsBlank()) {
    throw TapeBlank();
  }

  Symbol scan = tape_.Get(head_);
  const Rule& rule = rules_.FindRule(state_, scan);

  // Wildcard in write means keep current
  tape_.Set(head_, rule.write == kWildcard ? scan : rule.write);

  state_ = rule.to;
  if (rule.dir < 0) {
    --head_;
  } else if (rule.dir > 0) {
    ++head_;
  }
  if (rule.dir != 0) {
    ++head_moves_;
  }

  path_.push_back(state_);
  ++steps_;
  last_rule_ = rule;
}

const Tape& Simulator::Run() {
  while (!Halted()) {
    if (max_steps_ > 0 && steps_ >= max_steps_) {
      throw StepLimitReached(max_steps_);
    }
    Step();
  }
  return tape_;
}

}  // namespace tmi

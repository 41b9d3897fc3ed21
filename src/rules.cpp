#include "tmi/rules.hpp"
#include "tmi/errors.hpp"

namespace tmi {

std::string ToString(const Rule& rule) {
  return "(" + rule.from + ", " + rule.read + ", " + rule.to + ", " +
         rule.write + ", " + std::to_string(rule.dir) + ")";
}

void RuleTable::Add(const State& from, const Symbol& read, const State& to,
                    const Symbol& write, int dir) {
  rules_.push_back({from, read, to, write, dir});
}

const Rule& RuleTable::FindRule(const State& state, const Symbol& scan) const {
  // First match wins, no specificity ordering
  for (const auto& rule : rules_) {
    if (rule.Matches(state, scan)) {
      return rule;
    }
  }
  throw RuleNotFound(state, scan);
}

std::set<State> RuleTable::States() const {
  std::set<State> states;
  for (const auto& rule : rules_) {
    states.insert(rule.from);
    states.insert(rule.to);
  }
  return states;
}

}  // namespace tmi

#pragma once

#include <set>
#include <string>
#include <vector>

namespace tmi {

//=============================================================================
// Symbols and states
//=============================================================================

using Symbol = std::string;
using State = std::string;

inline const Symbol kBlank = "_";
inline const Symbol kWildcard = "*";

inline const State kDefaultInit = "1";
inline const State kDefaultHalt = "0";

//=============================================================================
// Quintuple rules
//=============================================================================

struct Rule {
  State from;
  Symbol read;   // kWildcard matches any symbol
  State to;
  Symbol write;  // kWildcard leaves the cell unchanged
  int dir;       // < 0 left, 0 stay, > 0 right

  bool Matches(const State& state, const Symbol& scan) const {
    return from == state && (read == scan || read == kWildcard);
  }

  bool operator==(const Rule& other) const {
    return from == other.from && read == other.read && to == other.to &&
           write == other.write && dir == other.dir;
  }
};

// "(from, read, to, write, dir)"
std::string ToString(const Rule& rule);

// Ordered rule list; lookup is first match in insertion order
class RuleTable {
public:
  void Add(const State& from, const Symbol& read, const State& to,
           const Symbol& write, int dir);

  // Throws RuleNotFound when nothing matches
  const Rule& FindRule(const State& state, const Symbol& scan) const;

  // Every state label mentioned by a rule, either side
  std::set<State> States() const;

  const std::vector<Rule>& rules() const { return rules_; }
  size_t size() const { return rules_.size(); }
  bool empty() const { return rules_.empty(); }

private:
  std::vector<Rule> rules_;
};

}  // namespace tmi

#pragma once

#include "tmi/rules.hpp"
#include <map>
#include <string>

namespace tmi {

// Lowercased key -> value, last occurrence wins
using Settings = std::map<std::string, std::string>;

// Result of reading a rule file
struct RuleFile {
  RuleTable rules;
  Settings settings;
};

// Parse rule file text. Throws IncorrectSymbolCount when the number of rule
// tokens is not a multiple of five, InvalidDirection on a non-integer
// direction field.
RuleFile ParseRules(const std::string& source);

// Read and parse a rule file from disk
RuleFile LoadRuleFile(const std::string& path);

}  // namespace tmi

#pragma once

#include "tmi/rules.hpp"
#include <map>
#include <string>

namespace tmi {

// Two-way unbounded tape. Only written cells are stored, keyed by position,
// so a write far from the rest costs one cell. Positions never written read
// as kBlank, so writing kBlank outside the stored extent stores nothing.
class Tape {
public:
  Tape() = default;

  // One symbol per character of input
  explicit Tape(const std::string& input);

  Symbol Get(int position) const;
  void Set(int position, const Symbol& symbol);

  // True when built from empty input
  bool IsBlank() const { return blank_; }

  // Stored extent; Right() < Left() when nothing is stored
  int Left() const { return cells_.empty() ? 0 : cells_.begin()->first; }
  int Right() const { return cells_.empty() ? -1 : cells_.rbegin()->first; }

  // Cells Left()..Right() concatenated, gaps and blanks as kBlank
  std::string ToString() const;

private:
  std::map<int, Symbol> cells_;
  bool blank_ = true;
};

}  // namespace tmi

#include "tmi/tape.hpp"
#include <cstdint>

namespace tmi {

Tape::Tape(const std::string& input) : blank_(input.empty()) {
  int position = 0;
  for (char c : input) {
    cells_.emplace_hint(cells_.end(), position++, Symbol(1, c));
  }
}

Symbol Tape::Get(int position) const {
  auto it = cells_.find(position);
  if (it == cells_.end()) {
    return kBlank;
  }
  return it->second;
}

void Tape::Set(int position, const Symbol& symbol) {
  // Outside the stored extent a blank is already what Get() returns
  if (symbol == kBlank && (position < Left() || position > Right())) {
    return;
  }
  cells_[position] = symbol;
}

std::string Tape::ToString() const {
  std::string out;
  int64_t next = Left();
  for (const auto& [position, symbol] : cells_) {
    for (; next < position; ++next) {
      out += kBlank;
    }
    out += symbol;
    next = static_cast<int64_t>(position) + 1;
  }
  return out;
}

}  // namespace tmi

#include "tmi/parser.hpp"
#include "tmi/errors.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tmi {

namespace {

bool IsSymbolChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '*' || c == '-';
}

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

int ParseDirection(const std::string& token) {
  size_t i = (token[0] == '-') ? 1 : 0;
  if (i == token.size()) throw InvalidDirection(token);
  for (; i < token.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(token[i]))) throw InvalidDirection(token);
  }
  try {
    return std::stoi(token);
  } catch (const std::out_of_range&) {
    throw InvalidDirection(token);
  }
}

// Character-at-a-time reader. Feed() is the transition function, Finish()
// flushes whatever is buffered at end of input.
class Reader {
public:
  enum class Mode { Symbol, Config, Comment };

  void Feed(char c) {
    switch (mode_) {
      case Mode::Symbol:  FeedSymbol(c); break;
      case Mode::Config:  FeedConfig(c); break;
      case Mode::Comment: FeedComment(c); break;
    }
  }

  void Finish() {
    if (mode_ == Mode::Symbol) {
      FlushSymbol();
    } else if (mode_ == Mode::Config) {
      FlushValue();
    }
    mode_ = Mode::Symbol;

    // Count first, so a short file is reported as such before any field is
    // interpreted
    if (tokens_.size() % 5) {
      throw IncorrectSymbolCount(static_cast<int>(tokens_.size()));
    }
    for (size_t i = 0; i < tokens_.size(); i += 5) {
      result_.rules.Add(tokens_[i], tokens_[i + 1], tokens_[i + 2], tokens_[i + 3],
                        ParseDirection(tokens_[i + 4]));
    }
  }

  RuleFile Take() { return std::move(result_); }

private:
  void FeedSymbol(char c) {
    if (IsSymbolChar(c)) {
      buf_ += c;
    } else if (c == ':' && !buf_.empty()) {
      key_.clear();
      for (char k : buf_) key_ += static_cast<char>(std::tolower(static_cast<unsigned char>(k)));
      buf_.clear();
      mode_ = Mode::Config;
    } else if (!buf_.empty()) {
      FlushSymbol();
    } else if (c == '#') {
      mode_ = Mode::Comment;
    }
  }

  void FeedConfig(char c) {
    if (!IsSpace(c) && c != ':') {
      buf_ += c;
    } else if (!buf_.empty()) {
      FlushValue();
      mode_ = Mode::Symbol;
    }
  }

  void FeedComment(char c) {
    if (c == '\n') mode_ = Mode::Symbol;
  }

  void FlushSymbol() {
    if (buf_.empty()) return;
    tokens_.push_back(buf_);
    buf_.clear();
  }

  void FlushValue() {
    if (buf_.empty()) return;
    result_.settings[key_] = buf_;
    key_.clear();
    buf_.clear();
  }

  Mode mode_ = Mode::Symbol;
  std::string buf_;
  std::string key_;
  std::vector<std::string> tokens_;  // rule fields, five per rule
  RuleFile result_;
};

}  // namespace

RuleFile ParseRules(const std::string& source) {
  Reader reader;
  for (char c : source) {
    reader.Feed(c);
  }
  reader.Finish();
  return reader.Take();
}

RuleFile LoadRuleFile(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) throw std::runtime_error("Cannot open: " + path);
  std::stringstream buf;
  buf << ifs.rdbuf();
  return ParseRules(buf.str());
}

}  // namespace tmi

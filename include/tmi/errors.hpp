#pragma once

#include <stdexcept>
#include <string>

namespace tmi {

// Base for everything the interpreter throws
struct Error : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Step() on a tape built from empty input
struct TapeBlank : public Error {
  TapeBlank() : Error("The input tape is blank.") {}
};

// No rule covers the (state, symbol) pair under the head
class RuleNotFound : public Error {
public:
  RuleNotFound(const std::string& state, const std::string& symbol)
      : Error("No rule found from state " + state + " with char " + symbol + "."),
        state_(state), symbol_(symbol) {}

  const std::string& state() const { return state_; }
  const std::string& symbol() const { return symbol_; }

private:
  std::string state_;
  std::string symbol_;
};

// Rule file token count is not a multiple of five
class IncorrectSymbolCount : public Error {
public:
  explicit IncorrectSymbolCount(int count)
      : Error("Incorrect number of rule symbols (must be a multiple of 5, is " +
              std::to_string(count) + ")."),
        count_(count) {}

  int count() const { return count_; }

private:
  int count_;
};

// Fifth field of a rule is not an integer
class InvalidDirection : public Error {
public:
  explicit InvalidDirection(const std::string& token)
      : Error("Invalid head direction: " + token + " (must be an integer)."),
        token_(token) {}

  const std::string& token() const { return token_; }

private:
  std::string token_;
};

// Run() gave up before reaching the halting state
class StepLimitReached : public Error {
public:
  explicit StepLimitReached(int limit)
      : Error("Step limit of " + std::to_string(limit) + " reached before halting."),
        limit_(limit) {}

  int limit() const { return limit_; }

private:
  int limit_;
};

}  // namespace tmi

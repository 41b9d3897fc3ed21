#include <gtest/gtest.h>
#include "tmi/display.hpp"
#include <sstream>

namespace tmi {
namespace {

RuleTable MakeUnaryIncrement() {
  RuleTable rules;
  rules.Add("1", "1", "1", "1", 1);
  rules.Add("1", "_", "0", "1", 0);
  return rules;
}

TEST(FormatTest, TapeWithoutHead) {
  Tape tape("1_1");
  EXPECT_EQ(FormatTape(tape, 0, false), "1 1 ");
  EXPECT_EQ(FormatTape(Tape(""), 0, false), " ");
}

TEST(FormatTest, TapeWithHead) {
  Tape tape("abc");
  EXPECT_EQ(FormatTape(tape, 0, true), "|abc");
  EXPECT_EQ(FormatTape(tape, 2, true), "ab|c");
  EXPECT_EQ(FormatTape(tape, 3, true), "abc| ");
  EXPECT_EQ(FormatTape(tape, -2, true), "|  abc");
}

TEST(FormatTest, Path) {
  EXPECT_EQ(FormatPath({"1"}), "[1]");
  EXPECT_EQ(FormatPath({"1", "2", "0"}), "[1, 2, 0]");
}

TEST(DisplayTest, FullRun) {
  std::ostringstream out;
  Display display(out, {});
  Simulator sim(MakeUnaryIncrement());
  sim.AssignTape("11");

  display.PrintState(sim);
  while (!sim.Halted()) {
    sim.Step();
    display.PrintStep(sim);
  }

  EXPECT_EQ(out.str(),
            "0 (1): >11 <\n"
            "1 (1): >1|1<\n"
            "2 (1): >11| <\n"
            "3 (0): >111 <\n"
            "\n"
            "Steps: 3\n"
            "Head moves: 2\n"
            "State path: [1, 1, 1, 0]\n");
}

TEST(DisplayTest, SilentPrintsOnlyHalt) {
  std::ostringstream out;
  DisplayOptions options;
  options.silent = true;
  options.show_path = false;
  Display display(out, options);
  Simulator sim(MakeUnaryIncrement());
  sim.AssignTape("1");

  display.PrintState(sim);
  sim.Step();
  display.PrintStep(sim);
  EXPECT_EQ(out.str(), "");

  sim.Step();
  display.PrintStep(sim);
  EXPECT_EQ(out.str(), "2 (0): >11 <\n\nSteps: 2\nHead moves: 1\n");
}

TEST(DisplayTest, ShowRules) {
  std::ostringstream out;
  DisplayOptions options;
  options.show_rules = true;
  Display display(out, options);
  Simulator sim(MakeUnaryIncrement());
  sim.AssignTape("1");

  display.PrintState(sim);
  sim.Step();
  display.PrintState(sim, true);

  EXPECT_EQ(out.str(),
            "0 (1): >1 < R: None\n"
            "1 (1): >1| < R: (1, 1, 1, 1, 1)\n");
}

TEST(DisplayTest, VerboseAppendsTracking) {
  std::ostringstream out;
  DisplayOptions options;
  options.verbose = true;
  Display display(out, options);
  Simulator sim(MakeUnaryIncrement());
  sim.AssignTape("1");

  display.PrintState(sim);
  EXPECT_EQ(out.str(), "0 (1): >1 < Steps: 0 Head moves: 0 State path: [1] \n");
}

TEST(DisplayTest, LivePadsShorterLines) {
  std::ostringstream out;
  DisplayOptions options;
  options.live = true;
  Display display(out, options);

  Simulator sim(MakeUnaryIncrement());
  sim.AssignTape("111");
  display.PrintState(sim);
  sim.AssignTape("1");
  display.PrintState(sim);

  EXPECT_EQ(out.str(), "0 (1): >111 <\r0 (1): >1 <  \r");
}

TEST(DisplayTest, LiveHaltAddsExtraBlankLine) {
  std::ostringstream out;
  DisplayOptions options;
  options.live = true;
  options.show_path = false;
  Display display(out, options);

  RuleTable rules;
  rules.Add("1", "*", "0", "*", 0);
  Simulator sim(rules);
  sim.AssignTape("a");
  sim.Step();
  display.PrintStep(sim);

  EXPECT_EQ(out.str(), "1 (0): >a <\r\n\nSteps: 1\nHead moves: 0\n");
}

}  // namespace
}  // namespace tmi

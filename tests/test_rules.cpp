#include <gtest/gtest.h>
#include "tmi/errors.hpp"
#include "tmi/rules.hpp"

namespace tmi {
namespace {

TEST(RuleTableTest, AddKeepsOrder) {
  RuleTable table;
  table.Add("1", "a", "2", "b", 1);
  table.Add("2", "b", "1", "a", -1);

  ASSERT_EQ(table.size(), 2u);
  EXPECT_EQ(table.rules()[0].from, "1");
  EXPECT_EQ(table.rules()[1].from, "2");
  EXPECT_EQ(table.rules()[1].dir, -1);
}

TEST(RuleTableTest, FirstMatchWins) {
  RuleTable table;
  table.Add("S", "0", "A", "x", 1);
  table.Add("S", "*", "B", "y", -1);

  const Rule& rule = table.FindRule("S", "0");
  EXPECT_EQ(rule.to, "A");
  EXPECT_EQ(&rule, &table.rules()[0]);

  EXPECT_EQ(table.FindRule("S", "1").to, "B");
}

TEST(RuleTableTest, WildcardBeforeSpecificShadowsIt) {
  RuleTable table;
  table.Add("S", "*", "B", "y", 0);
  table.Add("S", "0", "A", "x", 0);

  // No specificity tie-breaking
  EXPECT_EQ(table.FindRule("S", "0").to, "B");
}

TEST(RuleTableTest, StateMustMatchExactly) {
  RuleTable table;
  table.Add("1", "*", "0", "*", 0);

  EXPECT_THROW(table.FindRule("10", "a"), RuleNotFound);
  EXPECT_THROW(table.FindRule("*", "a"), RuleNotFound);
}

TEST(RuleTableTest, RuleNotFoundCarriesPair) {
  RuleTable table;
  table.Add("1", "a", "0", "a", 0);

  try {
    table.FindRule("1", "b");
    FAIL() << "expected RuleNotFound";
  } catch (const RuleNotFound& e) {
    EXPECT_EQ(e.state(), "1");
    EXPECT_EQ(e.symbol(), "b");
    EXPECT_STREQ(e.what(), "No rule found from state 1 with char b.");
  }
}

TEST(RuleTableTest, EmptyTableNeverMatches) {
  RuleTable table;
  EXPECT_TRUE(table.empty());
  EXPECT_THROW(table.FindRule("1", "_"), RuleNotFound);
}

TEST(RuleTableTest, States) {
  RuleTable table;
  table.Add("1", "a", "2", "a", 1);
  table.Add("2", "_", "0", "_", 0);

  auto states = table.States();
  EXPECT_EQ(states.size(), 3u);
  EXPECT_TRUE(states.count("0"));
  EXPECT_TRUE(states.count("1"));
  EXPECT_TRUE(states.count("2"));
}

TEST(RuleTest, ToString) {
  Rule rule{"1", "_", "0", "1", -1};
  EXPECT_EQ(ToString(rule), "(1, _, 0, 1, -1)");
}

}  // namespace
}  // namespace tmi

#include <gtest/gtest.h>

#include "tq/parser/pattern_table.hpp"
#include "test_helpers.hpp"

using namespace tq::parser;
using namespace tq::test;
using tq::core::Priority;
using tq::core::RepeatType;

class PatternTablesTest : public ::testing::Test {
 protected:
  void SetUp() override { now_ = referenceNow(); }

  tq::DateTime now_;
};

TEST_F(PatternTablesTest, WeekdayIndex) {
  EXPECT_EQ(PatternTables::weekdayIndex("Sunday"), 0);
  EXPECT_EQ(PatternTables::weekdayIndex("mon"), 1);
  EXPECT_EQ(PatternTables::weekdayIndex("Thurs"), 4);
  EXPECT_EQ(PatternTables::weekdayIndex("SAT"), 6);
  EXPECT_FALSE(PatternTables::weekdayIndex("someday").has_value());
  EXPECT_FALSE(PatternTables::weekdayIndex("").has_value());
}

TEST_F(PatternTablesTest, MonthIndex) {
  EXPECT_EQ(PatternTables::monthIndex("January"), 1);
  EXPECT_EQ(PatternTables::monthIndex("sep"), 9);
  EXPECT_EQ(PatternTables::monthIndex("DEC"), 12);
  EXPECT_FALSE(PatternTables::monthIndex("smarch").has_value());
}

TEST_F(PatternTablesTest, DayAfterTomorrowBeatsTomorrow) {
  auto found = firstMatch(PatternTables::dates(), "dentist day after tomorrow", now_);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->rule, "day-after-tomorrow");
  EXPECT_EQ(iso(found->value), "2024-01-03T00:00:00");
}

TEST_F(PatternTablesTest, WeekdayListBeatsSingleDay) {
  auto found = firstMatch(PatternTables::recurrences(), "gym every mon, wed and fri", now_);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->rule, "weekday-list");
  EXPECT_EQ(found->value.type, RepeatType::kCustom);
  EXPECT_EQ(found->value.days, (std::set<int>{1, 3, 5}));
  ASSERT_TRUE(found->value.first_occurrence.has_value());
  EXPECT_EQ(iso(*found->value.first_occurrence), "2024-01-03T00:00:00");
}

TEST_F(PatternTablesTest, FirstMatchReportsSpan) {
  const std::string buffer = "Lunch at noon p1 please";
  auto found = firstMatch(PatternTables::priorities(), buffer, now_);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->rule, "p1");
  EXPECT_EQ(found->matched, "p1");
  ASSERT_EQ(found->spans.size(), 1u);
  EXPECT_EQ(found->spans[0].position, buffer.find("p1"));
  EXPECT_EQ(found->spans[0].length, 2u);
}

TEST_F(PatternTablesTest, DecliningInterpreterFallsThrough) {
  // 25:99 is not a valid 24-hour clock
  EXPECT_FALSE(firstMatch(PatternTables::clockTimes(), "code 25:99", now_).has_value());

  // "every 0 days" declines; no later entry claims it
  EXPECT_FALSE(firstMatch(PatternTables::advancedRecurrences(), "every 0 days", now_).has_value());
}

TEST_F(PatternTablesTest, OverflowingNumberDeclines) {
  EXPECT_FALSE(
      firstMatch(PatternTables::relativeTimes(), "in 99999999999999 minutes", now_).has_value());
}

TEST_F(PatternTablesTest, PriorityPrecedence) {
  auto triple = firstMatch(PatternTables::priorities(), "fix prod !!!", now_);
  ASSERT_TRUE(triple.has_value());
  EXPECT_EQ(triple->value, Priority::kHigh);

  auto double_bang = firstMatch(PatternTables::priorities(), "fix prod !!", now_);
  ASSERT_TRUE(double_bang.has_value());
  EXPECT_EQ(double_bang->value, Priority::kMedium);

  auto stars = firstMatch(PatternTables::priorities(), "fix prod **", now_);
  ASSERT_TRUE(stars.has_value());
  EXPECT_EQ(stars->value, Priority::kHigh);

  auto star = firstMatch(PatternTables::priorities(), "fix prod *", now_);
  ASSERT_TRUE(star.has_value());
  EXPECT_EQ(star->value, Priority::kMedium);
}

TEST_F(PatternTablesTest, ProperNounLocationIsCaseSensitive) {
  auto found = firstMatch(PatternTables::locations(), "Meet Sam at Central Park", now_);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->rule, "proper-noun");
  EXPECT_EQ(found->value, "Central Park");

  EXPECT_FALSE(firstMatch(PatternTables::locations(), "meet at central park", now_).has_value());
}

TEST_F(PatternTablesTest, AnyTrigger) {
  EXPECT_TRUE(anyTrigger(PatternTables::dates(), "ship it by Friday"));
  EXPECT_TRUE(anyTrigger(PatternTables::recurrences(), "water plants weekly"));
  EXPECT_FALSE(anyTrigger(PatternTables::dates(), "water plants"));
}

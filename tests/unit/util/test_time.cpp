#include <gtest/gtest.h>

#include "tq/util/time.hpp"
#include "test_helpers.hpp"

using namespace tq::util;
using namespace tq::test;
using tq::ErrorCode;

class TimeTest : public ::testing::Test {
 protected:
  void SetUp() override { now_ = referenceNow(); }

  tq::DateTime now_;
};

TEST_F(TimeTest, CalendarFields) {
  EXPECT_EQ(Time::year(now_), 2024);
  EXPECT_EQ(Time::month(now_), 1);
  EXPECT_EQ(Time::dayOfMonth(now_), 1);
  EXPECT_EQ(Time::hour(now_), 10);
  EXPECT_EQ(Time::minute(now_), 0);
  EXPECT_EQ(Time::weekday(now_), 1);  // Monday
}

TEST_F(TimeTest, MakeDateTimeOverflowsIntoNextMonth) {
  EXPECT_EQ(iso(Time::makeDateTime(2024, 13, 1)), "2025-01-01T00:00:00");
  EXPECT_EQ(iso(Time::makeDateTime(2023, 2, 30)), "2023-03-02T00:00:00");
}

TEST_F(TimeTest, AddMonthsClampsDayOfMonth) {
  EXPECT_EQ(iso(Time::addMonths(at(2024, 1, 31, 8, 30), 1)), "2024-02-29T08:30:00");
  EXPECT_EQ(iso(Time::addMonths(at(2024, 11, 15), 3)), "2025-02-15T00:00:00");
}

TEST_F(TimeTest, AddYearsFromLeapDay) {
  EXPECT_EQ(iso(Time::addYears(at(2024, 2, 29), 1)), "2025-03-01T00:00:00");
  EXPECT_EQ(iso(Time::addYears(at(2024, 2, 29), 4)), "2028-02-29T00:00:00");
}

TEST_F(TimeTest, WithTimeReplacesClock) {
  EXPECT_EQ(iso(Time::withTime(now_, 17, 45)), "2024-01-01T17:45:00");
  EXPECT_EQ(iso(Time::withTime(now_, 25, 0)), "2024-01-02T01:00:00");
  EXPECT_EQ(iso(Time::startOfDay(now_)), "2024-01-01T00:00:00");
}

TEST_F(TimeTest, NextWeekdayIsStrictlyAfter) {
  EXPECT_EQ(iso(Time::nextWeekday(now_, 1)), "2024-01-08T00:00:00");
  EXPECT_EQ(iso(Time::nextWeekday(now_, 5)), "2024-01-05T00:00:00");
  EXPECT_EQ(iso(Time::nextWeekday(now_, 0)), "2024-01-07T00:00:00");
}

TEST_F(TimeTest, LastDayOfMonth) {
  EXPECT_EQ(iso(Time::lastDayOfMonth(at(2024, 2, 10))), "2024-02-29T00:00:00");
  EXPECT_EQ(iso(Time::lastDayOfMonth(at(2023, 2, 10))), "2023-02-28T00:00:00");
  EXPECT_EQ(iso(Time::lastDayOfMonth(now_)), "2024-01-31T00:00:00");
}

TEST_F(TimeTest, NthWeekdayOfMonth) {
  // Second Tuesday of January 2024
  EXPECT_EQ(iso(Time::nthWeekdayOfMonth(now_, 2, 2)), "2024-01-09T00:00:00");
  // Last Wednesday
  EXPECT_EQ(iso(Time::nthWeekdayOfMonth(now_, -1, 3)), "2024-01-31T00:00:00");
}

TEST_F(TimeTest, NthWeekdayOfMonthRollsOverOncePassed) {
  // The first Monday of January is today at midnight, already behind 10:00
  EXPECT_EQ(iso(Time::nthWeekdayOfMonth(now_, 1, 1)), "2024-02-05T00:00:00");
  EXPECT_EQ(iso(Time::nthWeekdayOfMonth(at(2024, 12, 20), 1, 5)), "2025-01-03T00:00:00");
}

TEST_F(TimeTest, IsoStringRoundTrip) {
  EXPECT_EQ(Time::toIsoString(at(2024, 3, 5, 7, 8)), "2024-03-05T07:08:00");

  auto parsed = Time::fromIsoString("2024-03-05T07:08:09");
  ASSERT_OK(parsed);
  EXPECT_EQ(Time::toIsoString(*parsed), "2024-03-05T07:08:09");
}

TEST_F(TimeTest, FromIsoStringAcceptsShortForms) {
  auto date_only = Time::fromIsoString("2024-06-01");
  ASSERT_OK(date_only);
  EXPECT_EQ(iso(*date_only), "2024-06-01T00:00:00");

  auto with_space = Time::fromIsoString("2024-06-01 18:30");
  ASSERT_OK(with_space);
  EXPECT_EQ(iso(*with_space), "2024-06-01T18:30:00");
}

TEST_F(TimeTest, FromIsoStringRejectsInvalidInput) {
  EXPECT_ERROR(Time::fromIsoString("tomorrow"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromIsoString("2024-02-30"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromIsoString("2024-01-01T24:00"), ErrorCode::kParseError);
  EXPECT_ERROR(Time::fromIsoString(""), ErrorCode::kParseError);
}

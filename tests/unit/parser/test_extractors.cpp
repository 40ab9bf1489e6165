#include <gtest/gtest.h>

#include "tq/parser/extractors.hpp"
#include "test_helpers.hpp"

using namespace tq::parser;
using namespace tq::test;
using tq::core::MonthlyType;
using tq::core::ReminderOffset;
using tq::core::RepeatType;

class ExtractorsTest : public ::testing::Test {
 protected:
  void SetUp() override { now_ = referenceNow(); }

  std::string dateOf(const std::string& buffer) {
    auto found = Extractors::date(buffer, now_);
    return found ? iso(found->value) : "<none>";
  }

  tq::DateTime now_;
};

TEST_F(ExtractorsTest, ReminderOffsets) {
  auto minutes = Extractors::reminderOffset("Call remind me 20 min before", now_);
  ASSERT_TRUE(minutes.has_value());
  EXPECT_EQ(minutes->value, ReminderOffset::kThirtyMinutes);
  EXPECT_EQ(minutes->rule, "minutes-before");

  auto hour = Extractors::reminderOffset("Call notify me an hour before", now_);
  ASSERT_TRUE(hour.has_value());
  EXPECT_EQ(hour->value, ReminderOffset::kOneHour);

  auto day = Extractors::reminderOffset("Call remind me 1 day before", now_);
  ASSERT_TRUE(day.has_value());
  EXPECT_EQ(day->value, ReminderOffset::kOneDay);

  auto bare = Extractors::reminderOffset("Call mom remind me", now_);
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(bare->value, ReminderOffset::kExact);
  EXPECT_EQ(bare->rule, "bare");
}

TEST_F(ExtractorsTest, AdvancedRecurrenceIntervals) {
  auto days = Extractors::advancedRecurrence("Water plants every 3 days", now_);
  ASSERT_TRUE(days.has_value());
  EXPECT_EQ(days->value.pattern.frequency, RepeatType::kDaily);
  EXPECT_EQ(days->value.pattern.interval, 3);
  EXPECT_FALSE(days->value.first_occurrence.has_value());

  auto hours = Extractors::advancedRecurrence("Stretch every 2 hours", now_);
  ASSERT_TRUE(hours.has_value());
  EXPECT_EQ(hours->value.pattern.frequency, RepeatType::kHourly);
  EXPECT_EQ(hours->value.pattern.interval, 2);
}

TEST_F(ExtractorsTest, AdvancedRecurrenceLastWeekday) {
  auto found = Extractors::advancedRecurrence("Review every last friday", now_);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->value.pattern.monthly_type, MonthlyType::kWeekday);
  EXPECT_EQ(found->value.pattern.monthly_week, -1);
  EXPECT_EQ(found->value.pattern.monthly_day, 5);
  ASSERT_TRUE(found->value.first_occurrence.has_value());
  EXPECT_EQ(iso(*found->value.first_occurrence), "2024-01-26T00:00:00");
}

TEST_F(ExtractorsTest, AdvancedRecurrenceLastDayOfMonth) {
  auto found = Extractors::advancedRecurrence("Invoice on the last day of the month", now_);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->value.pattern.frequency, RepeatType::kMonthly);
  EXPECT_EQ(found->value.pattern.monthly_type, MonthlyType::kDate);
  EXPECT_EQ(found->value.pattern.monthly_day, 31);
  EXPECT_EQ(iso(*found->value.first_occurrence), "2024-01-31T00:00:00");
}

TEST_F(ExtractorsTest, RecurrenceFirstOccurrence) {
  auto weekdays = Extractors::recurrence("Standup every weekday", now_);
  ASSERT_TRUE(weekdays.has_value());
  EXPECT_EQ(weekdays->value.type, RepeatType::kWeekdays);
  EXPECT_EQ(iso(*weekdays->value.first_occurrence), "2024-01-02T00:00:00");

  auto weekends = Extractors::recurrence("Hike on weekends", now_);
  ASSERT_TRUE(weekends.has_value());
  EXPECT_EQ(weekends->value.type, RepeatType::kWeekends);
  EXPECT_EQ(iso(*weekends->value.first_occurrence), "2024-01-06T00:00:00");

  auto daily = Extractors::recurrence("Vitamins daily", now_);
  ASSERT_TRUE(daily.has_value());
  EXPECT_EQ(daily->value.type, RepeatType::kDaily);
  EXPECT_FALSE(daily->value.first_occurrence.has_value());
}

TEST_F(ExtractorsTest, WeekdaysFromFridaySkipWeekend) {
  auto found = Extractors::recurrence("Standup every weekday", at(2024, 1, 5, 10, 0));
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(iso(*found->value.first_occurrence), "2024-01-08T00:00:00");
}

TEST_F(ExtractorsTest, RelativeTimes) {
  auto minutes = Extractors::relativeTime("Tea in 10 minutes", now_);
  ASSERT_TRUE(minutes.has_value());
  EXPECT_EQ(iso(minutes->value), "2024-01-01T10:10:00");

  auto half = Extractors::relativeTime("Tea in half an hour", now_);
  ASSERT_TRUE(half.has_value());
  EXPECT_EQ(iso(half->value), "2024-01-01T10:30:00");

  auto hour = Extractors::relativeTime("Tea in an hour", now_);
  ASSERT_TRUE(hour.has_value());
  EXPECT_EQ(iso(hour->value), "2024-01-01T11:00:00");

  auto hours = Extractors::relativeTime("Tea in 2 hours", now_);
  ASSERT_TRUE(hours.has_value());
  EXPECT_EQ(iso(hours->value), "2024-01-01T12:00:00");
}

TEST_F(ExtractorsTest, NamedDays) {
  EXPECT_EQ(dateOf("Gym today"), "2024-01-01T00:00:00");
  EXPECT_EQ(dateOf("Movie tonight"), "2024-01-01T21:00:00");
  EXPECT_EQ(dateOf("Gym tmrw"), "2024-01-02T00:00:00");
  EXPECT_EQ(dateOf("Gym yesterday"), "2023-12-31T00:00:00");
  EXPECT_EQ(dateOf("Ship eod"), "2024-01-01T23:00:00");
  EXPECT_EQ(dateOf("Ship end of week"), "2024-01-05T17:00:00");
  EXPECT_EQ(dateOf("Ship eom"), "2024-01-31T17:00:00");
  EXPECT_EQ(dateOf("Hike this weekend"), "2024-01-06T00:00:00");
  EXPECT_EQ(dateOf("Plan next week"), "2024-01-08T00:00:00");
  EXPECT_EQ(dateOf("Plan next month"), "2024-02-01T00:00:00");
  EXPECT_EQ(dateOf("Plan in 3 days"), "2024-01-04T00:00:00");
  EXPECT_EQ(dateOf("Plan in 2 weeks"), "2024-01-15T00:00:00");
}

TEST_F(ExtractorsTest, Weekdays) {
  EXPECT_EQ(dateOf("Dentist tuesday"), "2024-01-02T00:00:00");
  EXPECT_EQ(dateOf("Dentist next tuesday"), "2024-01-09T00:00:00");
  // Said on a Monday, "monday" means the coming one
  EXPECT_EQ(dateOf("Dentist monday"), "2024-01-08T00:00:00");
}

TEST_F(ExtractorsTest, CalendarDates) {
  EXPECT_EQ(dateOf("Party Dec 25"), "2024-12-25T00:00:00");
  EXPECT_EQ(dateOf("Party 25th December"), "2024-12-25T00:00:00");
  EXPECT_EQ(dateOf("Party 25th of December"), "2024-12-25T00:00:00");
  EXPECT_EQ(dateOf("Recital 3rd of may"), "2024-05-03T00:00:00");
  EXPECT_EQ(dateOf("Tax 3/15"), "2024-03-15T00:00:00");
  EXPECT_EQ(dateOf("Tax 3/15/25"), "2025-03-15T00:00:00");
  EXPECT_EQ(dateOf("Launch 2024-03-01"), "2024-03-01T00:00:00");
}

TEST_F(ExtractorsTest, PassedCalendarDateRollsToNextYear) {
  // Midnight Jan 1 is already behind 10:00
  EXPECT_EQ(dateOf("Brunch Jan 1"), "2025-01-01T00:00:00");
}

TEST_F(ExtractorsTest, DateAbsorbsDueWord) {
  auto due = Extractors::date("Report due friday", now_);
  ASSERT_TRUE(due.has_value());
  EXPECT_EQ(due->matched, "due friday");
  EXPECT_EQ(due->spans[0].position, 7u);
  EXPECT_EQ(iso(due->value), "2024-01-05T00:00:00");

  auto by = Extractors::date("Submit by next monday", now_);
  ASSERT_TRUE(by.has_value());
  EXPECT_EQ(by->matched, "by next monday");
  EXPECT_EQ(iso(by->value), "2024-01-08T00:00:00");
}

TEST_F(ExtractorsTest, DateDoesNotAbsorbWordEndingInBy) {
  auto found = Extractors::date("Standby friday", now_);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->matched, "friday");
}

TEST_F(ExtractorsTest, ClockTimes) {
  auto pm = Extractors::clockTime("Dinner at 7:30pm", now_);
  ASSERT_TRUE(pm.has_value());
  EXPECT_EQ(pm->value.hours, 19);
  EXPECT_EQ(pm->value.minutes, 30);

  auto midnight = Extractors::clockTime("Deploy at 12am", now_);
  ASSERT_TRUE(midnight.has_value());
  EXPECT_EQ(midnight->value.hours, 0);

  auto noon = Extractors::clockTime("Lunch 12pm", now_);
  ASSERT_TRUE(noon.has_value());
  EXPECT_EQ(noon->value.hours, 12);
  EXPECT_EQ(noon->rule, "meridiem");

  auto plain = Extractors::clockTime("Run at 6", now_);
  ASSERT_TRUE(plain.has_value());
  EXPECT_EQ(plain->value.hours, 6);

  auto military = Extractors::clockTime("Call 18:45", now_);
  ASSERT_TRUE(military.has_value());
  EXPECT_EQ(military->value.hours, 18);
  EXPECT_EQ(military->value.minutes, 45);

  auto evening = Extractors::clockTime("Read in the evening", now_);
  ASSERT_TRUE(evening.has_value());
  EXPECT_EQ(evening->value.hours, 18);
}

TEST_F(ExtractorsTest, ClockTimeOutOfRangeDeclines) {
  EXPECT_FALSE(Extractors::clockTime("Pick up kids at 45", now_).has_value());
  EXPECT_FALSE(Extractors::clockTime("Meet at 30 Rock", now_).has_value());
  EXPECT_FALSE(Extractors::clockTime("Alarm 13pm", now_).has_value());
  EXPECT_FALSE(Extractors::clockTime("Call at 9:75", now_).has_value());

  auto late = Extractors::clockTime("Ship at 23", now_);
  ASSERT_TRUE(late.has_value());
  EXPECT_EQ(late->value.hours, 23);
}

TEST_F(ExtractorsTest, VenueLocation) {
  auto found = Extractors::location("Work out at the gym", now_);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->value, "gym");
  EXPECT_EQ(found->rule, "venue");
}

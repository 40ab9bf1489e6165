#pragma once

#include <chrono>
#include <string>

#include "tq/common.hpp"

namespace tq::util {

// Calendar arithmetic on local wall-clock instants.
//
// Weekdays are numbered 0 = Sunday .. 6 = Saturday throughout. None of these
// helpers read the system clock; the reference instant is always passed in.
class Time {
 public:
  // Current local wall-clock time, truncated to seconds. This is the only
  // function that touches the system clock.
  static DateTime now();

  // Build an instant from calendar fields. Out-of-range months and days
  // overflow into the following month/year (month 13 -> January, Feb 30 -> March).
  static DateTime makeDateTime(int year, int month, int day, int hour = 0, int minute = 0,
                               int second = 0);

  static DateTime startOfDay(DateTime time);
  static DateTime addDays(DateTime time, int days);
  static DateTime addMinutes(DateTime time, int minutes);

  // Day of month is clamped to the target month's length (Jan 31 + 1 month -> Feb 29).
  static DateTime addMonths(DateTime time, int months);

  // Feb 29 rolls to Mar 1 when the target year is not a leap year.
  static DateTime addYears(DateTime time, int years);

  // Same calendar day with the clock set to hour:minute:00. Hours past 23 roll
  // into the next day.
  static DateTime withTime(DateTime time, int hour, int minute);

  static int year(DateTime time);
  static int month(DateTime time);
  static int dayOfMonth(DateTime time);
  static int weekday(DateTime time);
  static int hour(DateTime time);
  static int minute(DateTime time);

  // Midnight of the last day of the month containing `time`.
  static DateTime lastDayOfMonth(DateTime time);

  // Midnight of the first day strictly after `time` that falls on `weekday`.
  static DateTime nextWeekday(DateTime time, int weekday);

  // Midnight of the `week`-th `weekday` of the month (week 1..4, or -1 for the
  // last one). When that day lies before `now` the following month is used.
  static DateTime nthWeekdayOfMonth(DateTime now, int week, int weekday);

  // Format as YYYY-MM-DDTHH:MM:SS
  static std::string toIsoString(DateTime time);

  // Parse YYYY-MM-DD, YYYY-MM-DDTHH:MM or YYYY-MM-DDTHH:MM:SS (a space may
  // replace the T)
  static Result<DateTime> fromIsoString(const std::string& str);
};

}  // namespace tq::util

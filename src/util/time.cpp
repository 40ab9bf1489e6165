#include "tq/util/time.hpp"

#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace tq::util {

namespace {

std::chrono::local_days dayOf(DateTime time) {
  return std::chrono::floor<std::chrono::days>(time);
}

std::chrono::year_month_day calendarOf(DateTime time) {
  return std::chrono::year_month_day{dayOf(time)};
}

}  // namespace

DateTime Time::now() {
  auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm = {};
  localtime_r(&time_t, &tm);
  return makeDateTime(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
                      tm.tm_sec);
}

DateTime Time::makeDateTime(int year, int month, int day, int hour, int minute, int second) {
  const std::chrono::year_month target =
      std::chrono::year{year} / std::chrono::January + std::chrono::months{month - 1};
  const std::chrono::local_days first_day{target / std::chrono::day{1}};
  return first_day + std::chrono::days{day - 1} + std::chrono::hours{hour} +
         std::chrono::minutes{minute} + std::chrono::seconds{second};
}

DateTime Time::startOfDay(DateTime time) {
  return dayOf(time);
}

DateTime Time::addDays(DateTime time, int days) {
  return time + std::chrono::days{days};
}

DateTime Time::addMinutes(DateTime time, int minutes) {
  return time + std::chrono::minutes{minutes};
}

DateTime Time::addMonths(DateTime time, int months) {
  const auto day_start = dayOf(time);
  const auto time_of_day = time - day_start;

  std::chrono::year_month_day shifted = calendarOf(time) + std::chrono::months{months};
  if (!shifted.ok()) {
    shifted = shifted.year() / shifted.month() / std::chrono::last;
  }
  return std::chrono::local_days{shifted} + time_of_day;
}

DateTime Time::addYears(DateTime time, int years) {
  const auto time_of_day = time - dayOf(time);
  return makeDateTime(year(time) + years, month(time), dayOfMonth(time)) + time_of_day;
}

DateTime Time::withTime(DateTime time, int hour, int minute) {
  return startOfDay(time) + std::chrono::hours{hour} + std::chrono::minutes{minute};
}

int Time::year(DateTime time) {
  return static_cast<int>(calendarOf(time).year());
}

int Time::month(DateTime time) {
  return static_cast<int>(static_cast<unsigned>(calendarOf(time).month()));
}

int Time::dayOfMonth(DateTime time) {
  return static_cast<int>(static_cast<unsigned>(calendarOf(time).day()));
}

int Time::weekday(DateTime time) {
  return static_cast<int>(std::chrono::weekday{dayOf(time)}.c_encoding());
}

int Time::hour(DateTime time) {
  return static_cast<int>(
      std::chrono::duration_cast<std::chrono::hours>(time - dayOf(time)).count());
}

int Time::minute(DateTime time) {
  const auto time_of_day = time - dayOf(time);
  return static_cast<int>(
      std::chrono::duration_cast<std::chrono::minutes>(time_of_day).count() % 60);
}

DateTime Time::lastDayOfMonth(DateTime time) {
  const auto ymd = calendarOf(time);
  return std::chrono::local_days{ymd.year() / ymd.month() / std::chrono::last};
}

DateTime Time::nextWeekday(DateTime time, int weekday_number) {
  int delta = weekday_number - weekday(time);
  if (delta <= 0) {
    delta += 7;
  }
  return addDays(startOfDay(time), delta);
}

DateTime Time::nthWeekdayOfMonth(DateTime now, int week, int weekday_number) {
  const std::chrono::weekday target{static_cast<unsigned>(weekday_number)};

  auto resolve = [&](std::chrono::year_month ym) -> DateTime {
    if (week < 0) {
      return std::chrono::local_days{ym / target[std::chrono::last]};
    }
    return std::chrono::local_days{ym / target[static_cast<unsigned>(week)]};
  };

  const auto ymd = calendarOf(now);
  const std::chrono::year_month current = ymd.year() / ymd.month();

  DateTime candidate = resolve(current);
  if (candidate < now) {
    // Every day of the following month lies after now, so one step suffices.
    candidate = resolve(current + std::chrono::months{1});
  }
  return candidate;
}

std::string Time::toIsoString(DateTime time) {
  std::ostringstream oss;
  oss << std::setfill('0')
      << std::setw(4) << year(time) << '-'
      << std::setw(2) << month(time) << '-'
      << std::setw(2) << dayOfMonth(time) << 'T'
      << std::setw(2) << hour(time) << ':'
      << std::setw(2) << minute(time) << ':'
      << std::setw(2) << (std::chrono::duration_cast<std::chrono::seconds>(time - dayOf(time)).count() % 60);
  return oss.str();
}

Result<DateTime> Time::fromIsoString(const std::string& str) {
  static const std::regex iso_regex(
      R"((\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2}))?)?)");

  std::smatch match;
  if (!std::regex_match(str, match, iso_regex)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid date-time format: " + str));
  }

  const int year_value = std::stoi(match[1]);
  const int month_value = std::stoi(match[2]);
  const int day_value = std::stoi(match[3]);
  const int hour_value = match[4].matched ? std::stoi(match[4]) : 0;
  const int minute_value = match[5].matched ? std::stoi(match[5]) : 0;
  const int second_value = match[6].matched ? std::stoi(match[6]) : 0;

  const std::chrono::year_month_day ymd{std::chrono::year{year_value},
                                        std::chrono::month{static_cast<unsigned>(month_value)},
                                        std::chrono::day{static_cast<unsigned>(day_value)}};
  if (!ymd.ok() || hour_value > 23 || minute_value > 59 || second_value > 59) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid date-time values: " + str));
  }

  return makeDateTime(year_value, month_value, day_value, hour_value, minute_value,
                      second_value);
}

}  // namespace tq::util

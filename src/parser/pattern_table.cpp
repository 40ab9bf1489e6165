#include "tq/parser/pattern_table.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include "tq/util/time.hpp"

namespace tq::parser {

using core::AdvancedRepeat;
using core::MonthlyType;
using core::Priority;
using core::ReminderOffset;
using core::RepeatType;
using util::Time;

namespace {

constexpr auto kIgnoreCase = std::regex::ECMAScript | std::regex::icase;

std::regex icase(const std::string& pattern) {
  return std::regex(pattern, kIgnoreCase);
}

std::regex exact(const std::string& pattern) {
  return std::regex(pattern, std::regex::ECMAScript);
}

// Digit runs that do not fit an int decline the match instead of throwing
std::optional<int> toNumber(const std::ssub_match& sub) {
  if (!sub.matched) {
    return std::nullopt;
  }
  const std::string digits = sub.str();
  int value = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return value;
}

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

template <typename T>
Interpreter<T> constant(T value) {
  return [value](const std::smatch&, DateTime) -> std::optional<T> { return value; };
}

// Days until the next `target` weekday, never zero
int daysUntil(int current, int target) {
  const int delta = (target - current + 7) % 7;
  return delta == 0 ? 7 : delta;
}

// Concrete first due date for recurrences that pin a calendar day
std::optional<DateTime> firstOccurrence(RepeatType type, const std::set<int>& days,
                                        DateTime now) {
  const int current = Time::weekday(now);

  if (type == RepeatType::kCustom && !days.empty()) {
    auto next = std::find_if(days.begin(), days.end(), [current](int d) { return d > current; });
    const int target = next != days.end() ? *next : *days.begin();
    return Time::startOfDay(Time::addDays(now, daysUntil(current, target)));
  }

  if (type == RepeatType::kWeekdays) {
    int offset = 1;
    if (current == 5) {
      offset = 3;
    } else if (current == 6) {
      offset = 2;
    }
    return Time::startOfDay(Time::addDays(now, offset));
  }

  if (type == RepeatType::kWeekends) {
    return Time::startOfDay(Time::addDays(now, daysUntil(current, 6)));
  }

  return std::nullopt;
}

Interpreter<Recurrence> repeating(RepeatType type, std::set<int> days = {}) {
  return [type, days](const std::smatch&, DateTime now) -> std::optional<Recurrence> {
    return Recurrence{type, days, firstOccurrence(type, days, now)};
  };
}

// Month/day in the current year, rolled a year forward once it has passed
DateTime upcomingCalendarDate(int month, int day, DateTime now) {
  DateTime date = Time::makeDateTime(Time::year(now), month, day);
  if (date < now) {
    date = Time::addYears(date, 1);
  }
  return date;
}

// Plain "friday" means the coming one; "next friday", or "friday" said on a
// Friday, skips to the one after tomorrow.
Interpreter<DateTime> weekdayDate(int target) {
  return [target](const std::smatch& m, DateTime now) -> std::optional<DateTime> {
    if (m[1].matched || Time::weekday(now) == target) {
      return Time::nextWeekday(Time::addDays(now, 1), target);
    }
    return Time::nextWeekday(now, target);
  };
}

std::optional<ClockTime> meridiemTime(const std::smatch& m) {
  auto hours = toNumber(m[1]);
  if (!hours) {
    return std::nullopt;
  }
  const int minutes = m[2].matched ? toNumber(m[2]).value_or(0) : 0;
  if (*hours > (m[3].matched ? 12 : 23) || minutes > 59) {
    return std::nullopt;
  }

  if (m[3].matched) {
    const std::string period = toLower(m[3].str());
    if (period == "pm" && *hours < 12) *hours += 12;
    if (period == "am" && *hours == 12) *hours = 0;
  }
  return ClockTime{*hours, minutes};
}

const std::string kRemindVerb = R"(\b(?:remind(?:\s+me)?|notify(?:\s+me)?))";

const std::string kDayName =
    R"((?:mon(?:day)?|tue(?:s(?:day)?)?|wed(?:nesday)?|thu(?:r(?:s(?:day)?)?)?|fri(?:day)?|sat(?:urday)?|sun(?:day)?))";

const std::string kMonthName =
    R"((jan(?:uary)?|feb(?:ruary)?|mar(?:ch)?|apr(?:il)?|may|jun(?:e)?|jul(?:y)?|aug(?:ust)?|sep(?:tember)?|oct(?:ober)?|nov(?:ember)?|dec(?:ember)?))";

}  // namespace

std::optional<int> PatternTables::weekdayIndex(const std::string& name) {
  static const std::vector<std::string> kPrefixes = {"sun", "mon", "tue", "wed",
                                                     "thu", "fri", "sat"};
  const std::string prefix = toLower(name.substr(0, 3));
  auto it = std::find(kPrefixes.begin(), kPrefixes.end(), prefix);
  if (it == kPrefixes.end()) {
    return std::nullopt;
  }
  return static_cast<int>(it - kPrefixes.begin());
}

std::optional<int> PatternTables::monthIndex(const std::string& name) {
  static const std::vector<std::string> kPrefixes = {"jan", "feb", "mar", "apr", "may", "jun",
                                                     "jul", "aug", "sep", "oct", "nov", "dec"};
  const std::string prefix = toLower(name.substr(0, 3));
  auto it = std::find(kPrefixes.begin(), kPrefixes.end(), prefix);
  if (it == kPrefixes.end()) {
    return std::nullopt;
  }
  return static_cast<int>(it - kPrefixes.begin()) + 1;
}

const PatternTable<ReminderOffset>& PatternTables::reminderOffsets() {
  static const PatternTable<ReminderOffset> table = {
      {"exact-time",
       icase(kRemindVerb + R"(\s+(?:at\s+)?(?:the\s+)?exact\s+time\b)"),
       constant(ReminderOffset::kExact)},
      {"minutes-before",
       icase(kRemindVerb + R"(\s+(\d+)\s*(?:min(?:ute)?s?)\s*(?:before|earlier)?\b)"),
       [](const std::smatch& m, DateTime) -> std::optional<ReminderOffset> {
         auto minutes = toNumber(m[1]);
         if (!minutes) return std::nullopt;
         return core::bucketReminderMinutes(*minutes);
       }},
      {"hour-before",
       icase(kRemindVerb + R"(\s+(?:1|one|an?)\s*(?:hour?s?|hr?s?)\s*(?:before|earlier)?\b)"),
       constant(ReminderOffset::kOneHour)},
      {"day-before",
       icase(kRemindVerb + R"(\s+(?:1|one|a)\s*(?:day)\s*(?:before|earlier)?\b)"),
       constant(ReminderOffset::kOneDay)},
      {"bare", icase(kRemindVerb + R"(\b)"), constant(ReminderOffset::kExact)},
  };
  return table;
}

const PatternTable<AdvancedRecurrence>& PatternTables::advancedRecurrences() {
  static const PatternTable<AdvancedRecurrence> table = {
      {"nth-weekday",
       icase(R"(\bevery\s+(1st|2nd|3rd|4th|last|first|second|third|fourth)\s+)"
             R"((monday|tuesday|wednesday|thursday|friday|saturday|sunday|mon|tue|wed|thu|fri|sat|sun)\b)"),
       [](const std::smatch& m, DateTime now) -> std::optional<AdvancedRecurrence> {
         const std::string ordinal = toLower(m[1].str());
         int week = -1;
         if (ordinal == "1st" || ordinal == "first") week = 1;
         else if (ordinal == "2nd" || ordinal == "second") week = 2;
         else if (ordinal == "3rd" || ordinal == "third") week = 3;
         else if (ordinal == "4th" || ordinal == "fourth") week = 4;

         auto day = weekdayIndex(m[2].str());
         if (!day) return std::nullopt;

         AdvancedRepeat pattern;
         pattern.frequency = RepeatType::kMonthly;
         pattern.monthly_type = MonthlyType::kWeekday;
         pattern.monthly_week = week;
         pattern.monthly_day = *day;
         return AdvancedRecurrence{pattern, Time::nthWeekdayOfMonth(now, week, *day)};
       }},
      {"hour-interval",
       icase(R"(\bevery\s+(\d+)\s*(?:hour?s?|hr?s?)\b)"),
       [](const std::smatch& m, DateTime) -> std::optional<AdvancedRecurrence> {
         auto interval = toNumber(m[1]);
         if (!interval || *interval < 1) return std::nullopt;

         AdvancedRepeat pattern;
         pattern.frequency = RepeatType::kHourly;
         pattern.interval = *interval;
         return AdvancedRecurrence{pattern, std::nullopt};
       }},
      {"unit-interval",
       icase(R"(\bevery\s+(\d+)\s+(day|week|month)s?\b)"),
       [](const std::smatch& m, DateTime) -> std::optional<AdvancedRecurrence> {
         auto interval = toNumber(m[1]);
         if (!interval || *interval < 1) return std::nullopt;

         const std::string unit = toLower(m[2].str());
         AdvancedRepeat pattern;
         pattern.frequency = unit == "day"    ? RepeatType::kDaily
                             : unit == "week" ? RepeatType::kWeekly
                                              : RepeatType::kMonthly;
         pattern.interval = *interval;
         return AdvancedRecurrence{pattern, std::nullopt};
       }},
      {"last-day-of-month",
       icase(R"(\b(?:every\s+)?last\s+day\s+(?:of\s+(?:the\s+)?)?month\b)"),
       [](const std::smatch&, DateTime now) -> std::optional<AdvancedRecurrence> {
         const DateTime last_day = Time::lastDayOfMonth(now);
         AdvancedRepeat pattern;
         pattern.frequency = RepeatType::kMonthly;
         pattern.monthly_type = MonthlyType::kDate;
         pattern.monthly_day = Time::dayOfMonth(last_day);
         return AdvancedRecurrence{pattern, last_day};
       }},
  };
  return table;
}

const PatternTable<Recurrence>& PatternTables::recurrences() {
  static const PatternTable<Recurrence> table = {
      {"hourly", icase(R"(\b(?:every\s*hour|hourly)\b)"), repeating(RepeatType::kHourly)},
      {"daily", icase(R"(\b(?:every\s*day|daily)\b)"), repeating(RepeatType::kDaily)},
      {"weekly", icase(R"(\b(?:every\s*week|weekly)\b)"), repeating(RepeatType::kWeekly)},
      {"monthly", icase(R"(\b(?:every\s*month|monthly)\b)"), repeating(RepeatType::kMonthly)},
      {"yearly", icase(R"(\b(?:every\s*year|yearly|annually)\b)"),
       repeating(RepeatType::kYearly)},
      {"weekdays", icase(R"(\b(?:every\s*weekday|weekdays|on\s*weekdays)\b)"),
       repeating(RepeatType::kWeekdays)},
      {"weekends", icase(R"(\b(?:every\s*weekend|weekends|on\s*weekends)\b)"),
       repeating(RepeatType::kWeekends)},
      // Must precede the single-day entries, which would claim its first day
      {"weekday-list",
       icase(R"(\bevery\s+((?:)" + kDayName + R"(\s*(?:,|and|&)\s*)+)" + kDayName + R"()\b)"),
       [](const std::smatch& m, DateTime now) -> std::optional<Recurrence> {
         static const std::regex day_regex(R"(\b)" + kDayName + R"(\b)", kIgnoreCase);

         const std::string list = m[1].str();
         std::set<int> days;
         for (auto it = std::sregex_iterator(list.begin(), list.end(), day_regex);
              it != std::sregex_iterator(); ++it) {
           if (auto day = weekdayIndex(it->str())) {
             days.insert(*day);
           }
         }
         if (days.empty()) return std::nullopt;
         return Recurrence{RepeatType::kCustom, days,
                           firstOccurrence(RepeatType::kCustom, days, now)};
       }},
      {"every-monday", icase(R"(\bevery\s*(monday|mon)\b)"), repeating(RepeatType::kCustom, {1})},
      {"every-tuesday", icase(R"(\bevery\s*(tuesday|tues|tue)\b)"),
       repeating(RepeatType::kCustom, {2})},
      {"every-wednesday", icase(R"(\bevery\s*(wednesday|wed)\b)"),
       repeating(RepeatType::kCustom, {3})},
      {"every-thursday", icase(R"(\bevery\s*(thursday|thurs|thu)\b)"),
       repeating(RepeatType::kCustom, {4})},
      {"every-friday", icase(R"(\bevery\s*(friday|fri)\b)"), repeating(RepeatType::kCustom, {5})},
      {"every-saturday", icase(R"(\bevery\s*(saturday|sat)\b)"),
       repeating(RepeatType::kCustom, {6})},
      {"every-sunday", icase(R"(\bevery\s*(sunday|sun)\b)"), repeating(RepeatType::kCustom, {0})},
  };
  return table;
}

const PatternTable<DateTime>& PatternTables::relativeTimes() {
  static const PatternTable<DateTime> table = {
      {"in-minutes", icase(R"(\bin\s+(\d+)\s*(?:min(?:ute)?s?)\b)"),
       [](const std::smatch& m, DateTime now) -> std::optional<DateTime> {
         auto minutes = toNumber(m[1]);
         if (!minutes) return std::nullopt;
         return now + std::chrono::minutes{*minutes};
       }},
      {"in-hours", icase(R"(\bin\s+(\d+)\s*(?:hour?s?|hr?s?)\b)"),
       [](const std::smatch& m, DateTime now) -> std::optional<DateTime> {
         auto hours = toNumber(m[1]);
         if (!hours) return std::nullopt;
         return now + std::chrono::hours{*hours};
       }},
      {"in-half-hour", icase(R"(\bin\s+(?:half\s+an?\s+hour|30\s*min))"),
       [](const std::smatch&, DateTime now) -> std::optional<DateTime> {
         return Time::addMinutes(now, 30);
       }},
      {"in-an-hour", icase(R"(\bin\s+an?\s+hour\b)"),
       [](const std::smatch&, DateTime now) -> std::optional<DateTime> {
         return Time::addMinutes(now, 60);
       }},
  };
  return table;
}

const PatternTable<DateTime>& PatternTables::dates() {
  static const PatternTable<DateTime> table = {
      // Listed before "tomorrow", which would otherwise claim the phrase
      {"day-after-tomorrow", icase(R"(\bday\s+after\s+tomorrow\b)"),
       [](const std::smatch&, DateTime now) -> std::optional<DateTime> {
         return Time::startOfDay(Time::addDays(now, 2));
       }},
      {"today", icase(R"(\btoday\b)"),
       [](const std::smatch&, DateTime now) -> std::optional<DateTime> {
         return Time::startOfDay(now);
       }},
      {"tonight", icase(R"(\btonight\b)"),
       [](const std::smatch&, DateTime now) -> std::optional<DateTime> {
         return Time::withTime(now, 21, 0);
       }},
      {"tomorrow", icase(R"(\b(?:tomorrow|tmrw|tmr)\b)"),
       [](const std::smatch&, DateTime now) -> std::optional<DateTime> {
         return Time::startOfDay(Time::addDays(now, 1));
       }},
      {"yesterday", icase(R"(\byesterday\b)"),
       [](const std::smatch&, DateTime now) -> std::optional<DateTime> {
         return Time::startOfDay(Time::addDays(now, -1));
       }},
      {"end-of-day", icase(R"(\b(?:eod|end of (?:the )?day)\b)"),
       [](const std::smatch&, DateTime now) -> std::optional<DateTime> {
         return Time::withTime(now, 23, 0);
       }},
      {"end-of-week", icase(R"(\b(?:eow|end of (?:the )?week)\b)"),
       [](const std::smatch&, DateTime now) -> std::optional<DateTime> {
         return Time::withTime(Time::addDays(now, daysUntil(Time::weekday(now), 5)), 17, 0);
       }},
      {"end-of-month", icase(R"(\b(?:eom|end of (?:the )?month)\b)"),
       [](const std::smatch&, DateTime now) -> std::optional<DateTime> {
         return Time::withTime(Time::lastDayOfMonth(now), 17, 0);
       }},
      {"this-morning", icase(R"(\bthis\s+morning\b)"),
       [](const std::smatch&, DateTime now) -> std::optional<DateTime> {
         return Time::withTime(now, 9, 0);
       }},
      {"this-afternoon", icase(R"(\bthis\s+afternoon\b)"),
       [](const std::smatch&, DateTime now) -> std::optional<DateTime> {
         return Time::withTime(now, 14, 0);
       }},
      {"this-evening", icase(R"(\bthis\s+evening\b)"),
       [](const std::smatch&, DateTime now) -> std::optional<DateTime> {
         return Time::withTime(now, 18, 0);
       }},
      {"this-weekend", icase(R"(\bthis weekend\b)"),
       [](const std::smatch&, DateTime now) -> std::optional<DateTime> {
         return Time::startOfDay(Time::addDays(now, daysUntil(Time::weekday(now), 6)));
       }},
      {"next-week", icase(R"(\bnext week\b)"),
       [](const std::smatch&, DateTime now) -> std::optional<DateTime> {
         return Time::startOfDay(Time::addDays(now, 7));
       }},
      {"next-month", icase(R"(\bnext month\b)"),
       [](const std::smatch&, DateTime now) -> std::optional<DateTime> {
         return Time::startOfDay(Time::addMonths(now, 1));
       }},
      {"in-days", icase(R"(\bin (\d+) days?\b)"),
       [](const std::smatch& m, DateTime now) -> std::optional<DateTime> {
         auto days = toNumber(m[1]);
         if (!days) return std::nullopt;
         return Time::startOfDay(now + std::chrono::days{*days});
       }},
      {"in-weeks", icase(R"(\bin (\d+) weeks?\b)"),
       [](const std::smatch& m, DateTime now) -> std::optional<DateTime> {
         auto weeks = toNumber(m[1]);
         if (!weeks) return std::nullopt;
         return Time::startOfDay(now + std::chrono::weeks{*weeks});
       }},
      {"in-months", icase(R"(\bin (\d+) months?\b)"),
       [](const std::smatch& m, DateTime now) -> std::optional<DateTime> {
         auto months = toNumber(m[1]);
         if (!months) return std::nullopt;
         return Time::startOfDay(Time::addMonths(now, *months));
       }},
      {"monday", icase(R"(\b(next\s+)?monday\b)"), weekdayDate(1)},
      {"tuesday", icase(R"(\b(next\s+)?tuesday\b)"), weekdayDate(2)},
      {"wednesday", icase(R"(\b(next\s+)?wednesday\b)"), weekdayDate(3)},
      {"thursday", icase(R"(\b(next\s+)?thursday\b)"), weekdayDate(4)},
      {"friday", icase(R"(\b(next\s+)?friday\b)"), weekdayDate(5)},
      {"saturday", icase(R"(\b(next\s+)?saturday\b)"), weekdayDate(6)},
      {"sunday", icase(R"(\b(next\s+)?sunday\b)"), weekdayDate(0)},
      {"month-day", icase(R"(\b)" + kMonthName + R"(\s+(\d{1,2})(?:st|nd|rd|th)?\b)"),
       [](const std::smatch& m, DateTime now) -> std::optional<DateTime> {
         auto month = monthIndex(m[1].str());
         auto day = toNumber(m[2]);
         if (!month || !day) return std::nullopt;
         return upcomingCalendarDate(*month, *day, now);
       }},
      {"day-month", icase(R"(\b(\d{1,2})(?:st|nd|rd|th)?\s+(?:of\s+)?)" + kMonthName + R"(\b)"),
       [](const std::smatch& m, DateTime now) -> std::optional<DateTime> {
         auto day = toNumber(m[1]);
         auto month = monthIndex(m[2].str());
         if (!month || !day) return std::nullopt;
         return upcomingCalendarDate(*month, *day, now);
       }},
      {"numeric-date", exact(R"(\b(\d{1,2})/(\d{1,2})(?:/(\d{2,4}))?\b)"),
       [](const std::smatch& m, DateTime now) -> std::optional<DateTime> {
         auto month = toNumber(m[1]);
         auto day = toNumber(m[2]);
         if (!month || !day) return std::nullopt;
         if (!m[3].matched) {
           return upcomingCalendarDate(*month, *day, now);
         }
         auto year = toNumber(m[3]);
         if (!year) return std::nullopt;
         if (*year < 100) *year += 2000;
         return Time::makeDateTime(*year, *month, *day);
       }},
      {"iso-date", exact(R"(\b(\d{4})-(\d{2})-(\d{2})\b)"),
       [](const std::smatch& m, DateTime) -> std::optional<DateTime> {
         auto year = toNumber(m[1]);
         auto month = toNumber(m[2]);
         auto day = toNumber(m[3]);
         if (!year || !month || !day) return std::nullopt;
         return Time::makeDateTime(*year, *month, *day);
       }},
  };
  return table;
}

const PatternTable<ClockTime>& PatternTables::clockTimes() {
  static const PatternTable<ClockTime> table = {
      {"at-time", icase(R"(\bat\s+(\d{1,2})(?::(\d{2}))?\s*(am|pm)?\b)"),
       [](const std::smatch& m, DateTime) { return meridiemTime(m); }},
      {"meridiem", icase(R"(\b(\d{1,2})(?::(\d{2}))?\s*(am|pm)\b)"),
       [](const std::smatch& m, DateTime) { return meridiemTime(m); }},
      {"24-hour", exact(R"(\b(\d{1,2}):(\d{2})\b)"),
       [](const std::smatch& m, DateTime) -> std::optional<ClockTime> {
         auto hours = toNumber(m[1]);
         auto minutes = toNumber(m[2]);
         if (!hours || !minutes || *hours > 23 || *minutes > 59) return std::nullopt;
         return ClockTime{*hours, *minutes};
       }},
      {"part-of-day", icase(R"(\bin the (morning|afternoon|evening|night)\b)"),
       [](const std::smatch& m, DateTime) -> std::optional<ClockTime> {
         const std::string part = toLower(m[1].str());
         int hours = 9;
         if (part == "afternoon") hours = 14;
         else if (part == "evening") hours = 18;
         else if (part == "night") hours = 21;
         return ClockTime{hours, 0};
       }},
  };
  return table;
}

const PatternTable<Priority>& PatternTables::priorities() {
  static const PatternTable<Priority> table = {
      {"high-words", icase(R"(\b(high priority|urgent|important|asap|critical|!{2,})\b)"),
       constant(Priority::kHigh)},
      {"medium-words", icase(R"(\b(medium priority|normal|moderate)\b)"),
       constant(Priority::kMedium)},
      {"low-words", icase(R"(\b(low priority|later|whenever|someday)\b)"),
       constant(Priority::kLow)},
      {"triple-bang", exact(R"(!{3,})"), constant(Priority::kHigh)},
      {"double-bang", exact(R"(!!)"), constant(Priority::kMedium)},
      {"p1", icase(R"(\bp1\b)"), constant(Priority::kHigh)},
      {"p2", icase(R"(\bp2\b)"), constant(Priority::kMedium)},
      {"p3", icase(R"(\bp3\b)"), constant(Priority::kLow)},
      {"bang-high", icase(R"(!high\b)"), constant(Priority::kHigh)},
      {"bang-medium", icase(R"(!med(?:ium)?\b)"), constant(Priority::kMedium)},
      {"bang-low", icase(R"(!low\b)"), constant(Priority::kLow)},
      {"double-star", exact(R"(\*{2,})"), constant(Priority::kHigh)},
      {"single-star", exact(R"(\*(?!\*))"), constant(Priority::kMedium)},
  };
  return table;
}

const PatternTable<std::string>& PatternTables::locations() {
  auto captured = [](const std::smatch& m, DateTime) -> std::optional<std::string> {
    std::string location = m[1].str();
    auto first = location.find_first_not_of(" \t");
    auto last = location.find_last_not_of(" \t");
    if (first == std::string::npos) return std::nullopt;
    location = location.substr(first, last - first + 1);
    if (location.size() <= 1) return std::nullopt;
    return location;
  };

  static const PatternTable<std::string> table = {
      {"venue",
       icase(R"(\bat\s+(?:the\s+)?(office|home|work|gym|school|store|market|mall|hospital|)"
             R"(clinic|bank|library|cafe|restaurant|airport|station)\b)"),
       captured},
      // Capitalized words after a lowercase "at"; knowingly over-matches
      {"proper-noun", exact(R"(\bat\s+([A-Z][a-zA-Z']+(?:\s+[A-Z][a-zA-Z']+)*)\b)"), captured},
  };
  return table;
}

}  // namespace tq::parser

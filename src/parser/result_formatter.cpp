#include "tq/parser/result_formatter.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <sstream>

#include "tq/util/time.hpp"

namespace tq::parser {

using core::MonthlyType;
using core::ParsedTask;
using core::RepeatType;

namespace {

constexpr std::array<const char*, 7> kDayNames = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};

std::string dayName(int day) {
  if (day < 0 || day > 6) {
    return "?";
  }
  return kDayNames[static_cast<std::size_t>(day)];
}

std::string ordinal(int week) {
  switch (week) {
    case 1: return "1st";
    case 2: return "2nd";
    case 3: return "3rd";
    case 4: return "4th";
    default: return "last";
  }
}

std::string unitName(RepeatType frequency) {
  switch (frequency) {
    case RepeatType::kHourly: return "hour";
    case RepeatType::kDaily: return "day";
    case RepeatType::kWeekly: return "week";
    case RepeatType::kMonthly: return "month";
    case RepeatType::kYearly: return "year";
    default: return "time";
  }
}

std::string capitalized(std::string_view word) {
  std::string result(word);
  if (!result.empty()) {
    result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
  }
  return result;
}

std::optional<std::string> relativeLabel(DateTime due, DateTime now) {
  const auto diff_seconds = std::chrono::duration_cast<std::chrono::seconds>(due - now).count();
  if (diff_seconds < 0) {
    return std::nullopt;
  }

  const auto minutes = std::llround(static_cast<double>(diff_seconds) / 60.0);
  if (minutes < 60) {
    return "in " + std::to_string(minutes) + " min";
  }

  const auto hours = std::llround(static_cast<double>(diff_seconds) / 3600.0);
  if (hours < 24) {
    return "in " + std::to_string(hours) + (hours > 1 ? " hours" : " hour");
  }
  return std::nullopt;
}

std::string reminderLabel(core::ReminderOffset offset) {
  switch (offset) {
    case core::ReminderOffset::kExact: return "🔔 At exact time";
    case core::ReminderOffset::kFiveMinutes: return "🔔 5 min before";
    case core::ReminderOffset::kTenMinutes: return "🔔 10 min before";
    case core::ReminderOffset::kFifteenMinutes: return "🔔 15 min before";
    case core::ReminderOffset::kThirtyMinutes: return "🔔 30 min before";
    case core::ReminderOffset::kOneHour: return "🔔 1 hour before";
    case core::ReminderOffset::kOneDay: return "🔔 1 day before";
  }
  return "🔔 Reminder set";
}

std::string effortLabel(double estimated_hours) {
  long long hours = static_cast<long long>(std::floor(estimated_hours));
  long long minutes = std::llround((estimated_hours - static_cast<double>(hours)) * 60.0);
  if (minutes == 60) {
    ++hours;
    minutes = 0;
  }

  std::ostringstream oss;
  oss << "⏱ ";
  if (hours > 0) oss << hours << 'h';
  if (minutes > 0 || hours == 0) oss << minutes << 'm';
  return oss.str();
}

}  // namespace

std::string ResultFormatter::recurrenceLabel(const ParsedTask& parsed) {
  std::ostringstream oss;
  oss << "🔄 ";

  if (parsed.advanced_repeat) {
    const auto& repeat = *parsed.advanced_repeat;
    if (repeat.monthly_type == MonthlyType::kWeekday && repeat.monthly_week &&
        repeat.monthly_day) {
      oss << "Every " << ordinal(*repeat.monthly_week) << ' ' << dayName(*repeat.monthly_day);
      return oss.str();
    }
    if (repeat.monthly_type == MonthlyType::kDate) {
      oss << "Last day of month";
      return oss.str();
    }
    if (repeat.interval) {
      oss << "Every ";
      if (*repeat.interval == 1) {
        oss << unitName(repeat.frequency);
      } else {
        oss << *repeat.interval << ' ' << unitName(repeat.frequency) << 's';
      }
      return oss.str();
    }
  }

  if (!parsed.repeat_type) {
    return "";
  }

  if (*parsed.repeat_type == RepeatType::kCustom && parsed.repeat_days &&
      !parsed.repeat_days->empty()) {
    oss << "Every ";
    bool first = true;
    for (int day : *parsed.repeat_days) {
      if (!first) oss << ", ";
      oss << dayName(day);
      first = false;
    }
    return oss.str();
  }

  oss << capitalized(core::toString(*parsed.repeat_type));
  return oss.str();
}

std::vector<std::string> ResultFormatter::formatForDisplay(const ParsedTask& parsed) {
  return formatForDisplay(parsed, util::Time::now());
}

std::vector<std::string> ResultFormatter::formatForDisplay(const ParsedTask& parsed,
                                                           DateTime now) {
  std::vector<std::string> badges;

  if (parsed.due_date) {
    if (auto label = relativeLabel(*parsed.due_date, now)) {
      badges.push_back(*label);
    }
  }

  if (parsed.reminder_offset) {
    badges.push_back(reminderLabel(*parsed.reminder_offset));
  }

  if (parsed.repeat_type || parsed.advanced_repeat) {
    std::string label = recurrenceLabel(parsed);
    if (!label.empty()) {
      badges.push_back(label);
    }
  }

  if (parsed.location) {
    badges.push_back("📍 " + *parsed.location);
  }

  if (parsed.priority) {
    badges.push_back("⚡ " + std::string(core::toString(*parsed.priority)) + " priority");
  }

  if (parsed.estimated_hours && *parsed.estimated_hours > 0.0) {
    badges.push_back(effortLabel(*parsed.estimated_hours));
  }

  if (parsed.description) {
    badges.push_back("📝 " + *parsed.description);
  }

  return badges;
}

}  // namespace tq::parser

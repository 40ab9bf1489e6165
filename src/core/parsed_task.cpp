#include "tq/core/parsed_task.hpp"

#include <algorithm>
#include <cctype>

#include "tq/util/time.hpp"

namespace tq::core {

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

}  // namespace

int offsetMinutes(ReminderOffset offset) {
  switch (offset) {
    case ReminderOffset::kExact: return 0;
    case ReminderOffset::kFiveMinutes: return 5;
    case ReminderOffset::kTenMinutes: return 10;
    case ReminderOffset::kFifteenMinutes: return 15;
    case ReminderOffset::kThirtyMinutes: return 30;
    case ReminderOffset::kOneHour: return 60;
    case ReminderOffset::kOneDay: return 1440;
  }
  return 0;
}

ReminderOffset bucketReminderMinutes(int minutes) {
  if (minutes <= 5) return ReminderOffset::kFiveMinutes;
  if (minutes <= 10) return ReminderOffset::kTenMinutes;
  if (minutes <= 15) return ReminderOffset::kFifteenMinutes;
  if (minutes <= 30) return ReminderOffset::kThirtyMinutes;
  return ReminderOffset::kOneHour;
}

std::string_view toString(ReminderOffset offset) {
  switch (offset) {
    case ReminderOffset::kExact: return "exact";
    case ReminderOffset::kFiveMinutes: return "5min";
    case ReminderOffset::kTenMinutes: return "10min";
    case ReminderOffset::kFifteenMinutes: return "15min";
    case ReminderOffset::kThirtyMinutes: return "30min";
    case ReminderOffset::kOneHour: return "1hour";
    case ReminderOffset::kOneDay: return "1day";
  }
  return "exact";
}

std::string_view toString(Priority priority) {
  switch (priority) {
    case Priority::kHigh: return "high";
    case Priority::kMedium: return "medium";
    case Priority::kLow: return "low";
  }
  return "medium";
}

std::string_view toString(RepeatType type) {
  switch (type) {
    case RepeatType::kHourly: return "hourly";
    case RepeatType::kDaily: return "daily";
    case RepeatType::kWeekly: return "weekly";
    case RepeatType::kMonthly: return "monthly";
    case RepeatType::kYearly: return "yearly";
    case RepeatType::kWeekdays: return "weekdays";
    case RepeatType::kWeekends: return "weekends";
    case RepeatType::kCustom: return "custom";
  }
  return "daily";
}

std::string_view toString(MonthlyType type) {
  switch (type) {
    case MonthlyType::kDate: return "date";
    case MonthlyType::kWeekday: return "weekday";
  }
  return "date";
}

nlohmann::json toJson(const AdvancedRepeat& repeat) {
  nlohmann::json json;
  json["frequency"] = std::string(toString(repeat.frequency));
  if (repeat.interval) json["interval"] = *repeat.interval;
  if (repeat.monthly_type) json["monthly_type"] = std::string(toString(*repeat.monthly_type));
  if (repeat.monthly_week) json["monthly_week"] = *repeat.monthly_week;
  if (repeat.monthly_day) json["monthly_day"] = *repeat.monthly_day;
  return json;
}

nlohmann::json toJson(const ParsedTask& task) {
  nlohmann::json json;
  json["text"] = task.text;

  if (task.due_date) {
    json["due_date"] = util::Time::toIsoString(*task.due_date);
  }
  if (task.reminder_time) {
    json["reminder_time"] = util::Time::toIsoString(*task.reminder_time);
  }
  if (task.reminder_offset) {
    json["reminder_offset"] = std::string(toString(*task.reminder_offset));
  }
  if (task.priority) {
    json["priority"] = std::string(toString(*task.priority));
  }
  if (task.repeat_type) {
    json["repeat_type"] = std::string(toString(*task.repeat_type));
  }
  if (task.repeat_days) {
    json["repeat_days"] = *task.repeat_days;
  }
  if (task.advanced_repeat) {
    json["advanced_repeat"] = toJson(*task.advanced_repeat);
  }
  if (task.location) json["location"] = *task.location;
  if (task.tags) json["tags"] = *task.tags;
  if (task.folder_name) json["folder_name"] = *task.folder_name;
  if (task.description) json["description"] = *task.description;
  if (task.estimated_hours) json["estimated_hours"] = *task.estimated_hours;

  return json;
}

Result<std::string> resolveFolder(const std::string& folder_name,
                                  const std::vector<std::string>& folders) {
  if (folder_name.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Empty folder name"));
  }

  const std::string needle = toLower(folder_name);
  for (const auto& folder : folders) {
    if (toLower(folder).find(needle) != std::string::npos) {
      return folder;
    }
  }

  return std::unexpected(makeError(ErrorCode::kNotFound,
                                   "No folder matches: " + folder_name));
}

}  // namespace tq::core

#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "tq/common.hpp"

namespace tq::core {

// Lead time before the due moment at which a reminder fires
enum class ReminderOffset {
  kExact,
  kFiveMinutes,
  kTenMinutes,
  kFifteenMinutes,
  kThirtyMinutes,
  kOneHour,
  kOneDay
};

enum class Priority {
  kHigh,
  kMedium,
  kLow
};

enum class RepeatType {
  kHourly,
  kDaily,
  kWeekly,
  kMonthly,
  kYearly,
  kWeekdays,
  kWeekends,
  kCustom  // uses ParsedTask::repeat_days
};

// "on the 31st" vs "on the 2nd Tuesday"
enum class MonthlyType {
  kDate,
  kWeekday
};

// Recurrence too irregular for RepeatType + repeat days alone
struct AdvancedRepeat {
  RepeatType frequency = RepeatType::kDaily;
  std::optional<int> interval;              // every N hours/days/weeks/months
  std::optional<MonthlyType> monthly_type;
  std::optional<int> monthly_week;          // 1-4, or -1 for the last week
  std::optional<int> monthly_day;           // weekday 0-6, or day of month 1-31

  bool operator==(const AdvancedRepeat&) const = default;
};

// Structured result of parsing one line of task text
struct ParsedTask {
  std::string text;                           // Canonical title, never empty for non-blank input
  std::optional<DateTime> due_date;
  std::optional<DateTime> reminder_time;
  std::optional<ReminderOffset> reminder_offset;
  std::optional<Priority> priority;
  std::optional<RepeatType> repeat_type;
  std::optional<std::set<int>> repeat_days;   // 0 = Sunday .. 6 = Saturday, custom repeats only
  std::optional<AdvancedRepeat> advanced_repeat;
  std::optional<std::string> location;
  std::optional<std::vector<std::string>> tags;  // First-appearance order, no duplicates
  std::optional<std::string> folder_name;
  std::optional<std::string> description;
  std::optional<double> estimated_hours;
};

// Minutes subtracted from the due moment for each offset tier
int offsetMinutes(ReminderOffset offset);

// Bucket a free-form minute count into the nearest supported tier
ReminderOffset bucketReminderMinutes(int minutes);

std::string_view toString(ReminderOffset offset);
std::string_view toString(Priority priority);
std::string_view toString(RepeatType type);
std::string_view toString(MonthlyType type);

// JSON mapping; unset fields are omitted
nlohmann::json toJson(const AdvancedRepeat& repeat);
nlohmann::json toJson(const ParsedTask& task);

/**
 * @brief Resolve a parsed folder name against known folder names
 *
 * The first folder whose name contains `folder_name` (case-insensitive) wins.
 * @return Matching folder name, or kNotFound
 */
Result<std::string> resolveFolder(const std::string& folder_name,
                                  const std::vector<std::string>& folders);

}  // namespace tq::core

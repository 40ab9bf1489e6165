#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

#include "tq/common.hpp"
#include "tq/core/parsed_task.hpp"

namespace tq::parser {

// Character range of a match inside the buffer that was scanned
struct Span {
  std::size_t position = 0;
  std::size_t length = 0;
};

/**
 * @brief Outcome of one extraction stage
 *
 * Extractors never modify the buffer they scan. The orchestrator removes
 * `spans` (offsets into that same buffer) before running the next stage.
 */
template <typename T>
struct Extraction {
  T value;
  std::string matched;      // Literal text consumed (space-joined for multi-span matches)
  std::vector<Span> spans;
  std::string rule;         // Name of the table entry that fired
};

// Value types produced by the tables that are not plain model fields
struct ClockTime {
  int hours = 0;
  int minutes = 0;
};

struct Recurrence {
  core::RepeatType type = core::RepeatType::kDaily;
  std::set<int> days;                      // Only for RepeatType::kCustom
  std::optional<DateTime> first_occurrence;
};

struct AdvancedRecurrence {
  core::AdvancedRepeat pattern;
  std::optional<DateTime> first_occurrence;
};

// Interpreters may decline a match (std::nullopt); the scan then moves on to
// the next entry of the table.
template <typename T>
using Interpreter = std::function<std::optional<T>(const std::smatch& match, DateTime now)>;

template <typename T>
struct PatternEntry {
  std::string name;
  std::regex trigger;
  Interpreter<T> interpret;
};

// Entries are tried in order; the first one that matches and interprets wins.
template <typename T>
using PatternTable = std::vector<PatternEntry<T>>;

template <typename T>
std::optional<Extraction<T>> firstMatch(const PatternTable<T>& table, const std::string& buffer,
                                        DateTime now) {
  for (const auto& entry : table) {
    std::smatch match;
    if (!std::regex_search(buffer, match, entry.trigger)) {
      continue;
    }

    auto value = entry.interpret(match, now);
    if (!value) {
      continue;
    }

    Span span{static_cast<std::size_t>(match.position(0)),
              static_cast<std::size_t>(match.length(0))};
    return Extraction<T>{std::move(*value), match.str(0), {span}, entry.name};
  }
  return std::nullopt;
}

// True if any trigger of the table occurs in `text`. Interpreters are not run.
template <typename T>
bool anyTrigger(const PatternTable<T>& table, const std::string& text) {
  for (const auto& entry : table) {
    if (std::regex_search(text, entry.trigger)) {
      return true;
    }
  }
  return false;
}

/**
 * @brief The grammar's pattern tables
 *
 * Each table is compiled on first use and is read-only afterwards. Order is
 * precedence: specific entries are listed before broader ones that could
 * claim the same words.
 */
class PatternTables {
 public:
  // "remind me 15 min before", "notify me", ...
  static const PatternTable<core::ReminderOffset>& reminderOffsets();

  // "every 2nd tuesday", "every 3 days", "last day of the month"
  static const PatternTable<AdvancedRecurrence>& advancedRecurrences();

  // "daily", "every weekday", "every mon and thu"
  static const PatternTable<Recurrence>& recurrences();

  // "in 10 minutes", "in an hour"
  static const PatternTable<DateTime>& relativeTimes();

  // "tomorrow", "next friday", "Dec 25", "2024-03-01"
  static const PatternTable<DateTime>& dates();

  // "at 5pm", "17:30", "in the evening"
  static const PatternTable<ClockTime>& clockTimes();

  // "asap", "p1", "!!", "*"
  static const PatternTable<core::Priority>& priorities();

  // "at the gym", "at Central Park"
  static const PatternTable<std::string>& locations();

  // Weekday number (0 = Sunday) from a day name or its abbreviation
  static std::optional<int> weekdayIndex(const std::string& name);

  // Month number (1-12) from a month name or its abbreviation
  static std::optional<int> monthIndex(const std::string& name);
};

}  // namespace tq::parser

#pragma once

#include <string>
#include <vector>

#include "tq/common.hpp"
#include "tq/core/parsed_task.hpp"

namespace tq::parser {

/**
 * @brief Short display badges for a parsed task
 *
 * Badge order: time until due (only when due within a day), reminder,
 * recurrence, location, priority, effort, description. Fields that are
 * unset produce no badge.
 */
class ResultFormatter {
public:
  static std::vector<std::string> formatForDisplay(const core::ParsedTask& parsed);

  static std::vector<std::string> formatForDisplay(const core::ParsedTask& parsed, DateTime now);

  // "🔄 Every Mon, Fri", "🔄 Every 2nd Tue", "🔄 Weekdays"
  static std::string recurrenceLabel(const core::ParsedTask& parsed);
};

}  // namespace tq::parser

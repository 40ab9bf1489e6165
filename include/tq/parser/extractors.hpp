#pragma once

#include <optional>
#include <string>

#include "tq/common.hpp"
#include "tq/core/parsed_task.hpp"
#include "tq/parser/pattern_table.hpp"

namespace tq::parser {

/**
 * @brief Grammar stage extractors
 *
 * Each extractor scans `buffer` for the first applicable entry of its table
 * and returns the interpreted value together with the consumed span. The
 * buffer is never modified; `now` is the single reference instant of the
 * parse call.
 */
class Extractors {
public:
  static std::optional<Extraction<core::ReminderOffset>> reminderOffset(
      const std::string& buffer, DateTime now);

  static std::optional<Extraction<AdvancedRecurrence>> advancedRecurrence(
      const std::string& buffer, DateTime now);

  static std::optional<Extraction<Recurrence>> recurrence(const std::string& buffer,
                                                          DateTime now);

  static std::optional<Extraction<DateTime>> relativeTime(const std::string& buffer,
                                                          DateTime now);

  /**
   * @brief Absolute date phrase
   *
   * A "due" or "by" directly in front of the phrase is consumed with it, so
   * "report due friday" leaves "report".
   */
  static std::optional<Extraction<DateTime>> date(const std::string& buffer, DateTime now);

  static std::optional<Extraction<ClockTime>> clockTime(const std::string& buffer, DateTime now);

  static std::optional<Extraction<core::Priority>> priority(const std::string& buffer,
                                                            DateTime now);

  static std::optional<Extraction<std::string>> location(const std::string& buffer,
                                                         DateTime now);
};

}  // namespace tq::parser

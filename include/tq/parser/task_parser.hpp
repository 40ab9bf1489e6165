#pragma once

#include <cstddef>
#include <string>

#include "tq/common.hpp"
#include "tq/core/parsed_task.hpp"

namespace tq::parser {

/**
 * @brief Quick-add parser turning one line of text into a ParsedTask
 *
 * Supports input such as:
 * - "Call mom tomorrow at 5pm" -> due date with clock time
 * - "Team sync every monday at 9am remind me 15 min before" -> recurrence and reminder
 * - "Buy milk #errands @Home ~30m" -> tags, folder and effort
 * - "Finish deck asap" -> priority
 *
 * Stages run in a fixed order over a shrinking buffer: quick-syntax
 * markers, reminder phrase, recurrence, relative time, date, clock time,
 * reminder arithmetic, priority and location. Parsing never fails; text
 * that matches nothing, or exceeds kMaxInputLength, comes back as the
 * trimmed input.
 */
class TaskParser {
public:
  // Longer input is returned as plain text without running any stage
  static constexpr std::size_t kMaxInputLength = 2000;

  // Parse against the current local wall-clock time
  static core::ParsedTask parse(const std::string& text);

  /**
   * @brief Parse against an explicit reference instant
   * @param text One line of task text
   * @param now Reference instant shared by every stage of this call
   */
  static core::ParsedTask parse(const std::string& text, DateTime now);

  /**
   * @brief Cheap check for "does this text contain anything to extract"
   *
   * Tests the same triggers the stages use, without running interpreters
   * or building a result.
   */
  static bool looksParseable(const std::string& text);
};

}  // namespace tq::parser

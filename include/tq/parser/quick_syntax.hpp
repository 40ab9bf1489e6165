#pragma once

#include <optional>
#include <string>
#include <vector>

#include "tq/parser/pattern_table.hpp"

namespace tq::parser {

/**
 * @brief Marker-driven extractors that run before the grammar stages
 *
 * Supports:
 * - "Plan trip // book flights first" -> description
 * - "~1h30m", "est: 45m", "effort: 2 hours" -> estimated hours
 * - "#errands #\"home office\"" -> tags
 * - "@work", "@\"side project\"" -> folder
 */
class QuickSyntax {
public:
  // Trailing " // text", " -- text" or " | text"
  static std::optional<Extraction<std::string>> description(const std::string& buffer);

  // Effort marker converted to fractional hours
  static std::optional<Extraction<double>> effort(const std::string& buffer);

  // Every tag marker in the buffer; one span per marker
  static std::optional<Extraction<std::vector<std::string>>> tags(const std::string& buffer);

  static std::optional<Extraction<std::string>> folder(const std::string& buffer);

  // True if any marker above would fire on `text`
  static bool detect(const std::string& text);
};

}  // namespace tq::parser

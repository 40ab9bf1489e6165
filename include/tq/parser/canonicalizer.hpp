#pragma once

#include <string>

namespace tq::parser {

/**
 * @brief Title cleanup after all extraction stages ran
 *
 * Collapses whitespace, trims stray commas and drops connective words
 * ("at", "on", "by", "in", "every", "due", "for") left dangling at either
 * end of the text. A connective that was already at that end of `original`
 * belongs to the title and is kept: input "Check in" stays "Check in".
 */
class Canonicalizer {
public:
  static std::string canonicalize(const std::string& text, const std::string& original = "");

  static std::string collapseWhitespace(const std::string& text);
};

}  // namespace tq::parser

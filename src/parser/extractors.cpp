#include "tq/parser/extractors.hpp"

#include <regex>

namespace tq::parser {

namespace {

// Extends a date span backwards over a directly preceding "due"/"by"
void absorbDueWord(const std::string& buffer, Extraction<DateTime>& extraction) {
  static const std::regex due_regex(R"(\b(?:due|by)$)",
                                    std::regex::ECMAScript | std::regex::icase);

  Span& span = extraction.spans.front();
  std::string before = buffer.substr(0, span.position);
  auto last = before.find_last_not_of(" \t");
  if (last == std::string::npos) {
    return;
  }
  before.erase(last + 1);

  std::smatch match;
  if (!std::regex_search(before, match, due_regex)) {
    return;
  }

  const auto start = static_cast<std::size_t>(match.position(0));
  const std::size_t end = span.position + span.length;
  span = Span{start, end - start};
  extraction.matched = buffer.substr(start, end - start);
}

}  // namespace

std::optional<Extraction<core::ReminderOffset>> Extractors::reminderOffset(
    const std::string& buffer, DateTime now) {
  return firstMatch(PatternTables::reminderOffsets(), buffer, now);
}

std::optional<Extraction<AdvancedRecurrence>> Extractors::advancedRecurrence(
    const std::string& buffer, DateTime now) {
  return firstMatch(PatternTables::advancedRecurrences(), buffer, now);
}

std::optional<Extraction<Recurrence>> Extractors::recurrence(const std::string& buffer,
                                                             DateTime now) {
  return firstMatch(PatternTables::recurrences(), buffer, now);
}

std::optional<Extraction<DateTime>> Extractors::relativeTime(const std::string& buffer,
                                                             DateTime now) {
  return firstMatch(PatternTables::relativeTimes(), buffer, now);
}

std::optional<Extraction<DateTime>> Extractors::date(const std::string& buffer, DateTime now) {
  auto extraction = firstMatch(PatternTables::dates(), buffer, now);
  if (extraction) {
    absorbDueWord(buffer, *extraction);
  }
  return extraction;
}

std::optional<Extraction<ClockTime>> Extractors::clockTime(const std::string& buffer,
                                                           DateTime now) {
  return firstMatch(PatternTables::clockTimes(), buffer, now);
}

std::optional<Extraction<core::Priority>> Extractors::priority(const std::string& buffer,
                                                               DateTime now) {
  return firstMatch(PatternTables::priorities(), buffer, now);
}

std::optional<Extraction<std::string>> Extractors::location(const std::string& buffer,
                                                            DateTime now) {
  return firstMatch(PatternTables::locations(), buffer, now);
}

}  // namespace tq::parser

#include "tq/parser/task_parser.hpp"

#include <algorithm>
#include <array>

#include <spdlog/spdlog.h>

#include "tq/parser/canonicalizer.hpp"
#include "tq/parser/extractors.hpp"
#include "tq/parser/pattern_table.hpp"
#include "tq/parser/quick_syntax.hpp"
#include "tq/util/time.hpp"

namespace tq::parser {

using core::ParsedTask;
using util::Time;

namespace {

// Accumulator threaded through the stages
struct ParseState {
  std::string input;   // Trimmed original text, never modified
  std::string buffer;  // Text not yet claimed by a stage
  DateTime now;
  ParsedTask task;

  bool reminder_phrase = false;
  bool advanced_recurrence = false;
  bool recurrence_pinned = false;  // A recurrence fixed due_date to its first occurrence
  bool relative_time = false;
  bool clock_time = false;
};

using Stage = ParseState (*)(ParseState);

struct NamedStage {
  const char* name;
  Stage run;
};

std::string trim(const std::string& str) {
  auto first = str.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  auto last = str.find_last_not_of(" \t\r\n");
  return str.substr(first, last - first + 1);
}

// Spans are erased back to front so earlier offsets stay valid. Each one
// leaves a space behind to keep neighbouring words apart.
std::string removeSpans(std::string buffer, std::vector<Span> spans) {
  std::sort(spans.begin(), spans.end(),
            [](const Span& a, const Span& b) { return a.position > b.position; });
  for (const auto& span : spans) {
    if (span.position >= buffer.size()) {
      continue;
    }
    const std::size_t length = std::min(span.length, buffer.size() - span.position);
    buffer.replace(span.position, length, " ");
  }
  return buffer;
}

template <typename T>
void consume(ParseState& state, const Extraction<T>& extraction, const char* stage) {
  spdlog::debug("{}: matched '{}' via {}", stage, extraction.matched, extraction.rule);
  state.buffer = removeSpans(std::move(state.buffer), extraction.spans);
}

ParseState extractDescription(ParseState state) {
  if (auto found = QuickSyntax::description(state.buffer)) {
    state.task.description = found->value;
    consume(state, *found, "description");
  }
  return state;
}

ParseState extractEffort(ParseState state) {
  if (auto found = QuickSyntax::effort(state.buffer)) {
    state.task.estimated_hours = found->value;
    consume(state, *found, "effort");
  }
  return state;
}

ParseState extractTags(ParseState state) {
  if (auto found = QuickSyntax::tags(state.buffer)) {
    state.task.tags = found->value;
    consume(state, *found, "tags");
  }
  return state;
}

ParseState extractFolder(ParseState state) {
  if (auto found = QuickSyntax::folder(state.buffer)) {
    state.task.folder_name = found->value;
    consume(state, *found, "folder");
  }
  return state;
}

ParseState extractReminderPhrase(ParseState state) {
  if (auto found = Extractors::reminderOffset(state.buffer, state.now)) {
    state.task.reminder_offset = found->value;
    state.reminder_phrase = true;
    consume(state, *found, "reminder");
  }
  return state;
}

ParseState extractAdvancedRecurrence(ParseState state) {
  if (auto found = Extractors::advancedRecurrence(state.buffer, state.now)) {
    state.task.advanced_repeat = found->value.pattern;
    state.task.repeat_type = found->value.pattern.frequency;
    if (found->value.first_occurrence) {
      state.task.due_date = found->value.first_occurrence;
      state.recurrence_pinned = true;
    }
    state.advanced_recurrence = true;
    consume(state, *found, "advanced-recurrence");
  }
  return state;
}

ParseState extractRecurrence(ParseState state) {
  if (state.advanced_recurrence) {
    return state;
  }
  if (auto found = Extractors::recurrence(state.buffer, state.now)) {
    state.task.repeat_type = found->value.type;
    if (found->value.type == core::RepeatType::kCustom) {
      state.task.repeat_days = found->value.days;
    }
    if (found->value.first_occurrence) {
      state.task.due_date = found->value.first_occurrence;
      state.recurrence_pinned = true;
    }
    consume(state, *found, "recurrence");
  }
  return state;
}

ParseState extractRelativeTime(ParseState state) {
  if (auto found = Extractors::relativeTime(state.buffer, state.now)) {
    state.task.due_date = found->value;
    state.task.reminder_time = found->value;
    if (!state.task.reminder_offset) {
      state.task.reminder_offset = core::ReminderOffset::kExact;
    }
    state.relative_time = true;
    consume(state, *found, "relative-time");
  }
  return state;
}

ParseState extractDate(ParseState state) {
  if (state.relative_time || state.recurrence_pinned) {
    return state;
  }
  if (auto found = Extractors::date(state.buffer, state.now)) {
    state.task.due_date = found->value;
    consume(state, *found, "date");
  }
  return state;
}

// Scans the untouched input: a time phrase may sit next to a date phrase
// that an earlier stage already cut out of the buffer.
ParseState extractClockTime(ParseState state) {
  auto found = Extractors::clockTime(state.input, state.now);
  if (!found) {
    return state;
  }

  const DateTime base = state.task.due_date.value_or(Time::startOfDay(state.now));
  state.task.due_date = Time::withTime(base, found->value.hours, found->value.minutes);
  if (!state.task.reminder_offset) {
    state.task.reminder_offset = core::ReminderOffset::kExact;
  }
  state.clock_time = true;

  spdlog::debug("clock-time: matched '{}' via {}", found->matched, found->rule);
  auto position = state.buffer.find(found->matched);
  if (position != std::string::npos) {
    state.buffer = removeSpans(std::move(state.buffer), {Span{position, found->matched.size()}});
  }
  return state;
}

ParseState applyReminderOffset(ParseState state) {
  const bool timed = state.clock_time || state.relative_time || state.reminder_phrase;
  if (state.task.due_date && state.task.reminder_offset && timed) {
    state.task.reminder_time =
        *state.task.due_date -
        std::chrono::minutes{core::offsetMinutes(*state.task.reminder_offset)};
  }
  return state;
}

ParseState extractPriority(ParseState state) {
  if (auto found = Extractors::priority(state.buffer, state.now)) {
    state.task.priority = found->value;
    consume(state, *found, "priority");
  }
  return state;
}

ParseState extractLocation(ParseState state) {
  if (auto found = Extractors::location(state.buffer, state.now)) {
    state.task.location = found->value;
    consume(state, *found, "location");
  }
  return state;
}

constexpr std::array<NamedStage, 13> kStages = {{
    {"description", extractDescription},
    {"effort", extractEffort},
    {"tags", extractTags},
    {"folder", extractFolder},
    {"reminder", extractReminderPhrase},
    {"advanced-recurrence", extractAdvancedRecurrence},
    {"recurrence", extractRecurrence},
    {"relative-time", extractRelativeTime},
    {"date", extractDate},
    {"clock-time", extractClockTime},
    {"reminder-offset", applyReminderOffset},
    {"priority", extractPriority},
    {"location", extractLocation},
}};

ParsedTask finalize(ParseState state) {
  ParsedTask task = std::move(state.task);

  // A reminder is only meaningful relative to a due moment
  if (!task.due_date) {
    task.reminder_offset.reset();
    task.reminder_time.reset();
  }

  task.text = Canonicalizer::canonicalize(state.buffer, state.input);
  if (task.text.empty()) {
    task.text = state.input;
  }
  return task;
}

}  // namespace

ParsedTask TaskParser::parse(const std::string& text) {
  return parse(text, Time::now());
}

ParsedTask TaskParser::parse(const std::string& text, DateTime now) {
  ParseState state;
  state.input = trim(text);
  state.buffer = state.input;
  state.now = now;

  if (state.input.empty()) {
    return ParsedTask{};
  }
  if (state.input.size() > kMaxInputLength) {
    spdlog::debug("Input of {} characters left unparsed", state.input.size());
    ParsedTask plain;
    plain.text = state.input;
    return plain;
  }

  const std::string input = state.input;
  try {
    for (const auto& stage : kStages) {
      spdlog::trace("stage {}: '{}'", stage.name, state.buffer);
      state = stage.run(std::move(state));
    }
  } catch (const std::exception& e) {
    // std::regex can give up on pathological input; keep the text as-is
    spdlog::warn("Parse of '{}' abandoned: {}", input, e.what());
    ParsedTask fallback;
    fallback.text = input;
    return fallback;
  }

  ParsedTask task = finalize(std::move(state));
  if (spdlog::should_log(spdlog::level::trace)) {
    spdlog::trace("parsed: {}", core::toJson(task).dump());
  }
  return task;
}

bool TaskParser::looksParseable(const std::string& text) {
  if (text.empty() || text.size() > kMaxInputLength) {
    return false;
  }

  try {
    return QuickSyntax::detect(text) ||
           anyTrigger(PatternTables::reminderOffsets(), text) ||
           anyTrigger(PatternTables::advancedRecurrences(), text) ||
           anyTrigger(PatternTables::recurrences(), text) ||
           anyTrigger(PatternTables::relativeTimes(), text) ||
           anyTrigger(PatternTables::dates(), text) ||
           anyTrigger(PatternTables::clockTimes(), text) ||
           anyTrigger(PatternTables::priorities(), text) ||
           anyTrigger(PatternTables::locations(), text);
  } catch (const std::exception& e) {
    spdlog::warn("Parseability check of '{}' abandoned: {}", text, e.what());
    return false;
  }
}

}  // namespace tq::parser

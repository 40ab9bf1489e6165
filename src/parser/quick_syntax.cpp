#include "tq/parser/quick_syntax.hpp"

#include <algorithm>
#include <charconv>
#include <regex>

namespace tq::parser {

namespace {

constexpr auto kIgnoreCase = std::regex::ECMAScript | std::regex::icase;

const std::regex& descriptionRegex() {
  static const std::regex regex(R"(\s+(?://|--|\|)\s+(.+)$)");
  return regex;
}

const std::regex& effortHoursRegex() {
  static const std::regex regex(
      R"((?:~|est(?:imate)?:|effort:)\s*(\d+(?:\.\d+)?)\s*h(?:ours?|rs?)?\s*(?:(\d+)\s*m(?:in(?:ute)?s?)?)?)",
      kIgnoreCase);
  return regex;
}

const std::regex& effortMinutesRegex() {
  static const std::regex regex(R"((?:~|est(?:imate)?:|effort:)\s*(\d+)\s*m(?:in(?:ute)?s?)?)",
                                kIgnoreCase);
  return regex;
}

const std::regex& quotedTagRegex() {
  static const std::regex regex(R"x(#"([^"]+)")x");
  return regex;
}

const std::regex& tagRegex() {
  static const std::regex regex(R"(#(\w(?:\w|-)*))");
  return regex;
}

const std::regex& quotedFolderRegex() {
  static const std::regex regex(R"x(@"([^"]+)")x");
  return regex;
}

const std::regex& folderRegex() {
  static const std::regex regex(R"(@(\w(?:\w|-)*))");
  return regex;
}

std::string trim(const std::string& str) {
  auto first = str.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  auto last = str.find_last_not_of(" \t\r\n");
  return str.substr(first, last - first + 1);
}

std::optional<double> toDouble(const std::ssub_match& sub) {
  if (!sub.matched) {
    return std::nullopt;
  }
  const std::string digits = sub.str();
  double value = 0.0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return value;
}

Span spanOf(const std::smatch& match) {
  return Span{static_cast<std::size_t>(match.position(0)),
              static_cast<std::size_t>(match.length(0))};
}

bool overlaps(const Span& a, const Span& b) {
  return a.position < b.position + b.length && b.position < a.position + a.length;
}

// Quoted form first so "@\"side project\"" is never read as "@side"
std::optional<Extraction<std::string>> firstMarker(const std::string& buffer,
                                                   const std::regex& quoted,
                                                   const std::regex& bare,
                                                   const std::string& rule) {
  for (const auto* regex : {&quoted, &bare}) {
    std::smatch match;
    if (!std::regex_search(buffer, match, *regex)) {
      continue;
    }
    std::string value = trim(match[1].str());
    if (value.empty()) {
      continue;
    }
    return Extraction<std::string>{value, match.str(0), {spanOf(match)},
                                   regex == &quoted ? rule + "-quoted" : rule};
  }
  return std::nullopt;
}

}  // namespace

std::optional<Extraction<std::string>> QuickSyntax::description(const std::string& buffer) {
  std::smatch match;
  if (!std::regex_search(buffer, match, descriptionRegex())) {
    return std::nullopt;
  }

  std::string text = trim(match[1].str());
  if (text.empty()) {
    return std::nullopt;
  }
  return Extraction<std::string>{text, match.str(0), {spanOf(match)}, "description"};
}

std::optional<Extraction<double>> QuickSyntax::effort(const std::string& buffer) {
  std::smatch match;
  if (std::regex_search(buffer, match, effortHoursRegex())) {
    auto hours = toDouble(match[1]);
    if (hours) {
      if (match[2].matched) {
        auto minutes = toDouble(match[2]);
        *hours += minutes.value_or(0.0) / 60.0;
      }
      return Extraction<double>{*hours, match.str(0), {spanOf(match)}, "effort-hours"};
    }
  }

  if (std::regex_search(buffer, match, effortMinutesRegex())) {
    auto minutes = toDouble(match[1]);
    if (minutes) {
      return Extraction<double>{*minutes / 60.0, match.str(0), {spanOf(match)},
                                "effort-minutes"};
    }
  }

  return std::nullopt;
}

std::optional<Extraction<std::vector<std::string>>> QuickSyntax::tags(const std::string& buffer) {
  struct Found {
    Span span;
    std::string tag;
    std::string text;
  };
  std::vector<Found> found;

  for (auto it = std::sregex_iterator(buffer.begin(), buffer.end(), quotedTagRegex());
       it != std::sregex_iterator(); ++it) {
    std::string tag = trim((*it)[1].str());
    if (!tag.empty()) {
      found.push_back({spanOf(*it), tag, it->str()});
    }
  }

  const std::size_t quoted_count = found.size();
  for (auto it = std::sregex_iterator(buffer.begin(), buffer.end(), tagRegex());
       it != std::sregex_iterator(); ++it) {
    const Span span = spanOf(*it);
    bool inside_quoted = std::any_of(found.begin(), found.begin() + quoted_count,
                                     [&](const Found& q) { return overlaps(q.span, span); });
    if (!inside_quoted) {
      found.push_back({span, (*it)[1].str(), it->str()});
    }
  }

  if (found.empty()) {
    return std::nullopt;
  }

  std::sort(found.begin(), found.end(),
            [](const Found& a, const Found& b) { return a.span.position < b.span.position; });

  Extraction<std::vector<std::string>> result{{}, "", {}, "tags"};
  for (const auto& f : found) {
    if (std::find(result.value.begin(), result.value.end(), f.tag) == result.value.end()) {
      result.value.push_back(f.tag);
    }
    if (!result.matched.empty()) {
      result.matched += ' ';
    }
    result.matched += f.text;
    result.spans.push_back(f.span);
  }
  return result;
}

std::optional<Extraction<std::string>> QuickSyntax::folder(const std::string& buffer) {
  return firstMarker(buffer, quotedFolderRegex(), folderRegex(), "folder");
}

bool QuickSyntax::detect(const std::string& text) {
  for (const auto* regex : {&descriptionRegex(), &effortHoursRegex(), &effortMinutesRegex(),
                            &quotedTagRegex(), &tagRegex(), &quotedFolderRegex(),
                            &folderRegex()}) {
    if (std::regex_search(text, *regex)) {
      return true;
    }
  }
  return false;
}

}  // namespace tq::parser

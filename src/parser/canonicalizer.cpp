#include "tq/parser/canonicalizer.hpp"

#include <cctype>
#include <regex>

namespace tq::parser {

namespace {

constexpr auto kIgnoreCase = std::regex::ECMAScript | std::regex::icase;

const std::regex& leadingConnective() {
  static const std::regex regex(R"(^(?:at|on|by|in|every|due|for)(?:\s+|$))", kIgnoreCase);
  return regex;
}

const std::regex& trailingConnective() {
  static const std::regex regex(R"((?:^|\s+)(?:at|on|by|in|every|due|for)$)", kIgnoreCase);
  return regex;
}

bool startsWith(const std::string& str, const std::string& prefix) {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& str, const std::string& suffix) {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string trimCommas(const std::string& text) {
  auto first = text.find_first_not_of(" ,");
  if (first == std::string::npos) {
    return "";
  }
  auto last = text.find_last_not_of(" ,");
  return text.substr(first, last - first + 1);
}

}  // namespace

std::string Canonicalizer::collapseWhitespace(const std::string& text) {
  std::string result;
  result.reserve(text.size());

  bool pending_space = false;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = !result.empty();
      continue;
    }
    if (pending_space) {
      result += ' ';
      pending_space = false;
    }
    result += c;
  }
  return result;
}

std::string Canonicalizer::canonicalize(const std::string& text, const std::string& original) {
  const std::string reference = collapseWhitespace(original);
  std::string result = trimCommas(collapseWhitespace(text));

  bool changed = true;
  while (changed && !result.empty()) {
    changed = false;
    std::smatch match;

    if (!startsWith(reference, result) &&
        std::regex_search(result, match, leadingConnective())) {
      result = trimCommas(result.substr(static_cast<std::size_t>(match.length(0))));
      changed = true;
      continue;
    }

    if (!endsWith(reference, result) &&
        std::regex_search(result, match, trailingConnective())) {
      result = trimCommas(result.substr(0, static_cast<std::size_t>(match.position(0))));
      changed = true;
    }
  }

  return result;
}

}  // namespace tq::parser

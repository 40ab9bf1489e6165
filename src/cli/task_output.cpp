#include "tq/cli/task_output.hpp"

#include <iomanip>
#include <sstream>

#include "tq/parser/result_formatter.hpp"
#include "tq/util/time.hpp"

namespace tq::cli {

namespace {

// "2024-01-02T17:00:00" -> "2024-01-02 17:00"
std::string displayTime(DateTime time) {
  std::string iso = util::Time::toIsoString(time);
  iso[10] = ' ';
  return iso.substr(0, 16);
}

std::string joined(const std::vector<std::string>& items) {
  std::string result;
  for (const auto& item : items) {
    if (!result.empty()) result += ", ";
    result += item;
  }
  return result;
}

}  // namespace

std::vector<std::pair<std::string, std::string>> describeTask(const core::ParsedTask& task) {
  std::vector<std::pair<std::string, std::string>> rows;
  rows.emplace_back("text", task.text);

  if (task.due_date) rows.emplace_back("due", displayTime(*task.due_date));
  if (task.reminder_time) rows.emplace_back("reminder", displayTime(*task.reminder_time));
  if (task.reminder_offset) {
    rows.emplace_back("reminder_offset", std::string(core::toString(*task.reminder_offset)));
  }
  if (task.priority) rows.emplace_back("priority", std::string(core::toString(*task.priority)));
  if (task.repeat_type || task.advanced_repeat) {
    std::string label = parser::ResultFormatter::recurrenceLabel(task);
    // Drop the badge icon for plain-text rows
    auto space = label.find(' ');
    rows.emplace_back("repeat", space == std::string::npos ? label : label.substr(space + 1));
  }
  if (task.location) rows.emplace_back("location", *task.location);
  if (task.tags) rows.emplace_back("tags", joined(*task.tags));
  if (task.folder_name) rows.emplace_back("folder", *task.folder_name);
  if (task.estimated_hours) {
    std::ostringstream oss;
    oss << std::setprecision(3) << *task.estimated_hours << "h";
    rows.emplace_back("estimate", oss.str());
  }
  if (task.description) rows.emplace_back("description", *task.description);

  return rows;
}

std::string summarizeTask(const core::ParsedTask& task) {
  auto rows = describeTask(task);
  std::ostringstream oss;
  oss << task.text;
  for (std::size_t i = 1; i < rows.size(); ++i) {
    oss << "  " << rows[i].first << "=" << rows[i].second;
  }
  return oss.str();
}

}  // namespace tq::cli

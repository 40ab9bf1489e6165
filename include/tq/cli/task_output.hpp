#pragma once

#include <string>
#include <utility>
#include <vector>

#include "tq/core/parsed_task.hpp"

namespace tq::cli {

// Label/value rows for the set fields of a task, in display order
std::vector<std::pair<std::string, std::string>> describeTask(const core::ParsedTask& task);

// Same rows as "label=value" pairs on one line, after the title
std::string summarizeTask(const core::ParsedTask& task);

}  // namespace tq::cli

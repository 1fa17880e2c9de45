#pragma once

#include <string>
#include <vector>

#include "plangrid/core/date.hpp"

namespace plangrid::core {

struct Task {
  std::string id{};
  std::string name{};
  std::string category{};
  std::string description{};
  Date start{};
  Date end{};  // inclusive
  int priority = 0;
  std::string status{};
  std::string assignee{};
  std::vector<std::string> dependencies{};  // ids this task waits on
  bool is_milestone = false;
};

// 0 for a single-day task.
inline int duration_days(const Task& task) {
  return days_between(task.start, task.end);
}

inline int span_days(const Task& task) {
  return duration_days(task) + 1;
}

inline bool tasks_overlap(const Task& a, const Task& b) {
  return a.start <= b.end && b.start <= a.end;
}

// Explicit flag, or "MILESTONE" anywhere in the name (case-insensitive).
[[nodiscard]] bool signals_milestone(const Task& task);

}  // namespace plangrid::core

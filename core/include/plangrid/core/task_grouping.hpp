#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "plangrid/core/date.hpp"
#include "plangrid/core/task.hpp"

namespace plangrid::core {

struct TaskGroup {
  std::size_t index = 0;
  // Indices into the task sequence the group was built from.
  std::vector<std::size_t> task_indices{};
  std::vector<std::string> task_ids{};
  Date start{};
  Date end{};
  int required_rows = 0;   // uncapped greedy demand
  int allocated_rows = 0;  // min(required_rows, max rows per day)
  int overflow_count = 0;
};

struct RowSlot {
  std::size_t task_index = 0;
  int row = 0;
  bool overflow = false;
};

struct RowAssignment {
  std::vector<RowSlot> slots{};  // in assignment order
  int required_rows = 0;
  int allocated_rows = 0;
  int overflow_count = 0;

  [[nodiscard]] const RowSlot* find(std::size_t task_index) const;
};

// Partitions tasks into transitive-overlap clusters. Members are ordered by
// start, longer duration first on ties, then input order.
[[nodiscard]] std::vector<TaskGroup> GroupTasks(const std::vector<Task>& tasks);
[[nodiscard]] std::vector<TaskGroup> GroupTasks(
    const std::vector<Task>& tasks,
    const std::vector<std::size_t>& candidate_indices);

// Reorders members for stacking: start, then higher prominence, then longer
// duration, then id. prominence is indexed like tasks.
void SortForStacking(const std::vector<Task>& tasks, const std::vector<double>& prominence, TaskGroup& group);

[[nodiscard]] int CountRequiredRows(const std::vector<Task>& tasks, const TaskGroup& group);

// Greedy lowest-free-row assignment over the group's current order (stable by
// start). Rows beyond max_rows fall back to row 0.
[[nodiscard]] RowAssignment AssignRows(const std::vector<Task>& tasks, const TaskGroup& group, int max_rows);

}  // namespace plangrid::core

#include "plangrid/core/task_grouping.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace plangrid::core {

namespace {

bool starts_before(const Task& a, const Task& b) {
  return a.start < b.start;
}

std::vector<std::size_t> sorted_by_start(const std::vector<Task>& tasks, const std::vector<std::size_t>& indices) {
  std::vector<std::size_t> order = indices;
  std::stable_sort(order.begin(), order.end(), [&tasks](std::size_t a, std::size_t b) {
    return starts_before(tasks[a], tasks[b]);
  });
  return order;
}

// Row end dates are exclusive: the day after the row's last task ends.
int first_free_row(const std::vector<Date>& row_ends, Date start) {
  for (std::size_t row = 0; row < row_ends.size(); ++row) {
    if (row_ends[row] <= start) {
      return static_cast<int>(row);
    }
  }
  return -1;
}

void refresh_ids(const std::vector<Task>& tasks, TaskGroup& group) {
  group.task_ids.clear();
  group.task_ids.reserve(group.task_indices.size());
  for (const std::size_t index : group.task_indices) {
    group.task_ids.push_back(tasks[index].id);
  }
}

}  // namespace

const RowSlot* RowAssignment::find(std::size_t task_index) const {
  for (const RowSlot& slot : slots) {
    if (slot.task_index == task_index) {
      return &slot;
    }
  }
  return nullptr;
}

std::vector<TaskGroup> GroupTasks(const std::vector<Task>& tasks) {
  std::vector<std::size_t> all(tasks.size());
  std::iota(all.begin(), all.end(), std::size_t{0});
  return GroupTasks(tasks, all);
}

std::vector<TaskGroup> GroupTasks(const std::vector<Task>& tasks, const std::vector<std::size_t>& candidate_indices) {
  std::vector<std::size_t> order = candidate_indices;
  std::stable_sort(order.begin(), order.end(), [&tasks](std::size_t a, std::size_t b) {
    const Task& ta = tasks[a];
    const Task& tb = tasks[b];
    if (ta.start != tb.start) {
      return ta.start < tb.start;
    }
    return duration_days(ta) > duration_days(tb);
  });

  std::vector<TaskGroup> groups;
  std::vector<bool> grouped(order.size(), false);
  for (std::size_t seed = 0; seed < order.size(); ++seed) {
    if (grouped[seed]) {
      continue;
    }
    std::vector<std::size_t> members{seed};
    grouped[seed] = true;

    bool absorbed = true;
    while (absorbed) {
      absorbed = false;
      for (std::size_t candidate = seed + 1; candidate < order.size(); ++candidate) {
        if (grouped[candidate]) {
          continue;
        }
        const Task& task = tasks[order[candidate]];
        const bool touches_group = std::any_of(members.begin(), members.end(), [&](std::size_t member) {
          return tasks_overlap(tasks[order[member]], task);
        });
        if (touches_group) {
          members.push_back(candidate);
          grouped[candidate] = true;
          absorbed = true;
        }
      }
    }
    std::sort(members.begin(), members.end());

    TaskGroup group;
    group.index = groups.size();
    group.start = tasks[order[members.front()]].start;
    group.end = tasks[order[members.front()]].end;
    for (const std::size_t member : members) {
      const Task& task = tasks[order[member]];
      group.task_indices.push_back(order[member]);
      group.start = std::min(group.start, task.start);
      group.end = std::max(group.end, task.end);
    }
    refresh_ids(tasks, group);
    group.required_rows = CountRequiredRows(tasks, group);
    group.allocated_rows = group.required_rows;
    groups.push_back(std::move(group));
  }
  return groups;
}

void SortForStacking(const std::vector<Task>& tasks, const std::vector<double>& prominence, TaskGroup& group) {
  std::stable_sort(group.task_indices.begin(), group.task_indices.end(), [&](std::size_t a, std::size_t b) {
    const Task& ta = tasks[a];
    const Task& tb = tasks[b];
    if (ta.start != tb.start) {
      return ta.start < tb.start;
    }
    if (prominence[a] != prominence[b]) {
      return prominence[a] > prominence[b];
    }
    if (duration_days(ta) != duration_days(tb)) {
      return duration_days(ta) > duration_days(tb);
    }
    return ta.id < tb.id;
  });
  refresh_ids(tasks, group);
}

int CountRequiredRows(const std::vector<Task>& tasks, const TaskGroup& group) {
  std::vector<Date> row_ends;
  for (const std::size_t index : sorted_by_start(tasks, group.task_indices)) {
    const Task& task = tasks[index];
    const int row = first_free_row(row_ends, task.start);
    if (row < 0) {
      row_ends.push_back(add_days(task.end, 1));
    } else {
      row_ends[static_cast<std::size_t>(row)] = add_days(task.end, 1);
    }
  }
  return static_cast<int>(row_ends.size());
}

RowAssignment AssignRows(const std::vector<Task>& tasks, const TaskGroup& group, int max_rows) {
  RowAssignment result;
  const std::size_t cap = static_cast<std::size_t>(std::max(1, max_rows));
  std::vector<Date> row_ends;

  for (const std::size_t index : sorted_by_start(tasks, group.task_indices)) {
    const Task& task = tasks[index];
    const Date exclusive_end = add_days(task.end, 1);
    RowSlot slot;
    slot.task_index = index;

    const int free_row = first_free_row(row_ends, task.start);
    if (free_row >= 0) {
      slot.row = free_row;
      row_ends[static_cast<std::size_t>(free_row)] = exclusive_end;
    } else if (row_ends.size() < cap) {
      slot.row = static_cast<int>(row_ends.size());
      row_ends.push_back(exclusive_end);
    } else {
      // Capacity exhausted: share row 0 instead of dropping the task.
      slot.row = 0;
      slot.overflow = true;
      row_ends[0] = std::max(row_ends[0], exclusive_end);
      ++result.overflow_count;
    }
    result.slots.push_back(slot);
  }

  result.required_rows = CountRequiredRows(tasks, group);
  result.allocated_rows = static_cast<int>(row_ends.size());
  return result;
}

}  // namespace plangrid::core

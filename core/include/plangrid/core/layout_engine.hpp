#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "plangrid/core/grid_config.hpp"
#include "plangrid/core/layout_registry.hpp"
#include "plangrid/core/overlap_analysis.hpp"
#include "plangrid/core/task.hpp"
#include "plangrid/core/task_bar.hpp"
#include "plangrid/core/task_grouping.hpp"

namespace plangrid::core {

struct LayoutStatistics {
  std::size_t task_count = 0;
  std::size_t bar_count = 0;
  std::size_t group_count = 0;
  double average_bar_height = 0.0;
  double max_bar_height = 0.0;
  double average_bar_width = 0.0;
  double max_bar_width = 0.0;
  double average_stack_height = 0.0;
  double max_stack_height = 0.0;
  std::size_t resolved_conflicts = 0;
  std::size_t spacing_adjustments = 0;
  std::size_t overflow_task_count = 0;
  std::size_t month_boundary_count = 0;
  std::size_t residual_collision_count = 0;
  double space_efficiency = 0.0;
  double alignment_score = 0.0;
  double visual_balance = 0.0;
  double grid_utilization = 0.0;
};

struct ResidualCollision {
  std::string task_a_id{};
  std::string task_b_id{};
};

struct LayoutResult {
  std::vector<TaskBar> bars{};
  std::vector<TaskGroup> groups{};
  OverlapAnalysis overlaps{};
  LayoutStatistics statistics{};
  std::vector<std::string> recommendations{};
  std::vector<std::string> skipped_task_ids{};
  std::vector<ResidualCollision> residual_collisions{};

  [[nodiscard]] std::vector<const TaskBar*> BarsForTask(std::string_view task_id) const;
  [[nodiscard]] std::vector<const TaskBar*> BarsForMonth(int year, unsigned month) const;
  [[nodiscard]] const TaskGroup* FindGroupForTask(std::string_view task_id) const;
};

class LayoutEngine {
 public:
  LayoutEngine();
  explicit LayoutEngine(LayoutRegistry registry);

  [[nodiscard]] const LayoutRegistry& registry() const { return registry_; }

  // Fails only on an invalid config; overcrowding is reported in the result.
  [[nodiscard]] RunResult<LayoutResult> Run(const std::vector<Task>& tasks, const GridConfig& config) const;

  [[nodiscard]] LayoutStatistics ComputeStatistics(const LayoutResult& result, const GridConfig& config) const;
  [[nodiscard]] std::vector<std::string> BuildRecommendations(const LayoutResult& result, const GridConfig& config) const;

 private:
  LayoutRegistry registry_{};
};

// Two-month dissertation planner sample used by the inspector and tests.
[[nodiscard]] std::vector<Task> make_demo_tasks(int year);

}  // namespace plangrid::core

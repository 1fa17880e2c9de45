#include "plangrid/core/layout_engine.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

#include "plangrid/core/month_segmentation.hpp"
#include "plangrid/core/priority_scoring.hpp"
#include "plangrid/core/spatial_positioning.hpp"

namespace plangrid::core {

namespace {

constexpr double kSpaceEfficiencyFloor = 0.7;
constexpr double kAlignmentFloor = 0.8;
constexpr double kVisualBalanceFloor = 0.6;
constexpr double kStackHeightDayFactor = 2.0;
constexpr std::size_t kMaxUtilizationCells = 4'000'000;

double distance_to_grid(double value, double resolution) {
  if (resolution <= 0.0) {
    return 0.0;
  }
  return std::abs(value - std::round(value / resolution) * resolution);
}

double available_width(const GridConfig& config) {
  return static_cast<double>(calendar_day_count(config)) * config.day_width;
}

double available_height(const GridConfig& config) {
  return static_cast<double>(config.max_rows_per_day) * config.row_height;
}

double grid_utilization(const std::vector<TaskBar>& bars, const GridConfig& config) {
  const double width = available_width(config);
  const double height = available_height(config);
  if (!std::isfinite(width) || !std::isfinite(height)) {
    return 0.0;
  }
  double cell = config.grid_resolution;
  // Counted in double so oversized extents coarsen the cell before any integer cast.
  auto cell_count = [&](double extent) { return std::max(1.0, std::ceil(extent / cell)); };
  while (cell_count(width) * cell_count(height) > static_cast<double>(kMaxUtilizationCells)) {
    cell *= 2.0;
  }
  const auto columns = static_cast<std::size_t>(cell_count(width));
  const auto rows = static_cast<std::size_t>(cell_count(height));
  std::vector<bool> covered(columns * rows, false);

  auto clamp_index = [](double value, std::size_t limit) {
    return static_cast<std::size_t>(std::clamp(value, 0.0, static_cast<double>(limit)));
  };
  for (const TaskBar& bar : bars) {
    const std::size_t col_begin = clamp_index(std::floor(bar.bounds.x / cell), columns);
    const std::size_t col_end = clamp_index(std::ceil(bar.bounds.right() / cell), columns);
    const std::size_t row_begin = clamp_index(std::floor(bar.bounds.y / cell), rows);
    const std::size_t row_end = clamp_index(std::ceil(bar.bounds.bottom() / cell), rows);
    for (std::size_t row = row_begin; row < row_end; ++row) {
      for (std::size_t col = col_begin; col < col_end; ++col) {
        covered[row * columns + col] = true;
      }
    }
  }
  const auto used = static_cast<double>(std::count(covered.begin(), covered.end(), true));
  return used / static_cast<double>(covered.size());
}

// A segmented task spreads its visual weight over its segments by width.
double visual_balance(const std::vector<TaskBar>& bars, const GridConfig& config) {
  std::map<std::string, double> task_width;
  for (const TaskBar& bar : bars) {
    task_width[bar.task_id] += bar.bounds.width;
  }
  std::vector<double> weights;
  weights.reserve(bars.size());
  double total_weight = 0.0;
  for (const TaskBar& bar : bars) {
    const double width = task_width[bar.task_id];
    const double share =
        width > 0.0 ? bar.bounds.width / width : 1.0 / static_cast<double>(std::max(1, bar.segment_count));
    weights.push_back(bar.visual_weight * share);
    total_weight += weights.back();
  }
  Vec2d centroid{};
  for (std::size_t i = 0; i < bars.size(); ++i) {
    const double weight =
        total_weight > 0.0 ? weights[i] / total_weight : 1.0 / static_cast<double>(bars.size());
    const Vec2d center = bars[i].bounds.center();
    centroid.x += center.x * weight;
    centroid.y += center.y * weight;
  }
  const Vec2d grid_center{available_width(config) * 0.5, available_height(config) * 0.5};
  const Vec2d offset = centroid - grid_center;
  const double half_diagonal = std::hypot(grid_center.x, grid_center.y);
  if (half_diagonal <= 0.0) {
    return 0.0;
  }
  return std::clamp(1.0 - std::hypot(offset.x, offset.y) / half_diagonal, 0.0, 1.0);
}

void sort_for_output(std::vector<TaskBar>& bars) {
  std::stable_sort(bars.begin(), bars.end(), [](const TaskBar& a, const TaskBar& b) {
    if (a.start != b.start) {
      return a.start < b.start;
    }
    if (a.row != b.row) {
      return a.row < b.row;
    }
    if (a.task_id != b.task_id) {
      return a.task_id < b.task_id;
    }
    return a.segment_index < b.segment_index;
  });
}

}  // namespace

std::vector<const TaskBar*> LayoutResult::BarsForTask(std::string_view task_id) const {
  std::vector<const TaskBar*> result;
  for (const TaskBar& bar : bars) {
    if (bar.task_id == task_id) {
      result.push_back(&bar);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const TaskBar* a, const TaskBar* b) { return a->segment_index < b->segment_index; });
  return result;
}

std::vector<const TaskBar*> LayoutResult::BarsForMonth(int year, unsigned month) const {
  const MonthKey key{year, month};
  std::vector<const TaskBar*> result;
  for (const TaskBar& bar : bars) {
    if (bar.month == key) {
      result.push_back(&bar);
    }
  }
  return result;
}

const TaskGroup* LayoutResult::FindGroupForTask(std::string_view task_id) const {
  for (const TaskGroup& group : groups) {
    if (std::find(group.task_ids.begin(), group.task_ids.end(), task_id) != group.task_ids.end()) {
      return &group;
    }
  }
  return nullptr;
}

LayoutEngine::LayoutEngine() : registry_(make_default_registry()) {}

LayoutEngine::LayoutEngine(LayoutRegistry registry) : registry_(std::move(registry)) {}

RunResult<LayoutResult> LayoutEngine::Run(const std::vector<Task>& tasks, const GridConfig& config) const {
  RunResult<LayoutResult> result;
  result.validation = ValidateGridConfig(config);
  if (!result.validation.ok()) {
    result.error = "Invalid grid config: " + result.validation.error_summary();
    spdlog::warn("[layout] {}", result.error);
    return result;
  }

  LayoutResult layout;
  std::vector<std::size_t> candidates;
  candidates.reserve(tasks.size());
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    const Task& task = tasks[i];
    if (task.end < task.start) {
      spdlog::warn("[layout] skipping task {}: end {} is before start {}", task.id, format_iso_date(task.end),
                   format_iso_date(task.start));
      layout.skipped_task_ids.push_back(task.id);
      continue;
    }
    if (task.end < config.calendar_start || task.start > config.calendar_end) {
      spdlog::debug("[layout] task {} lies outside the calendar range", task.id);
      layout.skipped_task_ids.push_back(task.id);
      continue;
    }
    candidates.push_back(i);
  }

  const PriorityScorer scorer(registry_.categories, registry_.ranking_weights);
  std::vector<TaskRanking> rankings(tasks.size());
  std::vector<double> prominence(tasks.size(), 0.0);
  for (const std::size_t index : candidates) {
    rankings[index] = scorer.Rank(tasks[index], config.current_date);
    prominence[index] = rankings[index].prominence;
  }

  layout.groups = GroupTasks(tasks, candidates);
  spdlog::debug("[grouping] {} tasks in {} groups", candidates.size(), layout.groups.size());

  const SpatialPositioner positioner(registry_, config);
  std::vector<TaskBar> bars;
  bars.reserve(candidates.size());
  for (TaskGroup& group : layout.groups) {
    SortForStacking(tasks, prominence, group);
    const RowAssignment rows = AssignRows(tasks, group, config.max_rows_per_day);
    group.required_rows = rows.required_rows;
    group.allocated_rows = rows.allocated_rows;
    group.overflow_count = rows.overflow_count;
    if (rows.overflow_count > 0) {
      spdlog::warn("[grouping] group {} needs {} rows, {} task(s) stacked on row 0", group.index,
                   rows.required_rows, rows.overflow_count);
    }

    for (std::size_t stack = 0; stack < group.task_indices.size(); ++stack) {
      const std::size_t index = group.task_indices[stack];
      const RowSlot* slot = rows.find(index);
      BarPlacement placement;
      placement.task = &tasks[index];
      placement.ranking = rankings[index];
      placement.row = slot == nullptr ? 0 : slot->row;
      placement.stack_index = static_cast<int>(stack);
      placement.group_index = group.index;
      bars.push_back(positioner.CreateBar(placement));
    }
  }

  const OverlapAnalyzer analyzer(config.overlap_threshold_hours, registry_, config.current_date);
  layout.overlaps = analyzer.Analyze(tasks, layout.groups);

  const std::size_t spacing_adjustments = positioner.ApplySpacing(bars);
  if (config.snap_to_grid) {
    positioner.SnapToGrid(bars);
  }
  const std::size_t resolved = positioner.ResolveCollisions(bars);

  layout.bars = SegmentBars(bars, config);
  sort_for_output(layout.bars);
  for (const CollisionPair& pair : FindCollisions(layout.bars)) {
    layout.residual_collisions.push_back({layout.bars[pair.first].task_id, layout.bars[pair.second].task_id});
  }

  layout.statistics = ComputeStatistics(layout, config);
  layout.statistics.resolved_conflicts = resolved;
  layout.statistics.spacing_adjustments = spacing_adjustments;
  layout.recommendations = BuildRecommendations(layout, config);

  spdlog::info("[layout] {} tasks -> {} bars, {} groups, {} overlaps, {} collisions resolved",
               layout.statistics.task_count, layout.statistics.bar_count, layout.statistics.group_count,
               layout.overlaps.total_overlaps, resolved);

  result.ok = true;
  result.value = std::move(layout);
  return result;
}

LayoutStatistics LayoutEngine::ComputeStatistics(const LayoutResult& result, const GridConfig& config) const {
  LayoutStatistics stats;
  stats.bar_count = result.bars.size();
  stats.group_count = result.groups.size();
  for (const TaskGroup& group : result.groups) {
    stats.task_count += group.task_indices.size();
    stats.overflow_task_count += static_cast<std::size_t>(group.overflow_count);
  }
  stats.residual_collision_count = result.residual_collisions.size();
  if (result.bars.empty()) {
    return stats;
  }

  double height_sum = 0.0;
  double width_sum = 0.0;
  double used_area = 0.0;
  std::size_t aligned = 0;
  std::map<std::size_t, std::pair<double, double>> extent_by_group;
  for (const TaskBar& bar : result.bars) {
    height_sum += bar.bounds.height;
    width_sum += bar.bounds.width;
    used_area += bar.bounds.area();
    stats.max_bar_height = std::max(stats.max_bar_height, bar.bounds.height);
    stats.max_bar_width = std::max(stats.max_bar_width, bar.bounds.width);
    if (bar.segment_index > 0) {
      ++stats.month_boundary_count;
    }
    if (distance_to_grid(bar.bounds.x, config.grid_resolution) <= config.alignment_tolerance &&
        distance_to_grid(bar.bounds.y, config.grid_resolution) <= config.alignment_tolerance) {
      ++aligned;
    }

    auto [it, inserted] = extent_by_group.try_emplace(bar.group_index, bar.bounds.y, bar.bounds.bottom());
    if (!inserted) {
      it->second.first = std::min(it->second.first, bar.bounds.y);
      it->second.second = std::max(it->second.second, bar.bounds.bottom());
    }
  }

  const auto bar_count = static_cast<double>(result.bars.size());
  stats.average_bar_height = height_sum / bar_count;
  stats.average_bar_width = width_sum / bar_count;
  stats.alignment_score = static_cast<double>(aligned) / bar_count;

  double stack_sum = 0.0;
  for (const auto& [group_index, extent] : extent_by_group) {
    const double stack_height = extent.second - extent.first;
    stack_sum += stack_height;
    stats.max_stack_height = std::max(stats.max_stack_height, stack_height);
  }
  stats.average_stack_height = stack_sum / static_cast<double>(extent_by_group.size());

  const double available_area = available_width(config) * available_height(config);
  stats.space_efficiency = available_area > 0.0 ? used_area / available_area : 0.0;
  stats.visual_balance = visual_balance(result.bars, config);
  stats.grid_utilization = grid_utilization(result.bars, config);
  return stats;
}

std::vector<std::string> LayoutEngine::BuildRecommendations(const LayoutResult& result,
                                                            const GridConfig& config) const {
  std::vector<std::string> recommendations;
  if (result.bars.empty()) {
    return recommendations;
  }
  const LayoutStatistics& stats = result.statistics;

  if (stats.space_efficiency < kSpaceEfficiencyFloor) {
    recommendations.emplace_back("Consider reducing task spacing to improve space efficiency");
  }
  if (stats.alignment_score < kAlignmentFloor) {
    recommendations.emplace_back("Enable grid snapping to improve alignment consistency");
  }
  if (stats.visual_balance < kVisualBalanceFloor) {
    recommendations.emplace_back("Redistribute tasks to improve visual balance");
  }
  if (stats.resolved_conflicts > 0) {
    std::ostringstream oss;
    oss << "Resolved " << stats.resolved_conflicts << " visual conflicts - consider reviewing task scheduling";
    recommendations.push_back(oss.str());
  }
  if (stats.overflow_task_count > 0) {
    std::ostringstream oss;
    oss << "Overcrowded days: " << stats.overflow_task_count << " task(s) exceeded " << config.max_rows_per_day
        << " rows and were stacked on row 0 - consider raising max rows per day or spreading tasks out";
    recommendations.push_back(oss.str());
  }
  if (stats.residual_collision_count > 0) {
    std::ostringstream oss;
    oss << stats.residual_collision_count << " bar pair(s) still overlap after collision resolution";
    recommendations.push_back(oss.str());
  }
  if (stats.average_stack_height > config.day_height * kStackHeightDayFactor) {
    recommendations.emplace_back("Consider using horizontal stacking for high-density days");
  }
  if (const std::size_t shared = result.overlaps.CountForCategory(OverlapCategory::kAssignee); shared > 0) {
    std::ostringstream oss;
    oss << shared << " overlap(s) share an assignee - rebalance assignments or stagger the work";
    recommendations.push_back(oss.str());
  }
  if (result.overlaps.HasCriticalOverlaps()) {
    std::ostringstream oss;
    oss << "Resolve " << result.overlaps.critical_count << " critical schedule conflict(s) before publishing";
    recommendations.push_back(oss.str());
  }
  return recommendations;
}

std::vector<Task> make_demo_tasks(int year) {
  auto day = [year](unsigned month, unsigned d) { return Date::FromYmd(year, month, d); };
  auto make = [](std::string id, std::string name, std::string category, Date start, Date end, int priority) {
    Task task;
    task.id = std::move(id);
    task.name = std::move(name);
    task.category = std::move(category);
    task.start = start;
    task.end = end;
    task.priority = priority;
    task.status = "Planned";
    return task;
  };

  auto assign = [](Task task, std::string assignee) {
    task.assignee = std::move(assignee);
    return task;
  };

  std::vector<Task> tasks;
  tasks.push_back(assign(make("proposal-draft", "Draft proposal chapters", "PROPOSAL", day(1, 2), day(1, 12), 3),
                         "student"));
  tasks.push_back(assign(make("lit-review", "Literature review", "RESEARCH", day(1, 5), day(1, 20), 2), "student"));
  tasks.push_back(make("laser-align", "Laser alignment runs", "LASER", day(1, 8), day(1, 10), 4));
  tasks.push_back(make("committee", "MILESTONE: Committee meeting", "ADMIN", day(1, 15), day(1, 15), 5));
  tasks.push_back(assign(make("admin-forms", "Graduate school forms", "ADMIN", day(1, 22), day(1, 26), 1), "lab-tech"));
  tasks.push_back(make("imaging-batch", "Imaging batch A", "IMAGING", day(1, 22), day(2, 6), 3));

  Task calibration = assign(make("imaging-calib", "Imaging calibration", "IMAGING", day(1, 22), day(2, 6), 2),
                            "lab-tech");
  calibration.dependencies = {"imaging-batch"};
  tasks.push_back(std::move(calibration));

  tasks.push_back(make("paper-submit", "Submit conference paper", "PUBLICATION", day(1, 29), day(1, 29), 4));
  tasks.push_back(assign(make("data-analysis", "Data analysis sprint", "RESEARCH", day(2, 9), day(2, 13), 3),
                         "student"));
  tasks.push_back(assign(make("chapter-3", "Dissertation chapter 3", "DISSERTATION", day(2, 10), day(2, 24), 4),
                         "student"));
  tasks.push_back(make("lab-sync", "Lab sync", "ADMIN", day(2, 16), day(2, 16), 2));
  tasks.push_back(make("advisor", "Advisor check-in", "RESEARCH", day(2, 16), day(2, 16), 3));
  tasks.push_back(make("booking", "Equipment booking", "LASER", day(2, 16), day(2, 16), 1));
  tasks.push_back(make("seminar", "Seminar talk", "PUBLICATION", day(2, 16), day(2, 16), 2));

  Task defense = make("defense", "Proposal defense", "MILESTONE", day(2, 27), day(2, 27), 5);
  defense.is_milestone = true;
  defense.description = "Oral defense of the dissertation proposal";
  defense.dependencies = {"proposal-draft", "chapter-3"};
  tasks.push_back(std::move(defense));

  return tasks;
}

}  // namespace plangrid::core

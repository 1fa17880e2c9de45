#include "plangrid/core/spatial_positioning.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

#include <spdlog/spdlog.h>

namespace plangrid::core {

namespace {

constexpr double kMinHeightFactor = 0.5;
constexpr double kMaxHeightFactor = 2.0;

RuleSubject subject_of(const TaskBar& bar) {
  return {bar.priority, bar.milestone, bar.category};
}

}  // namespace

double SpatialPositioner::DateToX(Date date) const {
  return static_cast<double>(days_between(config_->calendar_start, date)) * config_->day_width;
}

double SpatialPositioner::SpanWidth(Date start, Date end) const {
  return static_cast<double>(days_between(start, end) + 1) * config_->day_width;
}

double SpatialPositioner::BarHeight(double visual_weight) const {
  const double row_height = config_->row_height;
  return std::clamp(row_height * visual_weight, row_height * kMinHeightFactor, row_height * kMaxHeightFactor);
}

double SpatialPositioner::Snap(double value) const {
  const double resolution = config_->grid_resolution;
  if (resolution <= 0.0) {
    return value;
  }
  return std::round(value / resolution) * resolution;
}

double SpatialPositioner::alignment_offset(const AlignmentRule* rule, double free_space) const {
  if (rule == nullptr) {
    return 0.0;
  }
  switch (rule->mode) {
  case AlignmentMode::kTop:
    return 0.0;
  case AlignmentMode::kMiddle:
    return free_space * 0.5;
  case AlignmentMode::kBottom:
    return free_space;
  case AlignmentMode::kDefault:
  default:
    return free_space * std::clamp(rule->offset_fraction, 0.0, 1.0);
  }
}

TaskBar SpatialPositioner::CreateBar(const BarPlacement& placement) const {
  const Task& task = *placement.task;
  const GridConfig& config = *config_;
  const TaskRanking& ranking = placement.ranking;

  TaskBar bar;
  bar.task_id = task.id;
  bar.task_name = task.name;
  bar.category = task.category;
  bar.start = std::max(task.start, config.calendar_start);
  bar.end = std::min(task.end, config.calendar_end);
  bar.month = month_key(bar.start);
  bar.row = placement.row;
  bar.stack_index = placement.stack_index;
  bar.group_index = placement.group_index;
  bar.color = registry_->categories.color_of(task.category);
  bar.opacity = ranking.style.opacity;
  bar.z_order = ranking.style.z_order;
  bar.border_width = ranking.style.border_width;
  bar.priority = task.priority;
  bar.visual_weight = ranking.visual_weight;
  bar.prominence = ranking.prominence;
  bar.band = ranking.band;
  bar.milestone = signals_milestone(task) || registry_->categories.is_milestone_category(task.category);

  bar.bounds.x = DateToX(bar.start);
  bar.bounds.width = SpanWidth(bar.start, bar.end);
  bar.bounds.height = BarHeight(ranking.visual_weight);

  const AlignmentRule* rule = registry_->MatchAlignment(subject_of(bar));
  bar.alignment = rule == nullptr ? AlignmentMode::kDefault : rule->mode;
  const double free_space = std::max(0.0, config.row_height - bar.bounds.height);
  bar.bounds.y = static_cast<double>(placement.row) * config.row_height + alignment_offset(rule, free_space);

  bar.is_continuation = task.start < config.calendar_start;
  bar.is_start = !bar.is_continuation;
  bar.is_end = task.end <= config.calendar_end;
  bar.crosses_month_boundary = month_key(bar.start) != month_key(bar.end);
  return bar;
}

std::size_t SpatialPositioner::ApplySpacing(std::vector<TaskBar>& bars) const {
  std::vector<std::size_t> order(bars.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [&bars](std::size_t a, std::size_t b) {
    if (bars[a].bounds.y != bars[b].bounds.y) {
      return bars[a].bounds.y < bars[b].bounds.y;
    }
    if (bars[a].bounds.x != bars[b].bounds.x) {
      return bars[a].bounds.x < bars[b].bounds.x;
    }
    return bars[a].task_id < bars[b].task_id;
  });

  std::size_t adjustments = 0;
  for (std::size_t i = 0; i < order.size(); ++i) {
    for (std::size_t j = i + 1; j < order.size(); ++j) {
      const TaskBar& upper = bars[order[i]];
      TaskBar& lower = bars[order[j]];
      if (!horizontally_overlaps(upper.bounds, lower.bounds) || lower.bounds.y < upper.bounds.y) {
        continue;
      }
      const double gap = lower.bounds.y - upper.bounds.bottom();
      // Overlapping bars belong to collision resolution.
      if (gap < 0.0) {
        continue;
      }
      const SpacingRule* rule = registry_->MatchSpacing(subject_of(upper), subject_of(lower));
      const double wanted = rule == nullptr ? config_->min_task_spacing : rule->vertical_spacing;
      const double required = std::clamp(wanted, config_->min_task_spacing, config_->max_task_spacing);
      if (gap < required) {
        lower.bounds.y += required - gap;
        ++adjustments;
      }
    }
  }
  return adjustments;
}

void SpatialPositioner::SnapToGrid(std::vector<TaskBar>& bars) const {
  // Edges are snapped so gaps of at least one grid step survive rounding.
  for (TaskBar& bar : bars) {
    const double left = Snap(bar.bounds.x);
    const double right = Snap(bar.bounds.right());
    const double top = Snap(bar.bounds.y);
    const double bottom = Snap(bar.bounds.bottom());
    bar.bounds.x = left;
    bar.bounds.y = top;
    bar.bounds.width = std::max(0.0, right - left);
    bar.bounds.height = std::max(0.0, bottom - top);
  }
}

std::size_t SpatialPositioner::ResolveCollisions(std::vector<TaskBar>& bars) const {
  std::stable_sort(bars.begin(), bars.end(), [](const TaskBar& a, const TaskBar& b) {
    if (a.prominence != b.prominence) {
      return a.prominence > b.prominence;
    }
    if (a.priority != b.priority) {
      return a.priority > b.priority;
    }
    if (a.task_id != b.task_id) {
      return a.task_id < b.task_id;
    }
    return a.start < b.start;
  });

  const double buffer = config_->collision_buffer;
  std::size_t pushes = 0;
  for (std::size_t i = 0; i < bars.size(); ++i) {
    for (std::size_t j = i + 1; j < bars.size(); ++j) {
      if (!collides(bars[i].bounds, bars[j].bounds, buffer)) {
        continue;
      }
      bars[j].bounds.y = bars[i].bounds.bottom() + buffer;
      ++pushes;
      spdlog::debug("[collision] {} pushed below {} to y={:.2f}", bars[j].task_id, bars[i].task_id,
                    bars[j].bounds.y);
    }
  }
  return pushes;
}

std::vector<CollisionPair> FindCollisions(const std::vector<TaskBar>& bars, double buffer) {
  std::vector<CollisionPair> pairs;
  for (std::size_t i = 0; i < bars.size(); ++i) {
    for (std::size_t j = i + 1; j < bars.size(); ++j) {
      if (collides(bars[i].bounds, bars[j].bounds, buffer)) {
        pairs.push_back({i, j});
      }
    }
  }
  return pairs;
}

}  // namespace plangrid::core

#include "plangrid/core/month_segmentation.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

namespace plangrid::core {

namespace {

double snap_edge(const GridConfig& config, double value) {
  if (!config.snap_to_grid || config.grid_resolution <= 0.0) {
    return value;
  }
  return std::round(value / config.grid_resolution) * config.grid_resolution;
}

void place_segment(const GridConfig& config, bool continuation, TaskBar& segment) {
  double left = static_cast<double>(days_between(config.calendar_start, segment.start)) * config.day_width;
  double right = left + static_cast<double>(days_between(segment.start, segment.end) + 1) * config.day_width;
  if (continuation) {
    left += config.month_boundary_gap;
  }
  left = snap_edge(config, left);
  right = snap_edge(config, right);
  segment.bounds.x = left;
  segment.bounds.width = std::max(0.0, right - left);
}

}  // namespace

std::vector<TaskBar> SegmentAtMonthBoundaries(const TaskBar& bar, const GridConfig& config) {
  if (bar.end < bar.start || month_key(bar.start) == month_key(bar.end)) {
    return {bar};
  }

  std::vector<TaskBar> segments;
  Date cursor = bar.start;
  while (cursor <= bar.end) {
    const Date segment_end = std::min(last_day_of_month(cursor), bar.end);
    const bool first = segments.empty();

    TaskBar segment = bar;
    segment.start = cursor;
    segment.end = segment_end;
    segment.month = month_key(cursor);
    segment.crosses_month_boundary = false;
    segment.is_continuation = first ? bar.is_continuation : true;
    segment.is_start = first && bar.is_start;
    segment.is_end = false;
    segment.segment_index = static_cast<int>(segments.size());
    place_segment(config, !first, segment);

    segments.push_back(std::move(segment));
    cursor = add_days(segment_end, 1);
  }

  segments.back().is_end = bar.is_end;
  for (TaskBar& segment : segments) {
    segment.segment_count = static_cast<int>(segments.size());
  }
  return segments;
}

std::vector<TaskBar> SegmentBars(const std::vector<TaskBar>& bars, const GridConfig& config) {
  std::vector<TaskBar> result;
  result.reserve(bars.size());
  for (const TaskBar& bar : bars) {
    std::vector<TaskBar> segments = SegmentAtMonthBoundaries(bar, config);
    result.insert(result.end(), std::make_move_iterator(segments.begin()), std::make_move_iterator(segments.end()));
  }
  return result;
}

}  // namespace plangrid::core

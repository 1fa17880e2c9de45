#pragma once

#include <vector>

#include "plangrid/core/grid_config.hpp"
#include "plangrid/core/task_bar.hpp"

namespace plangrid::core {

// One segment per month touched. A bar inside a single month comes back as
// the only segment, unchanged.
[[nodiscard]] std::vector<TaskBar> SegmentAtMonthBoundaries(const TaskBar& bar, const GridConfig& config);
[[nodiscard]] std::vector<TaskBar> SegmentBars(const std::vector<TaskBar>& bars, const GridConfig& config);

}  // namespace plangrid::core

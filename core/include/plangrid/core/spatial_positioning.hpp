#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "plangrid/core/grid_config.hpp"
#include "plangrid/core/layout_registry.hpp"
#include "plangrid/core/priority_scoring.hpp"
#include "plangrid/core/task.hpp"
#include "plangrid/core/task_bar.hpp"

namespace plangrid::core {

struct BarPlacement {
  const Task* task = nullptr;
  TaskRanking ranking{};
  int row = 0;
  int stack_index = 0;
  std::size_t group_index = 0;
};

struct CollisionPair {
  std::size_t first = 0;
  std::size_t second = 0;
};

class SpatialPositioner {
 public:
  SpatialPositioner(const LayoutRegistry& registry, const GridConfig& config)
      : registry_(&registry), config_(&config) {}

  [[nodiscard]] double DateToX(Date date) const;
  [[nodiscard]] double SpanWidth(Date start, Date end) const;
  [[nodiscard]] double BarHeight(double visual_weight) const;
  [[nodiscard]] double Snap(double value) const;

  // Span is clipped to the calendar range. Y holds the row plus alignment offset.
  [[nodiscard]] TaskBar CreateBar(const BarPlacement& placement) const;

  // Widens vertical gaps between horizontally overlapping bars. Returns the
  // number of adjustments made.
  std::size_t ApplySpacing(std::vector<TaskBar>& bars) const;
  void SnapToGrid(std::vector<TaskBar>& bars) const;

  // Single pass: bars are reordered by prominence and each later bar that
  // collides with an earlier one is pushed below it. Returns the number of
  // pushes.
  std::size_t ResolveCollisions(std::vector<TaskBar>& bars) const;

 private:
  [[nodiscard]] double alignment_offset(const AlignmentRule* rule, double free_space) const;

  const LayoutRegistry* registry_ = nullptr;
  const GridConfig* config_ = nullptr;
};

// Pairs of bars whose rectangles still overlap.
[[nodiscard]] std::vector<CollisionPair> FindCollisions(const std::vector<TaskBar>& bars, double buffer = 0.0);

}  // namespace plangrid::core

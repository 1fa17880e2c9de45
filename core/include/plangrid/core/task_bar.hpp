#pragma once

#include <cstddef>
#include <string>

#include "plangrid/core/date.hpp"
#include "plangrid/core/layout_registry.hpp"
#include "plangrid/core/priority_scoring.hpp"
#include "plangrid/core/types.hpp"

namespace plangrid::core {

struct TaskBar {
  std::string task_id{};
  std::string task_name{};
  std::string category{};
  Date start{};
  Date end{};  // inclusive
  MonthKey month{};
  Rectd bounds{};  // grid units
  int row = 0;
  int stack_index = 0;
  std::size_t group_index = 0;
  std::string color{};
  double opacity = 1.0;
  int z_order = 1;
  double border_width = 1.0;
  int priority = 0;
  double visual_weight = 0.0;
  double prominence = 0.0;
  UrgencyBand band = UrgencyBand::kMinimal;
  bool milestone = false;
  AlignmentMode alignment = AlignmentMode::kDefault;
  bool is_continuation = false;
  bool is_start = true;
  bool is_end = true;
  bool crosses_month_boundary = false;
  int segment_index = 0;
  int segment_count = 1;
};

}  // namespace plangrid::core

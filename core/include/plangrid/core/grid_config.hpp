#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "plangrid/core/date.hpp"

namespace plangrid::core {

struct GridConfig {
  Date calendar_start{};
  Date calendar_end{};  // inclusive
  double day_width = 20.0;
  double day_height = 60.0;
  double row_height = 14.0;
  int max_rows_per_day = 3;
  double overlap_threshold_hours = 1.0;
  double month_boundary_gap = 2.0;
  double min_task_spacing = 1.0;
  double max_task_spacing = 10.0;
  bool snap_to_grid = true;
  double grid_resolution = 1.0;
  double alignment_tolerance = 0.5;
  double collision_buffer = 0.5;
  // Reference day for urgency scoring. Never read from a clock.
  Date current_date{};
};

[[nodiscard]] GridConfig make_default_grid_config(Date calendar_start, Date calendar_end);

[[nodiscard]] inline int calendar_day_count(const GridConfig& config) {
  return days_between(config.calendar_start, config.calendar_end) + 1;
}

enum class ValidationSeverity : std::uint8_t {
  kError = 0,
  kWarning = 1,
};

struct ValidationIssue {
  ValidationSeverity severity = ValidationSeverity::kError;
  std::string code{};
  std::string message{};
  std::string subject_id{};
};

struct ValidationResult {
  std::vector<ValidationIssue> issues;

  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool ok() const { return !has_errors(); }
  [[nodiscard]] std::string error_summary() const;
};

[[nodiscard]] ValidationResult ValidateGridConfig(const GridConfig& config);

template <typename TValue>
struct RunResult {
  bool ok = false;
  TValue value{};
  std::string error{};
  ValidationResult validation{};
};

}  // namespace plangrid::core

#include "plangrid/core/grid_config.hpp"

#include <cmath>
#include <sstream>

namespace plangrid::core {

bool ValidationResult::has_errors() const {
  for (const ValidationIssue& issue : issues) {
    if (issue.severity == ValidationSeverity::kError) {
      return true;
    }
  }
  return false;
}

std::string ValidationResult::error_summary() const {
  std::ostringstream oss;
  bool first = true;
  for (const ValidationIssue& issue : issues) {
    if (issue.severity != ValidationSeverity::kError) {
      continue;
    }
    if (!first) {
      oss << "; ";
    }
    oss << issue.code << ": " << issue.message;
    first = false;
  }
  return oss.str();
}

GridConfig make_default_grid_config(Date calendar_start, Date calendar_end) {
  GridConfig config;
  config.calendar_start = calendar_start;
  config.calendar_end = calendar_end;
  config.current_date = calendar_start;
  return config;
}

ValidationResult ValidateGridConfig(const GridConfig& config) {
  ValidationResult result;

  const double values[] = {
      config.day_width,
      config.day_height,
      config.row_height,
      config.overlap_threshold_hours,
      config.month_boundary_gap,
      config.min_task_spacing,
      config.max_task_spacing,
      config.grid_resolution,
      config.alignment_tolerance,
      config.collision_buffer,
  };
  for (const double value : values) {
    if (!std::isfinite(value)) {
      result.issues.push_back(
          {ValidationSeverity::kError, "ConfigValueNonFinite", "Grid config contains a non-finite value", {}});
      return result;
    }
  }

  if (config.day_width <= 0.0) {
    result.issues.push_back(
        {ValidationSeverity::kError, "DayWidthNonPositive", "day_width must be greater than zero", {}});
  }
  if (config.day_height <= 0.0) {
    result.issues.push_back(
        {ValidationSeverity::kError, "DayHeightNonPositive", "day_height must be greater than zero", {}});
  }
  if (config.row_height <= 0.0) {
    result.issues.push_back(
        {ValidationSeverity::kError, "RowHeightNonPositive", "row_height must be greater than zero", {}});
  }
  if (config.max_rows_per_day <= 0) {
    result.issues.push_back(
        {ValidationSeverity::kError, "MaxRowsNonPositive", "max_rows_per_day must be at least 1", {}});
  }
  if (config.calendar_end < config.calendar_start) {
    result.issues.push_back({
        ValidationSeverity::kError,
        "CalendarRangeInverted",
        "calendar_end " + format_iso_date(config.calendar_end) + " is before calendar_start " +
            format_iso_date(config.calendar_start),
        {},
    });
  }
  if (config.grid_resolution <= 0.0) {
    result.issues.push_back(
        {ValidationSeverity::kError, "GridResolutionNonPositive", "grid_resolution must be greater than zero", {}});
  }
  if (config.collision_buffer < 0.0) {
    result.issues.push_back(
        {ValidationSeverity::kError, "CollisionBufferNegative", "collision_buffer must not be negative", {}});
  }
  if (config.min_task_spacing < 0.0 || config.max_task_spacing < config.min_task_spacing) {
    result.issues.push_back({ValidationSeverity::kError, "TaskSpacingInvalid",
                             "task spacing needs 0 <= min_task_spacing <= max_task_spacing", {}});
  }
  if (config.overlap_threshold_hours < 0.0) {
    result.issues.push_back({ValidationSeverity::kError, "OverlapThresholdNegative",
                             "overlap_threshold_hours must not be negative", {}});
  }
  if (config.month_boundary_gap < 0.0) {
    result.issues.push_back(
        {ValidationSeverity::kError, "MonthGapNegative", "month_boundary_gap must not be negative", {}});
  }
  if (config.alignment_tolerance < 0.0) {
    result.issues.push_back({ValidationSeverity::kError, "AlignmentToleranceNegative",
                             "alignment_tolerance must not be negative", {}});
  }

  if (!result.has_errors()) {
    const double width = static_cast<double>(calendar_day_count(config)) * config.day_width;
    const double height = static_cast<double>(config.max_rows_per_day) * config.row_height;
    if (!std::isfinite(width) || !std::isfinite(height)) {
      result.issues.push_back({ValidationSeverity::kError, "GridExtentNonFinite",
                               "calendar width or row stack height overflows a double", {}});
    }
  }

  if (config.row_height > 0.0 && config.day_height > 0.0 && config.row_height > config.day_height) {
    result.issues.push_back({
        ValidationSeverity::kWarning,
        "RowHeightExceedsDayHeight",
        "row_height is larger than day_height; a single row overflows the day cell",
        {},
    });
  }
  return result;
}

}  // namespace plangrid::core

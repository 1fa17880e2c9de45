#include "plangrid/core/overlap_analysis.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

namespace plangrid::core {

namespace {

constexpr double kHoursPerDay = 24.0;
constexpr double kHighOverlapRatio = 0.8;
constexpr double kMediumOverlapRatio = 0.5;

bool contains(const Task& outer, const Task& inner) {
  return outer.start <= inner.start && outer.end >= inner.end;
}

OverlapType classify(const Task& a, const Task& b, Date overlap_start, Date overlap_end, int overlap_days) {
  if (a.start == b.start && a.end == b.end) {
    return OverlapType::kIdentical;
  }
  if (contains(a, b) || contains(b, a)) {
    return OverlapType::kNested;
  }
  if (overlap_days == 0) {
    return OverlapType::kAdjacent;
  }
  // Unreachable after the identical check.
  if (overlap_start == a.start && overlap_end == a.end && overlap_start == b.start && overlap_end == b.end) {
    return OverlapType::kComplete;
  }
  return OverlapType::kPartial;
}

OverlapSeverity severity_for(OverlapType type, const Task& a, const Task& b, int overlap_days) {
  switch (type) {
  case OverlapType::kIdentical:
    return OverlapSeverity::kCritical;
  case OverlapType::kNested:
  case OverlapType::kComplete:
    return OverlapSeverity::kHigh;
  case OverlapType::kPartial: {
    const int shorter = std::min(span_days(a), span_days(b));
    const double ratio = shorter > 0 ? static_cast<double>(overlap_days) / static_cast<double>(shorter) : 0.0;
    if (ratio >= kHighOverlapRatio) {
      return OverlapSeverity::kHigh;
    }
    if (ratio >= kMediumOverlapRatio) {
      return OverlapSeverity::kMedium;
    }
    return OverlapSeverity::kLow;
  }
  case OverlapType::kAdjacent:
    return OverlapSeverity::kLow;
  default:
    return OverlapSeverity::kNone;
  }
}

std::string reason_for(OverlapType type, const Task& a, const Task& b) {
  switch (type) {
  case OverlapType::kIdentical:
    return "Tasks " + a.id + " and " + b.id + " have identical schedules";
  case OverlapType::kNested: {
    const bool a_inside = contains(b, a);
    const Task& inner = a_inside ? a : b;
    const Task& outer = a_inside ? b : a;
    return "Task " + inner.id + " is completely contained within task " + outer.id;
  }
  case OverlapType::kComplete:
    return "Tasks " + a.id + " and " + b.id + " have complete schedule overlap";
  case OverlapType::kPartial:
    return "Tasks " + a.id + " and " + b.id + " have partial schedule overlap";
  case OverlapType::kAdjacent:
    return "Tasks " + a.id + " and " + b.id + " are adjacent in schedule";
  default:
    return "Tasks " + a.id + " and " + b.id + " have unknown overlap type";
  }
}

std::string hint_for(OverlapType type) {
  switch (type) {
  case OverlapType::kIdentical:
    return "Consider merging tasks or adjusting one task's schedule";
  case OverlapType::kNested:
    return "Consider making the nested task a subtask or adjusting schedules";
  case OverlapType::kComplete:
    return "Tasks cannot run simultaneously - reschedule one task";
  case OverlapType::kPartial:
    return "Consider adjusting start/end times to reduce overlap";
  case OverlapType::kAdjacent:
    return "Consider adding buffer time between tasks";
  default:
    return "Review task schedules for potential conflicts";
  }
}

void intensify(Overlap& overlap) {
  if (overlap.severity == OverlapSeverity::kCritical) {
    overlap.reason += " (CRITICAL)";
    overlap.hint = "URGENT: " + overlap.hint;
  } else if (overlap.severity == OverlapSeverity::kHigh) {
    overlap.reason += " (HIGH)";
    overlap.hint = "Important: " + overlap.hint;
  }
}

std::string group_resolution(const GroupOverlapResult& group) {
  if (group.overlaps.empty()) {
    return "No conflicts detected";
  }
  std::size_t critical = 0;
  std::size_t high = 0;
  for (const Overlap& overlap : group.overlaps) {
    if (overlap.severity == OverlapSeverity::kCritical) {
      ++critical;
    } else if (overlap.severity == OverlapSeverity::kHigh) {
      ++high;
    }
  }
  std::ostringstream oss;
  if (critical > 0) {
    oss << "URGENT: " << critical << " critical conflicts require immediate attention";
  } else if (high > 0) {
    oss << "Important: " << high << " high-priority conflicts need resolution";
  } else {
    oss << "Moderate: " << group.overlaps.size() << " conflicts can be addressed during planning";
  }
  return oss.str();
}

std::string analysis_summary(const OverlapAnalysis& analysis, std::size_t task_count) {
  std::ostringstream oss;
  if (analysis.total_overlaps == 0) {
    oss << "No task overlaps detected in " << task_count << " tasks";
    return oss.str();
  }
  oss << "Detected " << analysis.total_overlaps << " overlaps affecting " << analysis.overlapping_task_count
      << " tasks: " << analysis.critical_count << " critical, " << analysis.high_count << " high, "
      << analysis.medium_count << " medium, " << analysis.low_count << " low";
  return oss.str();
}

}  // namespace

const char* OverlapTypeLabel(OverlapType type) {
  switch (type) {
  case OverlapType::kNone:
    return "NONE";
  case OverlapType::kPartial:
    return "PARTIAL";
  case OverlapType::kComplete:
    return "COMPLETE";
  case OverlapType::kNested:
    return "NESTED";
  case OverlapType::kAdjacent:
    return "ADJACENT";
  case OverlapType::kIdentical:
    return "IDENTICAL";
  default:
    return "UNKNOWN";
  }
}

const char* OverlapSeverityLabel(OverlapSeverity severity) {
  switch (severity) {
  case OverlapSeverity::kNone:
    return "NONE";
  case OverlapSeverity::kLow:
    return "LOW";
  case OverlapSeverity::kMedium:
    return "MEDIUM";
  case OverlapSeverity::kHigh:
    return "HIGH";
  case OverlapSeverity::kCritical:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

std::optional<Overlap> OverlapAnalyzer::AnalyzePair(const Task& a, const Task& b) const {
  const Date overlap_start = std::max(a.start, b.start);
  const Date overlap_end = std::min(a.end, b.end);
  // Inclusive day count: 0 when b starts the day after a ends.
  const int overlap_days = days_between(overlap_start, overlap_end) + 1;
  if (overlap_days < 0) {
    return std::nullopt;
  }
  const double hours = static_cast<double>(overlap_days) * kHoursPerDay;
  if (hours < threshold_hours_) {
    return std::nullopt;
  }

  Overlap overlap;
  overlap.task_a_id = a.id;
  overlap.task_b_id = b.id;
  overlap.type = classify(a, b, overlap_start, overlap_end, overlap_days);
  overlap.severity = severity_for(overlap.type, a, b, overlap_days);
  overlap.start = overlap_start;
  overlap.end = overlap_end;
  overlap.overlap_days = overlap_days;
  overlap.duration_hours = hours;
  overlap.priority = std::max(a.priority, b.priority);
  overlap.reason = reason_for(overlap.type, a, b);
  overlap.hint = hint_for(overlap.type);
  intensify(overlap);

  const ConflictRule* rule =
      registry_ == nullptr ? nullptr : registry_->MatchConflict(a, b, overlap_days, current_date_);
  if (rule != nullptr) {
    overlap.category = rule->category;
    overlap.rule_name = rule->name;
  }
  overlap.cause = OverlapCategoryCause(overlap.category);
  return overlap;
}

GroupOverlapResult OverlapAnalyzer::AnalyzeGroup(const std::vector<Task>& tasks, const TaskGroup& group) const {
  GroupOverlapResult result;
  result.group_index = group.index;

  for (std::size_t i = 0; i < group.task_indices.size(); ++i) {
    for (std::size_t j = i + 1; j < group.task_indices.size(); ++j) {
      std::optional<Overlap> overlap = AnalyzePair(tasks[group.task_indices[i]], tasks[group.task_indices[j]]);
      if (overlap.has_value()) {
        result.overlaps.push_back(std::move(*overlap));
      }
    }
  }

  std::stable_sort(result.overlaps.begin(), result.overlaps.end(), [](const Overlap& a, const Overlap& b) {
    if (a.severity != b.severity) {
      return a.severity > b.severity;
    }
    return a.priority > b.priority;
  });
  for (const Overlap& overlap : result.overlaps) {
    result.max_severity = std::max(result.max_severity, overlap.severity);
  }
  result.resolution = group_resolution(result);
  return result;
}

OverlapAnalysis OverlapAnalyzer::Analyze(const std::vector<Task>& tasks, const std::vector<TaskGroup>& groups) const {
  OverlapAnalysis analysis;
  std::set<std::string> involved;
  std::size_t task_count = 0;

  for (const TaskGroup& group : groups) {
    task_count += group.task_indices.size();
    GroupOverlapResult group_result = AnalyzeGroup(tasks, group);
    for (const Overlap& overlap : group_result.overlaps) {
      involved.insert(overlap.task_a_id);
      involved.insert(overlap.task_b_id);
      ++analysis.category_counts[static_cast<std::size_t>(overlap.category)];
      switch (overlap.severity) {
      case OverlapSeverity::kCritical:
        ++analysis.critical_count;
        break;
      case OverlapSeverity::kHigh:
        ++analysis.high_count;
        break;
      case OverlapSeverity::kMedium:
        ++analysis.medium_count;
        break;
      case OverlapSeverity::kLow:
        ++analysis.low_count;
        break;
      default:
        break;
      }
    }
    analysis.total_overlaps += group_result.overlaps.size();
    analysis.groups.push_back(std::move(group_result));
  }

  analysis.overlapping_task_count = involved.size();
  analysis.summary = analysis_summary(analysis, task_count);
  return analysis;
}

std::vector<Overlap> OverlapAnalysis::OverlapsBySeverity(OverlapSeverity severity) const {
  std::vector<Overlap> result;
  for (const GroupOverlapResult& group : groups) {
    for (const Overlap& overlap : group.overlaps) {
      if (overlap.severity == severity) {
        result.push_back(overlap);
      }
    }
  }
  return result;
}

std::vector<Overlap> OverlapAnalysis::OverlapsByType(OverlapType type) const {
  std::vector<Overlap> result;
  for (const GroupOverlapResult& group : groups) {
    for (const Overlap& overlap : group.overlaps) {
      if (overlap.type == type) {
        result.push_back(overlap);
      }
    }
  }
  return result;
}

std::vector<Overlap> OverlapAnalysis::OverlapsByCategory(OverlapCategory category) const {
  std::vector<Overlap> result;
  for (const GroupOverlapResult& group : groups) {
    for (const Overlap& overlap : group.overlaps) {
      if (overlap.category == category) {
        result.push_back(overlap);
      }
    }
  }
  return result;
}

}  // namespace plangrid::core

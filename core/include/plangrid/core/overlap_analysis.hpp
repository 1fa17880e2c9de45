#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "plangrid/core/date.hpp"
#include "plangrid/core/layout_registry.hpp"
#include "plangrid/core/task.hpp"
#include "plangrid/core/task_grouping.hpp"

namespace plangrid::core {

enum class OverlapType : std::uint8_t {
  kNone = 0,
  kPartial = 1,
  kComplete = 2,
  kNested = 3,
  kAdjacent = 4,
  kIdentical = 5,
};

// Ordered: a larger value is more severe.
enum class OverlapSeverity : std::uint8_t {
  kNone = 0,
  kLow = 1,
  kMedium = 2,
  kHigh = 3,
  kCritical = 4,
};

struct Overlap {
  std::string task_a_id{};
  std::string task_b_id{};
  OverlapType type = OverlapType::kNone;
  OverlapSeverity severity = OverlapSeverity::kNone;
  Date start{};
  Date end{};
  int overlap_days = 0;  // 0 for adjacent tasks
  double duration_hours = 0.0;
  int priority = 0;
  std::string reason{};
  std::string hint{};
  OverlapCategory category = OverlapCategory::kSchedule;
  std::string rule_name{};  // empty when no conflict rule matched
  std::string cause{};
};

struct GroupOverlapResult {
  std::size_t group_index = 0;
  std::vector<Overlap> overlaps{};
  OverlapSeverity max_severity = OverlapSeverity::kNone;
  std::string resolution{};
};

struct OverlapAnalysis {
  std::vector<GroupOverlapResult> groups{};
  std::size_t total_overlaps = 0;
  std::size_t critical_count = 0;
  std::size_t high_count = 0;
  std::size_t medium_count = 0;
  std::size_t low_count = 0;
  std::size_t overlapping_task_count = 0;
  std::array<std::size_t, kOverlapCategoryCount> category_counts{};
  std::string summary{};

  [[nodiscard]] std::vector<Overlap> OverlapsBySeverity(OverlapSeverity severity) const;
  [[nodiscard]] std::vector<Overlap> OverlapsByType(OverlapType type) const;
  [[nodiscard]] std::vector<Overlap> OverlapsByCategory(OverlapCategory category) const;
  [[nodiscard]] std::size_t CountForCategory(OverlapCategory category) const {
    return category_counts[static_cast<std::size_t>(category)];
  }
  [[nodiscard]] bool HasCriticalOverlaps() const { return critical_count > 0; }
};

const char* OverlapTypeLabel(OverlapType type);
const char* OverlapSeverityLabel(OverlapSeverity severity);

class OverlapAnalyzer {
 public:
  explicit OverlapAnalyzer(double threshold_hours = 1.0) : threshold_hours_(threshold_hours) {}
  // Categorizes each overlap with the registry's conflict rules.
  OverlapAnalyzer(double threshold_hours, const LayoutRegistry& registry, Date current_date)
      : threshold_hours_(threshold_hours), registry_(&registry), current_date_(current_date) {}

  [[nodiscard]] double threshold_hours() const { return threshold_hours_; }

  // Empty when the pair is disjoint or the shared time is under the threshold.
  [[nodiscard]] std::optional<Overlap> AnalyzePair(const Task& a, const Task& b) const;
  [[nodiscard]] GroupOverlapResult AnalyzeGroup(const std::vector<Task>& tasks, const TaskGroup& group) const;
  [[nodiscard]] OverlapAnalysis Analyze(const std::vector<Task>& tasks, const std::vector<TaskGroup>& groups) const;

 private:
  double threshold_hours_ = 1.0;
  const LayoutRegistry* registry_ = nullptr;
  Date current_date_{};
};

}  // namespace plangrid::core

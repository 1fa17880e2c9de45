#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "plangrid/core/category_table.hpp"
#include "plangrid/core/priority_scoring.hpp"
#include "plangrid/core/task.hpp"

namespace plangrid::core {

enum class AlignmentMode : std::uint8_t {
  kDefault = 0,
  kTop = 1,
  kMiddle = 2,
  kBottom = 3,
};

enum class AlignmentConditionKind : std::uint8_t {
  kAlways = 0,
  kPriorityAtLeast = 1,
  kMilestone = 2,
  kCategoryEquals = 3,
};

struct AlignmentCondition {
  AlignmentConditionKind kind = AlignmentConditionKind::kAlways;
  int threshold = 0;
  std::string category{};
};

struct AlignmentRule {
  std::string name{};
  int rule_priority = 0;
  AlignmentCondition condition{};
  AlignmentMode mode = AlignmentMode::kDefault;
  // Share of the free row space (row height - bar height) above the bar.
  double offset_fraction = 0.0;
};

enum class SpacingConditionKind : std::uint8_t {
  kAlways = 0,
  kEitherPriorityAtLeast = 1,
  kBothMilestone = 2,
};

struct SpacingCondition {
  SpacingConditionKind kind = SpacingConditionKind::kAlways;
  int threshold = 0;
};

struct SpacingRule {
  std::string name{};
  int rule_priority = 0;
  SpacingCondition condition{};
  double vertical_spacing = 1.0;
  double horizontal_spacing = 0.5;
};

enum class OverlapCategory : std::uint8_t {
  kSchedule = 0,
  kPriority = 1,
  kAssignee = 2,
  kSameCategory = 3,
  kMilestone = 4,
  kDeadline = 5,
  kTimeline = 6,
  kDependency = 7,
};

inline constexpr std::size_t kOverlapCategoryCount = 8;

enum class ConflictConditionKind : std::uint8_t {
  kIdenticalSchedule = 0,
  kBothPriorityAtLeast = 1,
  kSameAssignee = 2,
  kSameCategory = 3,
  kEitherMilestone = 4,
  kDeadlineWithin = 5,
  kSharedSpanAtLeast = 6,
  kDependencyLink = 7,
};

struct ConflictCondition {
  ConflictConditionKind kind = ConflictConditionKind::kIdenticalSchedule;
  int threshold = 0;     // priority floor
  int window_days = 0;   // deadline window from the current date
  double share = 0.0;    // shared days over the longer task's span
};

struct ConflictRule {
  std::string name{};
  int rule_priority = 0;
  ConflictCondition condition{};
  OverlapCategory category = OverlapCategory::kSchedule;
};

// Facts a rule may inspect about one bar.
struct RuleSubject {
  int priority = 0;
  bool milestone = false;
  std::string category{};
};

struct LayoutRegistry {
  CategoryTable categories{};
  std::vector<AlignmentRule> alignment_rules{};  // descending rule_priority
  std::vector<SpacingRule> spacing_rules{};      // descending rule_priority
  std::vector<ConflictRule> conflict_rules{};    // descending rule_priority
  RankingWeights ranking_weights{};

  void AddAlignmentRule(AlignmentRule rule);
  void AddSpacingRule(SpacingRule rule);
  void AddConflictRule(ConflictRule rule);

  [[nodiscard]] const AlignmentRule* MatchAlignment(const RuleSubject& subject) const;
  [[nodiscard]] const SpacingRule* MatchSpacing(const RuleSubject& a, const RuleSubject& b) const;
  // overlap_days is the inclusive count of shared days.
  [[nodiscard]] const ConflictRule* MatchConflict(const Task& a, const Task& b, int overlap_days,
                                                  Date current_date) const;
};

const char* AlignmentModeLabel(AlignmentMode mode);
const char* OverlapCategoryLabel(OverlapCategory category);
// One-line root cause for an overlap of the given category.
const char* OverlapCategoryCause(OverlapCategory category);
[[nodiscard]] LayoutRegistry make_default_registry();

}  // namespace plangrid::core

#include "plangrid/core/layout_registry.hpp"

#include <algorithm>
#include <utility>

namespace plangrid::core {

namespace {

bool alignment_matches(const AlignmentCondition& condition, const RuleSubject& subject) {
  switch (condition.kind) {
  case AlignmentConditionKind::kAlways:
    return true;
  case AlignmentConditionKind::kPriorityAtLeast:
    return subject.priority >= condition.threshold;
  case AlignmentConditionKind::kMilestone:
    return subject.milestone;
  case AlignmentConditionKind::kCategoryEquals:
    return normalize_category_key(subject.category) == normalize_category_key(condition.category);
  default:
    return false;
  }
}

bool spacing_matches(const SpacingCondition& condition, const RuleSubject& a, const RuleSubject& b) {
  switch (condition.kind) {
  case SpacingConditionKind::kAlways:
    return true;
  case SpacingConditionKind::kEitherPriorityAtLeast:
    return a.priority >= condition.threshold || b.priority >= condition.threshold;
  case SpacingConditionKind::kBothMilestone:
    return a.milestone && b.milestone;
  default:
    return false;
  }
}

bool depends_on(const Task& task, const std::string& other_id) {
  return std::find(task.dependencies.begin(), task.dependencies.end(), other_id) != task.dependencies.end();
}

bool conflict_matches(const ConflictCondition& condition, const Task& a, const Task& b, int overlap_days,
                      Date current_date) {
  switch (condition.kind) {
  case ConflictConditionKind::kIdenticalSchedule:
    return a.start == b.start && a.end == b.end;
  case ConflictConditionKind::kBothPriorityAtLeast:
    return a.priority >= condition.threshold && b.priority >= condition.threshold;
  case ConflictConditionKind::kSameAssignee:
    return !a.assignee.empty() && a.assignee == b.assignee;
  case ConflictConditionKind::kSameCategory: {
    const std::string key = normalize_category_key(a.category);
    return !key.empty() && key == normalize_category_key(b.category);
  }
  case ConflictConditionKind::kEitherMilestone:
    return signals_milestone(a) || signals_milestone(b);
  case ConflictConditionKind::kDeadlineWithin: {
    const Date horizon = add_days(current_date, condition.window_days);
    return (a.end < horizon || b.end < horizon) &&
           (a.priority >= condition.threshold || b.priority >= condition.threshold);
  }
  case ConflictConditionKind::kSharedSpanAtLeast: {
    const int longer = std::max(span_days(a), span_days(b));
    return longer > 0 && static_cast<double>(overlap_days) / static_cast<double>(longer) >= condition.share;
  }
  case ConflictConditionKind::kDependencyLink:
    return depends_on(a, b.id) || depends_on(b, a.id);
  default:
    return false;
  }
}

}  // namespace

void LayoutRegistry::AddAlignmentRule(AlignmentRule rule) {
  alignment_rules.push_back(std::move(rule));
  std::stable_sort(alignment_rules.begin(), alignment_rules.end(),
                   [](const AlignmentRule& a, const AlignmentRule& b) { return a.rule_priority > b.rule_priority; });
}

void LayoutRegistry::AddSpacingRule(SpacingRule rule) {
  spacing_rules.push_back(std::move(rule));
  std::stable_sort(spacing_rules.begin(), spacing_rules.end(),
                   [](const SpacingRule& a, const SpacingRule& b) { return a.rule_priority > b.rule_priority; });
}

const AlignmentRule* LayoutRegistry::MatchAlignment(const RuleSubject& subject) const {
  for (const AlignmentRule& rule : alignment_rules) {
    if (alignment_matches(rule.condition, subject)) {
      return &rule;
    }
  }
  return nullptr;
}

void LayoutRegistry::AddConflictRule(ConflictRule rule) {
  conflict_rules.push_back(std::move(rule));
  std::stable_sort(conflict_rules.begin(), conflict_rules.end(),
                   [](const ConflictRule& a, const ConflictRule& b) { return a.rule_priority > b.rule_priority; });
}

const ConflictRule* LayoutRegistry::MatchConflict(const Task& a, const Task& b, int overlap_days,
                                                  Date current_date) const {
  for (const ConflictRule& rule : conflict_rules) {
    if (conflict_matches(rule.condition, a, b, overlap_days, current_date)) {
      return &rule;
    }
  }
  return nullptr;
}

const SpacingRule* LayoutRegistry::MatchSpacing(const RuleSubject& a, const RuleSubject& b) const {
  for (const SpacingRule& rule : spacing_rules) {
    if (spacing_matches(rule.condition, a, b)) {
      return &rule;
    }
  }
  return nullptr;
}

const char* AlignmentModeLabel(AlignmentMode mode) {
  switch (mode) {
  case AlignmentMode::kDefault:
    return "Default";
  case AlignmentMode::kTop:
    return "Top";
  case AlignmentMode::kMiddle:
    return "Middle";
  case AlignmentMode::kBottom:
    return "Bottom";
  default:
    return "Unknown";
  }
}

const char* OverlapCategoryLabel(OverlapCategory category) {
  switch (category) {
  case OverlapCategory::kSchedule:
    return "SCHEDULE_CONFLICT";
  case OverlapCategory::kPriority:
    return "PRIORITY_CONFLICT";
  case OverlapCategory::kAssignee:
    return "ASSIGNEE_CONFLICT";
  case OverlapCategory::kSameCategory:
    return "CATEGORY_CONFLICT";
  case OverlapCategory::kMilestone:
    return "MILESTONE_CONFLICT";
  case OverlapCategory::kDeadline:
    return "DEADLINE_CONFLICT";
  case OverlapCategory::kTimeline:
    return "TIMELINE_CONFLICT";
  case OverlapCategory::kDependency:
    return "DEPENDENCY_CONFLICT";
  default:
    return "UNKNOWN";
  }
}

const char* OverlapCategoryCause(OverlapCategory category) {
  switch (category) {
  case OverlapCategory::kSchedule:
    return "Tasks scheduled for the same time period";
  case OverlapCategory::kPriority:
    return "Both tasks have high priority causing resource contention";
  case OverlapCategory::kAssignee:
    return "Same person assigned to overlapping tasks";
  case OverlapCategory::kSameCategory:
    return "Tasks in the same category may have conflicting requirements";
  case OverlapCategory::kMilestone:
    return "Milestone tasks have overlapping schedules";
  case OverlapCategory::kDeadline:
    return "Tasks have conflicting deadlines";
  case OverlapCategory::kTimeline:
    return "Tasks have significant timeline overlap";
  case OverlapCategory::kDependency:
    return "Tasks have conflicting dependency relationships";
  default:
    return "Unknown conflict cause";
  }
}

LayoutRegistry make_default_registry() {
  LayoutRegistry registry;
  registry.categories = make_default_category_table();

  registry.AddAlignmentRule({
      "HighPriority",
      10,
      {AlignmentConditionKind::kPriorityAtLeast, 4, {}},
      AlignmentMode::kTop,
      0.0,
  });
  registry.AddAlignmentRule({
      "Milestone",
      8,
      {AlignmentConditionKind::kMilestone, 0, {}},
      AlignmentMode::kMiddle,
      0.5,
  });
  registry.AddAlignmentRule({
      "Default",
      1,
      {AlignmentConditionKind::kAlways, 0, {}},
      AlignmentMode::kDefault,
      0.2,
  });

  registry.AddSpacingRule({"HighPrioritySpacing", 10, {SpacingConditionKind::kEitherPriorityAtLeast, 4}, 3.0, 2.0});
  registry.AddSpacingRule({"DefaultSpacing", 1, {SpacingConditionKind::kAlways, 0}, 1.0, 0.5});

  using Kind = ConflictConditionKind;
  registry.AddConflictRule({"IdenticalSchedule", 1, {Kind::kIdenticalSchedule, 0, 0, 0.0}, OverlapCategory::kSchedule});
  registry.AddConflictRule({"HighPriorityOverlap", 2, {Kind::kBothPriorityAtLeast, 3, 0, 0.0}, OverlapCategory::kPriority});
  registry.AddConflictRule({"SameAssignee", 3, {Kind::kSameAssignee, 0, 0, 0.0}, OverlapCategory::kAssignee});
  registry.AddConflictRule({"SameCategory", 4, {Kind::kSameCategory, 0, 0, 0.0}, OverlapCategory::kSameCategory});
  registry.AddConflictRule({"MilestoneOverlap", 5, {Kind::kEitherMilestone, 0, 0, 0.0}, OverlapCategory::kMilestone});
  registry.AddConflictRule({"DeadlineCrunch", 6, {Kind::kDeadlineWithin, 2, 7, 0.0}, OverlapCategory::kDeadline});
  registry.AddConflictRule({"LongSharedSpan", 7, {Kind::kSharedSpanAtLeast, 0, 0, 0.7}, OverlapCategory::kTimeline});
  registry.AddConflictRule({"DependencyChain", 8, {Kind::kDependencyLink, 0, 0, 0.0}, OverlapCategory::kDependency});
  return registry;
}

}  // namespace plangrid::core

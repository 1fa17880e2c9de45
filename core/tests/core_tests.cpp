#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "plangrid/core/category_table.hpp"
#include "plangrid/core/date.hpp"
#include "plangrid/core/grid_config.hpp"
#include "plangrid/core/layout_engine.hpp"
#include "plangrid/core/layout_registry.hpp"
#include "plangrid/core/month_segmentation.hpp"
#include "plangrid/core/overlap_analysis.hpp"
#include "plangrid/core/priority_scoring.hpp"
#include "plangrid/core/spatial_positioning.hpp"
#include "plangrid/core/task_grouping.hpp"

namespace {

using plangrid::core::AlignmentMode;
using plangrid::core::Date;
using plangrid::core::GridConfig;
using plangrid::core::LayoutEngine;
using plangrid::core::OverlapAnalyzer;
using plangrid::core::OverlapCategory;
using plangrid::core::OverlapSeverity;
using plangrid::core::OverlapType;
using plangrid::core::Task;
using plangrid::core::TaskBar;
using plangrid::core::UrgencyBand;

struct TestCase {
  const char* name;
  const char* intent;
  std::function<bool(void)> run;
};

bool almost_equal(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

Date d(unsigned month, unsigned day, int year = 2024) {
  return Date::FromYmd(year, month, day);
}

Task make_task(const std::string& id, Date start, Date end, int priority = 3, const std::string& category = "RESEARCH",
               const std::string& name = {}) {
  Task task;
  task.id = id;
  task.name = name.empty() ? id : name;
  task.category = category;
  task.start = start;
  task.end = end;
  task.priority = priority;
  return task;
}

GridConfig january_config() {
  GridConfig config = plangrid::core::make_default_grid_config(d(1, 1), d(1, 31));
  config.current_date = d(1, 1);
  return config;
}

bool contains_text(const std::vector<std::string>& lines, const std::string& needle) {
  return std::any_of(lines.begin(), lines.end(),
                     [&needle](const std::string& line) { return line.find(needle) != std::string::npos; });
}

bool has_issue_code(const plangrid::core::ValidationResult& validation, const std::string& code) {
  for (const auto& issue : validation.issues) {
    if (issue.code == code) {
      return true;
    }
  }
  return false;
}

const TaskBar* find_bar(const std::vector<TaskBar>& bars, const std::string& task_id) {
  for (const TaskBar& bar : bars) {
    if (bar.task_id == task_id) {
      return &bar;
    }
  }
  return nullptr;
}

std::size_t group_of(const std::vector<plangrid::core::TaskGroup>& groups, const std::string& task_id) {
  for (const auto& group : groups) {
    if (std::find(group.task_ids.begin(), group.task_ids.end(), task_id) != group.task_ids.end()) {
      return group.index;
    }
  }
  return static_cast<std::size_t>(-1);
}

// Intent: Civil date helpers should reject impossible days and find month ends.
bool test_date_parse_and_month_bounds() {
  const auto leap = plangrid::core::parse_iso_date("2024-02-29");
  const auto bad = plangrid::core::parse_iso_date("2023-02-29");
  const auto junk = plangrid::core::parse_iso_date("2024-2-9");
  if (!leap.has_value() || bad.has_value() || junk.has_value()) {
    return false;
  }
  return plangrid::core::format_iso_date(*leap) == "2024-02-29" &&
         plangrid::core::last_day_of_month(d(2, 10)) == d(2, 29) &&
         plangrid::core::first_day_of_month(d(3, 17)) == d(3, 1) &&
         plangrid::core::days_between(d(1, 28), d(2, 3)) == 6 &&
         leap->year() == 2024 && leap->month() == 2 && leap->day() == 29;
}

// Intent: Category lookups ignore case and fall back to a neutral style.
bool test_category_table_lookup_and_fallback() {
  const auto table = plangrid::core::make_default_category_table();
  return table.color_of("research") == "#50E3C2" &&
         table.weight_of("Research") == 6 &&
         table.color_of("UNLISTED") == "#CCCCCC" &&
         table.weight_of("UNLISTED") == 5 &&
         table.is_milestone_category("milestone") &&
         !table.is_milestone_category("PROPOSAL") &&
         table.size() == 8;
}

// Intent: A(1-5) and B(3-8) share a group needing 2 rows; C(10-12) stands alone.
bool test_grouping_splits_disjoint_clusters() {
  const std::vector<Task> tasks = {
      make_task("A", d(1, 1), d(1, 5)),
      make_task("B", d(1, 3), d(1, 8)),
      make_task("C", d(1, 10), d(1, 12)),
  };
  const auto groups = plangrid::core::GroupTasks(tasks);
  if (groups.size() != 2) {
    return false;
  }
  return groups[0].task_ids == std::vector<std::string>{"A", "B"} &&
         groups[0].required_rows == 2 &&
         groups[0].start == d(1, 1) &&
         groups[0].end == d(1, 8) &&
         groups[1].task_ids == std::vector<std::string>{"C"} &&
         groups[1].required_rows == 1;
}

// Intent: Overlap chains join one group even when the ends never touch.
bool test_grouping_is_transitive() {
  const std::vector<Task> tasks = {
      make_task("late", d(1, 20), d(1, 21)),
      make_task("C", d(1, 6), d(1, 9)),
      make_task("A", d(1, 1), d(1, 3)),
      make_task("B", d(1, 3), d(1, 6)),
      make_task("D", d(1, 21), d(1, 25)),
      make_task("E", d(1, 12), d(1, 12)),
  };
  const auto groups = plangrid::core::GroupTasks(tasks);
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    for (std::size_t j = 0; j < tasks.size(); ++j) {
      if (plangrid::core::tasks_overlap(tasks[i], tasks[j]) &&
          group_of(groups, tasks[i].id) != group_of(groups, tasks[j].id)) {
        return false;
      }
    }
  }
  return groups.size() == 3 &&
         group_of(groups, "A") == group_of(groups, "C") &&
         group_of(groups, "late") == group_of(groups, "D") &&
         group_of(groups, "E") != group_of(groups, "A");
}

// Intent: Same-day starts order the longer task first inside a group.
bool test_grouping_orders_longer_first_on_tie() {
  const std::vector<Task> tasks = {
      make_task("short", d(1, 4), d(1, 5)),
      make_task("long", d(1, 4), d(1, 14)),
  };
  const auto groups = plangrid::core::GroupTasks(tasks);
  return groups.size() == 1 && groups[0].task_ids == std::vector<std::string>{"long", "short"};
}

// Intent: A row frees up the day after its last task ends.
bool test_rows_reuse_after_end_day() {
  const std::vector<Task> tasks = {
      make_task("A", d(1, 1), d(1, 3)),
      make_task("B", d(1, 3), d(1, 5)),
      make_task("C", d(1, 4), d(1, 6)),
  };
  plangrid::core::TaskGroup group;
  group.task_indices = {0, 1, 2};
  const auto rows = plangrid::core::AssignRows(tasks, group, 3);
  const auto* a = rows.find(0);
  const auto* b = rows.find(1);
  const auto* c = rows.find(2);
  return a != nullptr && b != nullptr && c != nullptr &&
         a->row == 0 && b->row == 1 && c->row == 0 &&
         rows.allocated_rows == 2 && rows.required_rows == 2 && rows.overflow_count == 0;
}

// Intent: Five same-day tasks with three rows use rows 0..2 and put the rest on row 0.
bool test_rows_capacity_bound_overflows_to_row_zero() {
  std::vector<Task> tasks;
  for (int i = 0; i < 5; ++i) {
    tasks.push_back(make_task("T" + std::to_string(i), d(1, 9), d(1, 9)));
  }
  const auto groups = plangrid::core::GroupTasks(tasks);
  if (groups.size() != 1) {
    return false;
  }
  const auto rows = plangrid::core::AssignRows(tasks, groups[0], 3);
  std::set<int> used;
  int row_zero = 0;
  int overflowed = 0;
  for (const auto& slot : rows.slots) {
    if (slot.row < 0 || slot.row >= 3) {
      return false;
    }
    used.insert(slot.row);
    row_zero += slot.row == 0 ? 1 : 0;
    overflowed += slot.overflow ? 1 : 0;
  }
  return used.size() == 3 && row_zero == 3 && overflowed == 2 &&
         rows.overflow_count == 2 && rows.required_rows == 5 && rows.allocated_rows == 3;
}

// Intent: Identical date ranges are a critical identical overlap.
bool test_overlap_identical_is_critical() {
  const Task a = make_task("A", d(1, 1), d(1, 5));
  const Task b = make_task("B", d(1, 1), d(1, 5));
  const auto overlap = OverlapAnalyzer{}.AnalyzePair(a, b);
  return overlap.has_value() &&
         overlap->type == OverlapType::kIdentical &&
         overlap->severity == OverlapSeverity::kCritical &&
         overlap->overlap_days == 5 &&
         almost_equal(overlap->duration_hours, 120.0) &&
         overlap->reason == "Tasks A and B have identical schedules (CRITICAL)" &&
         overlap->hint == "URGENT: Consider merging tasks or adjusting one task's schedule";
}

// Intent: Containment is nested, high severity, and names the inner task first.
bool test_overlap_nested_names_inner_task() {
  const Task outer = make_task("outer", d(1, 1), d(1, 10), 2);
  const Task inner = make_task("inner", d(1, 3), d(1, 5), 4);
  const auto overlap = OverlapAnalyzer{}.AnalyzePair(outer, inner);
  return overlap.has_value() &&
         overlap->type == OverlapType::kNested &&
         overlap->severity == OverlapSeverity::kHigh &&
         overlap->priority == 4 &&
         overlap->reason == "Task inner is completely contained within task outer (HIGH)" &&
         overlap->hint.rfind("Important: ", 0) == 0;
}

// Intent: Partial severity follows the share of the shorter task that is shared.
bool test_overlap_partial_severity_thresholds() {
  const OverlapAnalyzer analyzer;
  const auto medium = analyzer.AnalyzePair(make_task("A", d(1, 1), d(1, 10)), make_task("B", d(1, 9), d(1, 12)));
  const auto high = analyzer.AnalyzePair(make_task("A", d(1, 1), d(1, 10)), make_task("B", d(1, 3), d(1, 12)));
  const auto low = analyzer.AnalyzePair(make_task("A", d(1, 1), d(1, 10)), make_task("B", d(1, 10), d(1, 20)));
  return medium.has_value() && medium->type == OverlapType::kPartial &&
         medium->severity == OverlapSeverity::kMedium && medium->overlap_days == 2 &&
         high.has_value() && high->severity == OverlapSeverity::kHigh &&
         low.has_value() && low->severity == OverlapSeverity::kLow &&
         low->hint == "Consider adjusting start/end times to reduce overlap";
}

// Intent: Touching tasks only count as adjacent when the threshold allows zero overlap.
bool test_overlap_adjacent_respects_threshold() {
  const Task a = make_task("A", d(1, 1), d(1, 3));
  const Task b = make_task("B", d(1, 4), d(1, 6));
  const Task far = make_task("F", d(1, 8), d(1, 9));
  const auto default_result = OverlapAnalyzer{}.AnalyzePair(a, b);
  const auto zero_result = OverlapAnalyzer{0.0}.AnalyzePair(a, b);
  const auto disjoint = OverlapAnalyzer{0.0}.AnalyzePair(a, far);
  return !default_result.has_value() && !disjoint.has_value() &&
         zero_result.has_value() &&
         zero_result->type == OverlapType::kAdjacent &&
         zero_result->severity == OverlapSeverity::kLow &&
         zero_result->overlap_days == 0;
}

// Intent: Swapping the pair never changes overlap type or severity.
bool test_overlap_classification_is_symmetric() {
  const std::vector<Task> tasks = {
      make_task("A", d(1, 1), d(1, 5)),
      make_task("B", d(1, 1), d(1, 5)),
      make_task("C", d(1, 2), d(1, 3)),
      make_task("D", d(1, 4), d(1, 12)),
      make_task("E", d(1, 6), d(1, 6)),
      make_task("F", d(1, 12), d(1, 30)),
  };
  const OverlapAnalyzer analyzer{0.0};
  for (const Task& a : tasks) {
    for (const Task& b : tasks) {
      const auto ab = analyzer.AnalyzePair(a, b);
      const auto ba = analyzer.AnalyzePair(b, a);
      if (ab.has_value() != ba.has_value()) {
        return false;
      }
      if (ab.has_value() && (ab->type != ba->type || ab->severity != ba->severity)) {
        return false;
      }
    }
  }
  return true;
}

// Intent: Group analysis sorts by severity and summarizes the worst conflict.
bool test_overlap_group_summary_and_filters() {
  const std::vector<Task> tasks = {
      make_task("A", d(1, 1), d(1, 10), 1),
      make_task("B", d(1, 8), d(1, 14), 2),
      make_task("C", d(1, 8), d(1, 14), 3),
  };
  const auto groups = plangrid::core::GroupTasks(tasks);
  const auto analysis = OverlapAnalyzer{}.Analyze(tasks, groups);
  if (analysis.groups.size() != 1 || analysis.groups[0].overlaps.size() != 3) {
    return false;
  }
  const auto& group = analysis.groups[0];
  return group.overlaps.front().type == OverlapType::kIdentical &&
         group.max_severity == OverlapSeverity::kCritical &&
         group.resolution == "URGENT: 1 critical conflicts require immediate attention" &&
         analysis.HasCriticalOverlaps() &&
         analysis.critical_count == 1 &&
         analysis.OverlapsByType(OverlapType::kPartial).size() == 2 &&
         analysis.OverlapsBySeverity(OverlapSeverity::kCritical).size() == 1 &&
         analysis.overlapping_task_count == 3;
}

// Intent: A one-day intersection (24h) is dropped once the threshold asks for two days.
bool test_overlap_threshold_drops_short_intersection() {
  const Task a = make_task("A", d(1, 1), d(1, 3));
  const Task one_day = make_task("B", d(1, 3), d(1, 6));
  const Task two_days = make_task("C", d(1, 2), d(1, 6));
  const OverlapAnalyzer strict{48.0};
  const auto dropped = strict.AnalyzePair(a, one_day);
  const auto kept = strict.AnalyzePair(a, two_days);
  return !dropped.has_value() &&
         OverlapAnalyzer{}.AnalyzePair(a, one_day).has_value() &&
         kept.has_value() && kept->overlap_days == 2 && almost_equal(kept->duration_hours, 48.0);
}

Task with_assignee(Task task, const std::string& assignee) {
  task.assignee = assignee;
  return task;
}

// Intent: Conflict rules label overlaps by assignee, category and milestone, highest rule first.
bool test_conflict_rules_categorize_overlaps() {
  const auto registry = plangrid::core::make_default_registry();
  const OverlapAnalyzer analyzer{1.0, registry, d(1, 1)};

  const auto assignee = analyzer.AnalyzePair(with_assignee(make_task("A", d(3, 1), d(3, 10), 2, "RESEARCH"), "kim"),
                                             with_assignee(make_task("B", d(3, 8), d(3, 20), 2, "LASER"), "kim"));
  const auto category = analyzer.AnalyzePair(make_task("C", d(3, 1), d(3, 10), 2, "research"),
                                             make_task("D", d(3, 8), d(3, 20), 2, "RESEARCH "));
  const auto milestone = analyzer.AnalyzePair(make_task("E", d(3, 1), d(3, 10), 2, "RESEARCH"),
                                              make_task("F", d(3, 9), d(3, 9), 2, "ADMIN", "Milestone review"));
  const auto unassigned = analyzer.AnalyzePair(make_task("G", d(3, 1), d(3, 10), 2, "RESEARCH"),
                                               make_task("H", d(3, 8), d(3, 20), 2, "LASER"));

  return assignee.has_value() && assignee->category == OverlapCategory::kAssignee &&
         assignee->rule_name == "SameAssignee" &&
         assignee->cause == "Same person assigned to overlapping tasks" &&
         category.has_value() && category->category == OverlapCategory::kSameCategory &&
         milestone.has_value() && milestone->category == OverlapCategory::kMilestone &&
         unassigned.has_value() && unassigned->category == OverlapCategory::kSchedule &&
         unassigned->rule_name.empty() &&
         std::string(plangrid::core::OverlapCategoryLabel(assignee->category)) == "ASSIGNEE_CONFLICT";
}

// Intent: Higher-priority conflict rules win: long shared spans, deadlines and dependencies beat assignee.
bool test_conflict_rule_priority_order() {
  const auto registry = plangrid::core::make_default_registry();
  const Task a = with_assignee(make_task("A", d(3, 1), d(3, 10), 2, "RESEARCH"), "kim");
  const Task b = with_assignee(make_task("B", d(3, 8), d(3, 20), 2, "LASER"), "kim");
  const Task close = with_assignee(make_task("close", d(3, 2), d(3, 10), 2, "LASER"), "kim");
  Task dependent = close;
  dependent.id = "dependent";
  dependent.dependencies = {"A"};

  const OverlapAnalyzer relaxed{1.0, registry, d(1, 1)};
  const OverlapAnalyzer near_deadline{1.0, registry, d(3, 5)};
  const auto timeline = relaxed.AnalyzePair(a, close);
  const auto deadline = near_deadline.AnalyzePair(a, b);
  const auto dependency = relaxed.AnalyzePair(a, dependent);
  const auto plain = OverlapAnalyzer{}.AnalyzePair(a, b);
  return timeline.has_value() && timeline->category == OverlapCategory::kTimeline &&
         deadline.has_value() && deadline->category == OverlapCategory::kDeadline &&
         dependency.has_value() && dependency->category == OverlapCategory::kDependency &&
         plain.has_value() && plain->category == OverlapCategory::kSchedule &&
         plain->cause == "Tasks scheduled for the same time period";
}

// Intent: Per-category counts add up to the overlap total and match the category filter.
bool test_overlap_analysis_counts_categories() {
  const auto registry = plangrid::core::make_default_registry();
  const std::vector<Task> tasks = {
      with_assignee(make_task("A", d(3, 1), d(3, 10), 2, "RESEARCH"), "kim"),
      with_assignee(make_task("B", d(3, 8), d(3, 20), 2, "LASER"), "kim"),
      make_task("C", d(3, 9), d(3, 12), 2, "RESEARCH"),
  };
  const auto groups = plangrid::core::GroupTasks(tasks);
  const auto analysis = OverlapAnalyzer{1.0, registry, d(1, 1)}.Analyze(tasks, groups);
  std::size_t sum = 0;
  for (const std::size_t count : analysis.category_counts) {
    sum += count;
  }
  return analysis.total_overlaps == 3 && sum == 3 &&
         analysis.CountForCategory(OverlapCategory::kAssignee) == 1 &&
         analysis.CountForCategory(OverlapCategory::kSameCategory) == 1 &&
         analysis.CountForCategory(OverlapCategory::kSchedule) == 1 &&
         analysis.OverlapsByCategory(OverlapCategory::kAssignee).size() == 1 &&
         analysis.OverlapsByCategory(OverlapCategory::kAssignee).front().task_a_id == "A";
}

// Intent: Duration, category and milestone factors shape visual weight.
bool test_visual_weight_factors() {
  const auto table = plangrid::core::make_default_category_table();
  const plangrid::core::PriorityScorer scorer(table);
  const Task long_research = make_task("R", d(1, 1), d(1, 11), 3, "RESEARCH");
  const Task short_proposal = make_task("P", d(1, 1), d(1, 1), 3, "PROPOSAL");
  const Task named_milestone = make_task("M", d(1, 1), d(1, 1), 3, "ADMIN", "Milestone review");
  return almost_equal(scorer.VisualWeight(long_research, 0.5), 0.72) &&
         almost_equal(scorer.VisualWeight(short_proposal, 0.5), 0.08) &&
         almost_equal(scorer.VisualWeight(named_milestone, 0.5), 0.48) &&
         almost_equal(scorer.VisualWeight(long_research, 1.0), 1.0);
}

// Intent: Prominence applies the band multiplier and the milestone category bonus.
bool test_prominence_band_and_category_bonus() {
  const auto table = plangrid::core::make_default_category_table();
  const plangrid::core::PriorityScorer scorer(table);
  const Task research = make_task("R", d(1, 1), d(1, 3), 3, "RESEARCH");
  const Task milestone = make_task("M", d(1, 1), d(1, 1), 3, "MILESTONE");
  return almost_equal(scorer.ProminenceScore(research, 0.5, UrgencyBand::kHigh), 0.4) &&
         almost_equal(scorer.ProminenceScore(milestone, 0.5, UrgencyBand::kCritical), 0.6) &&
         almost_equal(scorer.ProminenceScore(research, 0.5, UrgencyBand::kMinimal), 0.1) &&
         almost_equal(scorer.ProminenceScore(milestone, 1.0, UrgencyBand::kCritical), 1.0);
}

// Intent: Ranking combines importance, timeline and category into a banded score.
bool test_rank_scores_and_bands() {
  const auto table = plangrid::core::make_default_category_table();
  const plangrid::core::PriorityScorer scorer(table);
  const Task task = make_task("R", d(1, 1), d(1, 20), 3, "RESEARCH");
  const auto ranking = scorer.Rank(task, d(1, 1));
  const auto finished = scorer.Rank(task, d(2, 1));
  return almost_equal(ranking.importance, 8.0) &&
         almost_equal(ranking.timeline, 10.0) &&
         almost_equal(ranking.score, 8.5) &&
         ranking.band == UrgencyBand::kMedium &&
         almost_equal(ranking.base_weight, 0.425) &&
         ranking.style.z_order == 6 &&
         almost_equal(finished.timeline, 0.0) &&
         plangrid::core::BandForScore(15.0) == UrgencyBand::kCritical &&
         plangrid::core::BandForScore(14.99) == UrgencyBand::kHigh &&
         plangrid::core::BandForScore(3.0) == UrgencyBand::kLow &&
         plangrid::core::BandForScore(2.9) == UrgencyBand::kMinimal &&
         almost_equal(plangrid::core::StyleForBand(UrgencyBand::kMinimal).opacity, 0.7);
}

// Intent: A flagged milestone inside a long research task outranks it and keeps its place.
bool test_milestone_outranks_research_in_collision() {
  const auto registry = plangrid::core::make_default_registry();
  const GridConfig config = january_config();
  const plangrid::core::PriorityScorer scorer(registry.categories);
  const Task research = make_task("research", d(1, 1), d(1, 31), 3, "RESEARCH", "Thesis research");
  Task milestone = make_task("defense", d(1, 15), d(1, 15), 4, "MILESTONE", "MILESTONE: Proposal defense");

  const auto research_rank = scorer.Rank(research, config.current_date);
  const auto milestone_rank = scorer.Rank(milestone, config.current_date);
  if (!almost_equal(research_rank.prominence, 0.3672) || !almost_equal(milestone_rank.prominence, 0.62496)) {
    return false;
  }

  Task unflagged = milestone;
  unflagged.name = "Proposal defense";
  if (!almost_equal(scorer.VisualWeight(milestone, 0.5) / scorer.VisualWeight(unflagged, 0.5), 1.5)) {
    return false;
  }

  const plangrid::core::SpatialPositioner positioner(registry, config);
  std::vector<TaskBar> bars = {
      positioner.CreateBar({&research, research_rank, 0, 0, 0}),
      positioner.CreateBar({&milestone, milestone_rank, 0, 1, 0}),
  };
  const double milestone_y = bars[1].bounds.y;
  const std::size_t pushes = positioner.ResolveCollisions(bars);
  const TaskBar* moved = find_bar(bars, "research");
  const TaskBar* kept = find_bar(bars, "defense");
  return pushes == 1 && moved != nullptr && kept != nullptr &&
         bars.front().task_id == "defense" &&
         almost_equal(kept->bounds.y, milestone_y) &&
         almost_equal(moved->bounds.y, kept->bounds.bottom() + config.collision_buffer);
}

// Intent: X comes from elapsed days and width from the inclusive span.
bool test_positioning_x_and_width_from_days() {
  const auto registry = plangrid::core::make_default_registry();
  const GridConfig config = january_config();
  const plangrid::core::SpatialPositioner positioner(registry, config);
  const Task task = make_task("T", d(1, 3), d(1, 5));
  plangrid::core::TaskRanking ranking;
  ranking.visual_weight = 0.25;
  const TaskBar bar = positioner.CreateBar({&task, ranking, 0, 0, 0});
  return almost_equal(bar.bounds.x, 40.0) &&
         almost_equal(bar.bounds.width, 60.0) &&
         almost_equal(bar.bounds.height, config.row_height * 0.5) &&
         bar.color == "#50E3C2" &&
         bar.is_start && bar.is_end && !bar.is_continuation && !bar.crosses_month_boundary;
}

// Intent: Alignment rules anchor high priority at the top and center milestones.
bool test_positioning_alignment_rules() {
  const auto registry = plangrid::core::make_default_registry();
  const GridConfig config = january_config();
  const plangrid::core::SpatialPositioner positioner(registry, config);
  const Task urgent = make_task("U", d(1, 3), d(1, 5), 5);
  const Task milestone = make_task("M", d(1, 3), d(1, 3), 2, "ADMIN", "Milestone check");
  const Task plain = make_task("P", d(1, 3), d(1, 5), 2);
  plangrid::core::TaskRanking ranking;
  ranking.visual_weight = 0.5;

  const TaskBar top = positioner.CreateBar({&urgent, ranking, 1, 0, 0});
  const TaskBar middle = positioner.CreateBar({&milestone, ranking, 1, 0, 0});
  const TaskBar other = positioner.CreateBar({&plain, ranking, 1, 0, 0});

  plangrid::core::LayoutRegistry bare;
  const plangrid::core::SpatialPositioner bare_positioner(bare, config);
  const TaskBar unruled = bare_positioner.CreateBar({&plain, ranking, 1, 0, 0});

  return top.alignment == AlignmentMode::kTop && almost_equal(top.bounds.y, 14.0) &&
         middle.alignment == AlignmentMode::kMiddle && almost_equal(middle.bounds.y, 17.5) &&
         other.alignment == AlignmentMode::kDefault && almost_equal(other.bounds.y, 15.4) &&
         almost_equal(unruled.bounds.y, 14.0) && unruled.color == "#CCCCCC";
}

// Intent: Category-equals rules in a custom registry take precedence by rule priority.
bool test_registry_custom_rule_priority() {
  auto registry = plangrid::core::make_default_registry();
  registry.AddAlignmentRule({
      "LaserBottom",
      20,
      {plangrid::core::AlignmentConditionKind::kCategoryEquals, 0, "laser"},
      AlignmentMode::kBottom,
      0.0,
  });
  plangrid::core::RuleSubject laser{5, false, "LASER"};
  plangrid::core::RuleSubject other{5, false, "ADMIN"};
  const auto* laser_rule = registry.MatchAlignment(laser);
  const auto* other_rule = registry.MatchAlignment(other);
  const auto* spacing = registry.MatchSpacing({1, false, "ADMIN"}, {4, false, "ADMIN"});
  return laser_rule != nullptr && laser_rule->name == "LaserBottom" &&
         other_rule != nullptr && other_rule->name == "HighPriority" &&
         spacing != nullptr && almost_equal(spacing->vertical_spacing, 3.0);
}

// Intent: Spacing rules widen tight vertical gaps within the configured limits.
bool test_spacing_rules_widen_gaps() {
  const auto registry = plangrid::core::make_default_registry();
  GridConfig config = january_config();

  auto make_bars = [](int upper_priority) {
    TaskBar upper;
    upper.task_id = "upper";
    upper.priority = upper_priority;
    upper.bounds = {0.0, 0.0, 40.0, 10.0};
    TaskBar lower;
    lower.task_id = "lower";
    lower.priority = 1;
    lower.bounds = {20.0, 10.5, 40.0, 10.0};
    return std::vector<TaskBar>{upper, lower};
  };

  std::vector<TaskBar> plain = make_bars(1);
  const std::size_t plain_moves = plangrid::core::SpatialPositioner(registry, config).ApplySpacing(plain);
  std::vector<TaskBar> urgent = make_bars(5);
  plangrid::core::SpatialPositioner(registry, config).ApplySpacing(urgent);
  config.max_task_spacing = 2.0;
  std::vector<TaskBar> capped = make_bars(5);
  plangrid::core::SpatialPositioner(registry, config).ApplySpacing(capped);

  return plain_moves == 1 &&
         almost_equal(find_bar(plain, "lower")->bounds.y, 11.0) &&
         almost_equal(find_bar(urgent, "lower")->bounds.y, 13.0) &&
         almost_equal(find_bar(capped, "lower")->bounds.y, 12.0);
}

// Intent: Snapping rounds bar edges to the grid resolution.
bool test_snap_rounds_edges() {
  const auto registry = plangrid::core::make_default_registry();
  const GridConfig config = january_config();
  const plangrid::core::SpatialPositioner positioner(registry, config);
  TaskBar bar;
  bar.bounds = {0.4, 1.6, 9.3, 7.7};
  std::vector<TaskBar> bars = {bar};
  positioner.SnapToGrid(bars);
  return almost_equal(bars[0].bounds.x, 0.0) &&
         almost_equal(bars[0].bounds.width, 10.0) &&
         almost_equal(bars[0].bounds.y, 2.0) &&
         almost_equal(bars[0].bounds.height, 7.0);
}

// Intent: One collision pass can leave residue that FindCollisions reports.
bool test_collision_single_pass_leaves_residue() {
  const auto registry = plangrid::core::make_default_registry();
  const GridConfig config = january_config();
  const plangrid::core::SpatialPositioner positioner(registry, config);

  auto make_bar = [](const std::string& id, double prominence, double y) {
    TaskBar bar;
    bar.task_id = id;
    bar.prominence = prominence;
    bar.bounds = {0.0, y, 100.0, 10.0};
    return bar;
  };
  std::vector<TaskBar> bars = {make_bar("C", 0.1, 5.0), make_bar("A", 0.9, 20.0), make_bar("B", 0.5, 0.0)};
  const std::size_t pushes = positioner.ResolveCollisions(bars);
  const auto residue = plangrid::core::FindCollisions(bars);
  return pushes == 1 &&
         bars[0].task_id == "A" && bars[1].task_id == "B" && bars[2].task_id == "C" &&
         almost_equal(bars[2].bounds.y, 10.5) &&
         residue.size() == 1 && residue[0].first == 0 && residue[0].second == 2;
}

// Intent: Jan 28 - Feb 3 splits into a starting January slice and a continued February slice.
bool test_segmentation_splits_at_month_end() {
  GridConfig config = plangrid::core::make_default_grid_config(d(1, 1), d(2, 29));
  config.current_date = d(1, 1);
  const LayoutEngine engine;
  const auto result = engine.Run({make_task("T", d(1, 28), d(2, 3))}, config);
  if (!result.ok) {
    return false;
  }
  const auto segments = result.value.BarsForTask("T");
  if (segments.size() != 2) {
    return false;
  }
  const TaskBar& jan = *segments[0];
  const TaskBar& feb = *segments[1];
  const auto february = result.value.BarsForMonth(2024, 2);
  return jan.start == d(1, 28) && jan.end == d(1, 31) &&
         jan.is_start && !jan.is_continuation && !jan.is_end &&
         feb.start == d(2, 1) && feb.end == d(2, 3) &&
         feb.is_continuation && feb.is_end && !feb.is_start &&
         almost_equal(jan.bounds.x, 540.0) && almost_equal(jan.bounds.width, 80.0) &&
         almost_equal(feb.bounds.x, 622.0) && almost_equal(feb.bounds.width, 58.0) &&
         jan.segment_count == 2 && feb.segment_index == 1 &&
         february.size() == 1 && february[0] == &feb &&
         result.value.statistics.month_boundary_count == 1;
}

// Intent: Crossing N month boundaries yields N+1 contiguous segments with one start and one end.
bool test_segmentation_partitions_span() {
  GridConfig config = plangrid::core::make_default_grid_config(d(11, 1, 2023), d(3, 31));
  TaskBar bar;
  bar.task_id = "long";
  bar.start = d(11, 20, 2023);
  bar.end = d(3, 10);
  bar.crosses_month_boundary = true;
  const auto segments = plangrid::core::SegmentAtMonthBoundaries(bar, config);
  if (segments.size() != 5 || segments.front().start != bar.start || segments.back().end != bar.end) {
    return false;
  }
  int starts = 0;
  int ends = 0;
  for (std::size_t i = 0; i < segments.size(); ++i) {
    starts += segments[i].is_start ? 1 : 0;
    ends += segments[i].is_end ? 1 : 0;
    if (segments[i].task_id != "long" || segments[i].end < segments[i].start) {
      return false;
    }
    if (i > 0 && (segments[i].start != plangrid::core::add_days(segments[i - 1].end, 1) ||
                  !segments[i].is_continuation)) {
      return false;
    }
  }
  return starts == 1 && ends == 1 && segments.front().is_start && segments.back().is_end;
}

// Intent: Segmenting a bar that stays inside one month returns it unchanged.
bool test_segmentation_single_month_is_identity() {
  const GridConfig config = january_config();
  TaskBar bar;
  bar.task_id = "T";
  bar.start = d(1, 10);
  bar.end = d(1, 14);
  bar.month = plangrid::core::month_key(bar.start);
  bar.bounds = {180.0, 3.0, 100.0, 9.0};
  bar.row = 1;
  const auto once = plangrid::core::SegmentAtMonthBoundaries(bar, config);
  if (once.size() != 1) {
    return false;
  }
  const auto twice = plangrid::core::SegmentAtMonthBoundaries(once[0], config);
  const TaskBar& s = twice.size() == 1 ? twice[0] : bar;
  return twice.size() == 1 && s.start == bar.start && s.end == bar.end && s.month == bar.month &&
         almost_equal(s.bounds.x, bar.bounds.x) && almost_equal(s.bounds.y, bar.bounds.y) &&
         almost_equal(s.bounds.width, bar.bounds.width) && almost_equal(s.bounds.height, bar.bounds.height) &&
         s.row == bar.row && s.is_start == bar.is_start && s.is_end == bar.is_end &&
         s.is_continuation == bar.is_continuation && s.segment_count == 1 && s.segment_index == 0;
}

// Intent: Structurally invalid configs fail before any layout work.
bool test_engine_rejects_invalid_config() {
  const LayoutEngine engine;
  const std::vector<Task> tasks = {make_task("A", d(1, 1), d(1, 5))};

  GridConfig zero_width = january_config();
  zero_width.day_width = 0.0;
  GridConfig no_rows = january_config();
  no_rows.max_rows_per_day = 0;
  GridConfig inverted = january_config();
  inverted.calendar_end = d(1, 1, 2023);

  const auto width_result = engine.Run(tasks, zero_width);
  const auto rows_result = engine.Run(tasks, no_rows);
  const auto inverted_result = engine.Run(tasks, inverted);
  return !width_result.ok && width_result.value.bars.empty() &&
         width_result.error.find("DayWidthNonPositive") != std::string::npos &&
         !rows_result.ok && has_issue_code(rows_result.validation, "MaxRowsNonPositive") &&
         !inverted_result.ok && has_issue_code(inverted_result.validation, "CalendarRangeInverted");
}

// Intent: A tall row height only warns and the run still completes.
bool test_engine_accepts_config_warning() {
  GridConfig config = january_config();
  config.row_height = config.day_height + 10.0;
  const auto result = LayoutEngine{}.Run({make_task("A", d(1, 1), d(1, 5))}, config);
  return result.ok && has_issue_code(result.validation, "RowHeightExceedsDayHeight") &&
         result.value.bars.size() == 1;
}

// Intent: Two identical tasks produce one critical identical overlap and a conflict recommendation.
bool test_engine_reports_identical_overlap() {
  const auto result = LayoutEngine{}.Run(
      {make_task("A", d(1, 1), d(1, 5)), make_task("B", d(1, 1), d(1, 5))}, january_config());
  if (!result.ok || result.value.overlaps.total_overlaps != 1) {
    return false;
  }
  const auto& overlap = result.value.overlaps.groups[0].overlaps[0];
  return overlap.type == OverlapType::kIdentical &&
         overlap.severity == OverlapSeverity::kCritical &&
         contains_text(result.value.recommendations, "critical schedule conflict");
}

// Intent: Overcrowded days keep every task, reuse row 0 and recommend more rows.
bool test_engine_overcrowding_advisory() {
  std::vector<Task> tasks;
  for (int i = 0; i < 5; ++i) {
    tasks.push_back(make_task("T" + std::to_string(i), d(1, 9), d(1, 9), 1 + i % 3));
  }
  GridConfig config = january_config();
  config.max_rows_per_day = 3;
  const auto result = LayoutEngine{}.Run(tasks, config);
  if (!result.ok || result.value.bars.size() != 5) {
    return false;
  }
  std::set<int> rows;
  int row_zero = 0;
  for (const TaskBar& bar : result.value.bars) {
    rows.insert(bar.row);
    row_zero += bar.row == 0 ? 1 : 0;
  }
  return rows == std::set<int>{0, 1, 2} && row_zero == 3 &&
         result.value.statistics.overflow_task_count == 2 &&
         result.value.groups[0].overflow_count == 2 &&
         contains_text(result.value.recommendations, "Overcrowded days: 2 task(s) exceeded 3 rows");
}

// Intent: Reversed or out-of-range tasks are skipped instead of failing the run.
bool test_engine_skips_unusable_tasks() {
  const std::vector<Task> tasks = {
      make_task("ok", d(1, 4), d(1, 6)),
      make_task("reversed", d(1, 9), d(1, 2)),
      make_task("outside", d(3, 1), d(3, 4)),
  };
  const auto result = LayoutEngine{}.Run(tasks, january_config());
  return result.ok && result.value.bars.size() == 1 &&
         result.value.skipped_task_ids == std::vector<std::string>{"reversed", "outside"};
}

// Intent: Tasks running past the calendar range are clipped and flagged.
bool test_engine_clips_to_calendar_range() {
  const auto result = LayoutEngine{}.Run({make_task("edge", d(12, 28, 2023), d(1, 3))}, january_config());
  if (!result.ok || result.value.bars.size() != 1) {
    return false;
  }
  const TaskBar& bar = result.value.bars[0];
  return bar.start == d(1, 1) && bar.end == d(1, 3) &&
         bar.is_continuation && !bar.is_start && bar.is_end &&
         almost_equal(bar.bounds.x, 0.0) && almost_equal(bar.bounds.width, 60.0);
}

// Intent: The milestone in a full run sits above the research task without being pushed.
bool test_engine_milestone_not_displaced() {
  const Task research = make_task("research", d(1, 1), d(1, 31), 3, "RESEARCH", "Thesis research");
  const Task milestone = make_task("defense", d(1, 15), d(1, 15), 4, "MILESTONE", "MILESTONE: Proposal defense");
  const auto result = LayoutEngine{}.Run({research, milestone}, january_config());
  if (!result.ok) {
    return false;
  }
  const TaskBar* r = find_bar(result.value.bars, "research");
  const TaskBar* m = find_bar(result.value.bars, "defense");
  return r != nullptr && m != nullptr &&
         m->prominence > r->prominence &&
         m->row == 1 && almost_equal(m->bounds.y, 14.0) &&
         result.value.statistics.resolved_conflicts == 0 &&
         result.value.residual_collisions.empty();
}

// Intent: Statistics match the bar geometry they summarize.
bool test_engine_statistics_match_geometry() {
  GridConfig config = plangrid::core::make_default_grid_config(d(1, 1), d(1, 10));
  config.day_width = 10.0;
  config.row_height = 10.0;
  config.max_rows_per_day = 1;
  const auto result = LayoutEngine{}.Run({make_task("solo", d(1, 1), d(1, 10))}, config);
  if (!result.ok || result.value.bars.size() != 1) {
    return false;
  }
  const TaskBar& bar = result.value.bars[0];
  const auto& stats = result.value.statistics;
  const double covered_rows =
      std::min(10.0, std::ceil(bar.bounds.bottom())) - std::max(0.0, std::floor(bar.bounds.y));
  return stats.bar_count == 1 && stats.task_count == 1 && stats.group_count == 1 &&
         almost_equal(stats.space_efficiency, bar.bounds.area() / 1000.0) &&
         almost_equal(stats.grid_utilization, covered_rows / 10.0) &&
         almost_equal(stats.alignment_score, 1.0) &&
         almost_equal(stats.average_bar_width, 100.0) &&
         almost_equal(stats.max_stack_height, bar.bounds.height) &&
         stats.visual_balance > 0.0 && stats.visual_balance <= 1.0 &&
         contains_text(result.value.recommendations, "Consider reducing task spacing") ==
             (stats.space_efficiency < 0.7);
}

// Intent: Identical inputs give identical geometry and statistics.
bool test_engine_is_deterministic() {
  const auto tasks = plangrid::core::make_demo_tasks(2024);
  GridConfig config = plangrid::core::make_default_grid_config(d(1, 1), d(2, 29));
  config.current_date = d(1, 10);
  const LayoutEngine engine;
  const auto first = engine.Run(tasks, config);
  const auto second = engine.Run(tasks, config);
  if (!first.ok || !second.ok || first.value.bars.size() != second.value.bars.size()) {
    return false;
  }
  for (std::size_t i = 0; i < first.value.bars.size(); ++i) {
    const TaskBar& a = first.value.bars[i];
    const TaskBar& b = second.value.bars[i];
    if (a.task_id != b.task_id || a.start != b.start || a.end != b.end || a.row != b.row ||
        a.bounds.x != b.bounds.x || a.bounds.y != b.bounds.y || a.bounds.width != b.bounds.width ||
        a.bounds.height != b.bounds.height || a.prominence != b.prominence) {
      return false;
    }
  }
  const auto& s1 = first.value.statistics;
  const auto& s2 = second.value.statistics;
  return s1.space_efficiency == s2.space_efficiency && s1.alignment_score == s2.alignment_score &&
         s1.visual_balance == s2.visual_balance && s1.grid_utilization == s2.grid_utilization &&
         s1.resolved_conflicts == s2.resolved_conflicts &&
         first.value.recommendations == second.value.recommendations;
}

// Intent: A task split at a month end weighs in once, so a lone full-calendar task centers horizontally.
bool test_engine_visual_balance_weighs_segments_by_width() {
  GridConfig config = plangrid::core::make_default_grid_config(d(1, 1), d(2, 29));
  config.month_boundary_gap = 0.0;
  config.snap_to_grid = false;
  const auto result = LayoutEngine{}.Run({make_task("long", d(1, 1), d(2, 29))}, config);
  if (!result.ok || result.value.bars.size() != 2) {
    return false;
  }
  const auto& bars = result.value.bars;
  const double center_y = bars[0].bounds.center().y;
  const double half_height = config.max_rows_per_day * config.row_height * 0.5;
  const double expected = 1.0 - std::abs(center_y - half_height) / std::hypot(600.0, half_height);
  return almost_equal(bars[0].bounds.width, 620.0) && almost_equal(bars[1].bounds.width, 580.0) &&
         almost_equal(bars[1].bounds.center().y, center_y) &&
         almost_equal(result.value.statistics.visual_balance, expected);
}

// Intent: Huge day widths keep utilization bounded, and overflowing extents are rejected.
bool test_engine_bounds_oversized_grid() {
  GridConfig wide = january_config();
  wide.day_width = 1e300;
  const auto result = LayoutEngine{}.Run({make_task("A", d(1, 5), d(1, 6))}, wide);

  GridConfig overflowing = january_config();
  overflowing.day_width = 1e307;
  const auto rejected = LayoutEngine{}.Run({make_task("A", d(1, 5), d(1, 6))}, overflowing);

  return result.ok && std::isfinite(result.value.statistics.grid_utilization) &&
         result.value.statistics.grid_utilization >= 0.0 && result.value.statistics.grid_utilization <= 1.0 &&
         !rejected.ok && has_issue_code(rejected.validation, "GridExtentNonFinite") &&
         rejected.error.find("GridExtentNonFinite") != std::string::npos;
}

// Intent: Demo tasks exercise month crossing, overcrowding and a critical overlap.
bool test_demo_tasks_cover_layout_cases() {
  const auto tasks = plangrid::core::make_demo_tasks(2024);
  GridConfig config = plangrid::core::make_default_grid_config(d(1, 1), d(2, 29));
  config.current_date = d(1, 10);
  const auto result = LayoutEngine{}.Run(tasks, config);
  if (!result.ok) {
    return false;
  }
  const bool has_crossing = std::any_of(result.value.bars.begin(), result.value.bars.end(),
                                        [](const TaskBar& bar) { return bar.segment_count > 1; });
  const auto& overlaps = result.value.overlaps;
  std::size_t categorized = 0;
  for (const std::size_t count : overlaps.category_counts) {
    categorized += count;
  }
  return tasks.size() >= 12 && has_crossing &&
         result.value.statistics.overflow_task_count > 0 &&
         overlaps.HasCriticalOverlaps() &&
         categorized == overlaps.total_overlaps &&
         overlaps.CountForCategory(OverlapCategory::kAssignee) == 2 &&
         overlaps.CountForCategory(OverlapCategory::kDependency) == 1 &&
         contains_text(result.value.recommendations, "2 overlap(s) share an assignee") &&
         result.value.skipped_task_ids.empty();
}

}  // namespace

int main() {
  spdlog::set_level(spdlog::level::warn);

  const std::vector<TestCase> tests = {
      {"Date_ParseAndMonthBounds", "ISO parsing and month helpers", test_date_parse_and_month_bounds},
      {"Category_LookupFallback", "Case-insensitive lookup with neutral fallback", test_category_table_lookup_and_fallback},
      {"Grouping_DisjointClusters", "A/B share a 2-row group, C is alone", test_grouping_splits_disjoint_clusters},
      {"Grouping_Transitive", "Overlap chains close into one group", test_grouping_is_transitive},
      {"Grouping_LongerFirstOnTie", "Longer task leads on equal start", test_grouping_orders_longer_first_on_tie},
      {"Rows_ReuseAfterEndDay", "Rows free the day after the end date", test_rows_reuse_after_end_day},
      {"Rows_CapacityBound", "Overflow lands on row 0 within the cap", test_rows_capacity_bound_overflows_to_row_zero},
      {"Overlap_IdenticalCritical", "Identical ranges are critical", test_overlap_identical_is_critical},
      {"Overlap_NestedInnerFirst", "Nested overlap names the inner task", test_overlap_nested_names_inner_task},
      {"Overlap_PartialThresholds", "Partial severity by shared share", test_overlap_partial_severity_thresholds},
      {"Overlap_AdjacentThreshold", "Adjacent only with a zero threshold", test_overlap_adjacent_respects_threshold},
      {"Overlap_Symmetric", "Pair order does not change classification", test_overlap_classification_is_symmetric},
      {"Overlap_GroupSummary", "Group result sorts and summarizes", test_overlap_group_summary_and_filters},
      {"Overlap_ThresholdDropsShort", "Intersections under the threshold are dropped", test_overlap_threshold_drops_short_intersection},
      {"Conflict_Categories", "Assignee/category/milestone labels", test_conflict_rules_categorize_overlaps},
      {"Conflict_RulePriority", "Higher conflict rules win", test_conflict_rule_priority_order},
      {"Conflict_CategoryCounts", "Category counts add up", test_overlap_analysis_counts_categories},
      {"Scoring_VisualWeightFactors", "Duration/category/milestone factors", test_visual_weight_factors},
      {"Scoring_ProminenceBands", "Band multiplier and category bonus", test_prominence_band_and_category_bonus},
      {"Scoring_RankBands", "Ranking score and band thresholds", test_rank_scores_and_bands},
      {"Scoring_MilestoneWinsCollision", "Milestone outranks research and stays put", test_milestone_outranks_research_in_collision},
      {"Positioning_XWidth", "X and width from elapsed days", test_positioning_x_and_width_from_days},
      {"Positioning_AlignmentRules", "Top/middle/default anchoring", test_positioning_alignment_rules},
      {"Registry_CustomRulePriority", "Higher rule priority matches first", test_registry_custom_rule_priority},
      {"Positioning_SpacingRules", "Spacing widens tight gaps within limits", test_spacing_rules_widen_gaps},
      {"Positioning_SnapEdges", "Snapping rounds edges", test_snap_rounds_edges},
      {"Collision_SinglePassResidue", "Single pass may leave residue", test_collision_single_pass_leaves_residue},
      {"Segmentation_MonthEnd", "Jan 28 - Feb 3 becomes two segments", test_segmentation_splits_at_month_end},
      {"Segmentation_Partition", "Segments partition a multi-month span", test_segmentation_partitions_span},
      {"Segmentation_SingleMonthIdentity", "Single-month bar is unchanged", test_segmentation_single_month_is_identity},
      {"Engine_InvalidConfig", "Invalid config fails fast", test_engine_rejects_invalid_config},
      {"Engine_ConfigWarning", "Warnings do not stop a run", test_engine_accepts_config_warning},
      {"Engine_IdenticalOverlap", "Identical tasks report a critical overlap", test_engine_reports_identical_overlap},
      {"Engine_Overcrowding", "Overcrowding degrades and is reported", test_engine_overcrowding_advisory},
      {"Engine_SkipsUnusableTasks", "Reversed/out-of-range tasks are skipped", test_engine_skips_unusable_tasks},
      {"Engine_ClipsToCalendar", "Bars clip to the calendar range", test_engine_clips_to_calendar_range},
      {"Engine_MilestoneNotDisplaced", "Milestone keeps its slot in a full run", test_engine_milestone_not_displaced},
      {"Engine_StatisticsGeometry", "Statistics agree with bar geometry", test_engine_statistics_match_geometry},
      {"Engine_Deterministic", "Repeated runs are identical", test_engine_is_deterministic},
      {"Engine_VisualBalanceSegments", "Segments share their task's weight", test_engine_visual_balance_weighs_segments_by_width},
      {"Engine_OversizedGrid", "Huge extents stay bounded or are rejected", test_engine_bounds_oversized_grid},
      {"Engine_DemoTasks", "Demo data covers the interesting cases", test_demo_tasks_cover_layout_cases},
  };

  bool all_passed = true;
  for (const TestCase& test : tests) {
    const bool passed = test.run();
    std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
    all_passed = all_passed && passed;
  }

  if (!all_passed) {
    std::cerr << "core tests failed\n";
    return 1;
  }

  std::cout << "core tests passed (" << tests.size() << " cases)\n";
  return 0;
}

#include "plangrid/core/priority_scoring.hpp"

#include <algorithm>

namespace plangrid::core {

namespace {

constexpr double kMilestoneImportanceBonus = 10.0;
constexpr double kScoreNormalizer = 20.0;
constexpr double kNeutralCategoryWeightD = 5.0;
constexpr double kLongTaskFactor = 1.2;
constexpr double kShortTaskFactor = 0.8;
constexpr double kMilestoneNameFactor = 1.5;
constexpr double kMilestoneCategoryFactor = 1.2;

double duration_bonus(int duration) {
  if (duration > 30) {
    return 3.0;
  }
  if (duration > 7) {
    return 2.0;
  }
  if (duration > 1) {
    return 1.0;
  }
  return 0.0;
}

double start_urgency(int days_until_start) {
  if (days_until_start <= 0) {
    return 10.0;
  }
  if (days_until_start <= 1) {
    return 8.0;
  }
  if (days_until_start <= 3) {
    return 6.0;
  }
  if (days_until_start <= 7) {
    return 4.0;
  }
  if (days_until_start <= 14) {
    return 2.0;
  }
  return 0.0;
}

double end_urgency(int days_until_end) {
  if (days_until_end <= 0) {
    return 15.0;
  }
  if (days_until_end <= 1) {
    return 12.0;
  }
  if (days_until_end <= 3) {
    return 8.0;
  }
  if (days_until_end <= 7) {
    return 5.0;
  }
  if (days_until_end <= 14) {
    return 3.0;
  }
  return 0.0;
}

}  // namespace

const char* UrgencyBandLabel(UrgencyBand band) {
  switch (band) {
  case UrgencyBand::kMinimal:
    return "MINIMAL";
  case UrgencyBand::kLow:
    return "LOW";
  case UrgencyBand::kMedium:
    return "MEDIUM";
  case UrgencyBand::kHigh:
    return "HIGH";
  case UrgencyBand::kCritical:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

double UrgencyMultiplier(UrgencyBand band) {
  switch (band) {
  case UrgencyBand::kCritical:
    return 1.0;
  case UrgencyBand::kHigh:
    return 0.8;
  case UrgencyBand::kMedium:
    return 0.6;
  case UrgencyBand::kLow:
    return 0.4;
  case UrgencyBand::kMinimal:
    return 0.2;
  default:
    return 0.5;
  }
}

UrgencyBand BandForScore(double score) {
  if (score >= 15.0) {
    return UrgencyBand::kCritical;
  }
  if (score >= 10.0) {
    return UrgencyBand::kHigh;
  }
  if (score >= 6.0) {
    return UrgencyBand::kMedium;
  }
  if (score >= 3.0) {
    return UrgencyBand::kLow;
  }
  return UrgencyBand::kMinimal;
}

BarStyle StyleForBand(UrgencyBand band) {
  switch (band) {
  case UrgencyBand::kCritical:
    return {1.0, 10, 3.0};
  case UrgencyBand::kHigh:
    return {1.0, 8, 2.0};
  case UrgencyBand::kMedium:
    return {1.0, 6, 1.5};
  case UrgencyBand::kLow:
    return {1.0, 4, 1.0};
  case UrgencyBand::kMinimal:
    return {0.7, 2, 0.5};
  default:
    return {};
  }
}

double PriorityScorer::ImportanceScore(const Task& task) const {
  double score = static_cast<double>(task.priority) * 2.0;
  if (signals_milestone(task)) {
    score += kMilestoneImportanceBonus;
  }
  return score + duration_bonus(duration_days(task));
}

double PriorityScorer::TimelineScore(const Task& task, Date current_date) const {
  if (task.end < current_date) {
    return 0.0;
  }
  return start_urgency(days_between(current_date, task.start)) + end_urgency(days_between(current_date, task.end));
}

double PriorityScorer::UrgencyScore(const Task& task, Date current_date) const {
  const double category = static_cast<double>(categories_->weight_of(task.category));
  return weights_.importance * ImportanceScore(task) + weights_.timeline * TimelineScore(task, current_date) +
         weights_.category * category;
}

double PriorityScorer::BaseWeight(const Task& task, Date current_date) const {
  return std::clamp(UrgencyScore(task, current_date) / kScoreNormalizer, 0.0, 1.0);
}

double PriorityScorer::VisualWeight(const Task& task, double base_weight) const {
  double weight = base_weight;
  const int duration = duration_days(task);
  if (duration > 7) {
    weight *= kLongTaskFactor;
  } else if (duration < 1) {
    weight *= kShortTaskFactor;
  }
  weight *= static_cast<double>(categories_->weight_of(task.category)) / kNeutralCategoryWeightD;
  if (signals_milestone(task)) {
    weight *= kMilestoneNameFactor;
  }
  return std::clamp(weight, 0.0, 1.0);
}

double PriorityScorer::ProminenceScore(const Task& task, double visual_weight, UrgencyBand band) const {
  double score = visual_weight * UrgencyMultiplier(band);
  if (categories_->is_milestone_category(task.category)) {
    score *= kMilestoneCategoryFactor;
  }
  return std::clamp(score, 0.0, 1.0);
}

TaskRanking PriorityScorer::Rank(const Task& task, Date current_date) const {
  TaskRanking ranking;
  ranking.importance = ImportanceScore(task);
  ranking.timeline = TimelineScore(task, current_date);
  ranking.category = static_cast<double>(categories_->weight_of(task.category));
  ranking.score = weights_.importance * ranking.importance + weights_.timeline * ranking.timeline +
                  weights_.category * ranking.category;
  ranking.band = BandForScore(ranking.score);
  ranking.base_weight = std::clamp(ranking.score / kScoreNormalizer, 0.0, 1.0);
  ranking.visual_weight = VisualWeight(task, ranking.base_weight);
  ranking.prominence = ProminenceScore(task, ranking.visual_weight, ranking.band);
  ranking.style = StyleForBand(ranking.band);
  return ranking;
}

}  // namespace plangrid::core

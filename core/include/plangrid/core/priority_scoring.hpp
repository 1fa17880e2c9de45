#pragma once

#include <cstdint>

#include "plangrid/core/category_table.hpp"
#include "plangrid/core/date.hpp"
#include "plangrid/core/task.hpp"

namespace plangrid::core {

enum class UrgencyBand : std::uint8_t {
  kMinimal = 0,
  kLow = 1,
  kMedium = 2,
  kHigh = 3,
  kCritical = 4,
};

struct RankingWeights {
  double importance = 0.45;
  double timeline = 0.40;
  double category = 0.15;
};

struct BarStyle {
  double opacity = 1.0;
  int z_order = 1;
  double border_width = 1.0;
};

struct TaskRanking {
  double importance = 0.0;
  double timeline = 0.0;
  double category = 0.0;
  double score = 0.0;
  UrgencyBand band = UrgencyBand::kMinimal;
  double base_weight = 0.0;
  double visual_weight = 0.0;
  double prominence = 0.0;
  BarStyle style{};
};

const char* UrgencyBandLabel(UrgencyBand band);
[[nodiscard]] double UrgencyMultiplier(UrgencyBand band);
[[nodiscard]] UrgencyBand BandForScore(double score);
[[nodiscard]] BarStyle StyleForBand(UrgencyBand band);

class PriorityScorer {
 public:
  explicit PriorityScorer(const CategoryTable& categories, RankingWeights weights = {})
      : categories_(&categories), weights_(weights) {}

  [[nodiscard]] double ImportanceScore(const Task& task) const;
  [[nodiscard]] double TimelineScore(const Task& task, Date current_date) const;
  [[nodiscard]] double UrgencyScore(const Task& task, Date current_date) const;
  [[nodiscard]] double BaseWeight(const Task& task, Date current_date) const;

  [[nodiscard]] double VisualWeight(const Task& task, double base_weight) const;
  [[nodiscard]] double ProminenceScore(const Task& task, double visual_weight, UrgencyBand band) const;

  [[nodiscard]] TaskRanking Rank(const Task& task, Date current_date) const;

 private:
  const CategoryTable* categories_ = nullptr;
  RankingWeights weights_{};
};

}  // namespace plangrid::core

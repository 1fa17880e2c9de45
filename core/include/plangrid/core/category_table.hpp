#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace plangrid::core {

inline constexpr const char* kFallbackCategoryColor = "#CCCCCC";
inline constexpr int kNeutralCategoryWeight = 5;

struct CategoryStyle {
  std::string key{};  // upper-case canonical name
  std::string display_name{};
  std::string color{};  // #RRGGBB
  int priority_weight = kNeutralCategoryWeight;
  bool milestone = false;
};

// Immutable once built. Lookup ignores case.
class CategoryTable {
 public:
  CategoryTable() = default;
  explicit CategoryTable(const std::vector<CategoryStyle>& styles);

  [[nodiscard]] const CategoryStyle* find(std::string_view category) const;
  [[nodiscard]] const CategoryStyle& resolve(std::string_view category) const;
  [[nodiscard]] const std::string& color_of(std::string_view category) const;
  [[nodiscard]] int weight_of(std::string_view category) const;
  [[nodiscard]] bool is_milestone_category(std::string_view category) const;
  [[nodiscard]] std::size_t size() const { return styles_.size(); }
  [[nodiscard]] const std::map<std::string, CategoryStyle>& styles() const { return styles_; }

 private:
  std::map<std::string, CategoryStyle> styles_{};
  CategoryStyle fallback_{"", "Unknown", kFallbackCategoryColor, kNeutralCategoryWeight, false};
};

[[nodiscard]] std::string normalize_category_key(std::string_view category);
[[nodiscard]] CategoryTable make_default_category_table();

}  // namespace plangrid::core

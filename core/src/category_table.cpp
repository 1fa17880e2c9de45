#include "plangrid/core/category_table.hpp"

#include <cctype>
#include <utility>

namespace plangrid::core {

std::string normalize_category_key(std::string_view category) {
  std::string key;
  key.reserve(category.size());
  for (const char c : category) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      continue;
    }
    key.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return key;
}

CategoryTable::CategoryTable(const std::vector<CategoryStyle>& styles) {
  for (const CategoryStyle& style : styles) {
    CategoryStyle entry = style;
    entry.key = normalize_category_key(style.key.empty() ? style.display_name : style.key);
    if (entry.key.empty()) {
      continue;
    }
    // Later entries replace earlier ones with the same key.
    styles_[entry.key] = std::move(entry);
  }
}

const CategoryStyle* CategoryTable::find(std::string_view category) const {
  const auto it = styles_.find(normalize_category_key(category));
  return it == styles_.end() ? nullptr : &it->second;
}

const CategoryStyle& CategoryTable::resolve(std::string_view category) const {
  const CategoryStyle* style = find(category);
  return style == nullptr ? fallback_ : *style;
}

const std::string& CategoryTable::color_of(std::string_view category) const {
  return resolve(category).color;
}

int CategoryTable::weight_of(std::string_view category) const {
  return resolve(category).priority_weight;
}

bool CategoryTable::is_milestone_category(std::string_view category) const {
  return resolve(category).milestone;
}

CategoryTable make_default_category_table() {
  return CategoryTable({
      {"PROPOSAL", "Proposal", "#4A90E2", 1, false},
      {"LASER", "Laser", "#F5A623", 2, false},
      {"IMAGING", "Imaging", "#7ED321", 3, false},
      {"ADMIN", "Admin", "#BD10E0", 4, false},
      {"DISSERTATION", "Dissertation", "#D0021B", 5, false},
      {"RESEARCH", "Research", "#50E3C2", 6, false},
      {"PUBLICATION", "Publication", "#B8E986", 7, false},
      {"MILESTONE", "Milestone", "#FF6B6B", 5, true},
  });
}

}  // namespace plangrid::core

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace plangrid::core {

// Civil calendar day, stored as days since 1970-01-01.
struct Date {
  std::int32_t days = 0;

  static Date FromYmd(int year, unsigned month, unsigned day);

  [[nodiscard]] int year() const;
  [[nodiscard]] unsigned month() const;
  [[nodiscard]] unsigned day() const;

  auto operator<=>(const Date&) const = default;
};

struct MonthKey {
  int year = 0;
  unsigned month = 0;

  auto operator<=>(const MonthKey&) const = default;
};

inline Date add_days(Date date, int count) {
  return {date.days + count};
}

// to - from, in days.
inline int days_between(Date from, Date to) {
  return to.days - from.days;
}

[[nodiscard]] MonthKey month_key(Date date);
[[nodiscard]] Date first_day_of_month(Date date);
[[nodiscard]] Date last_day_of_month(Date date);

// Accepts YYYY-MM-DD only.
[[nodiscard]] std::optional<Date> parse_iso_date(std::string_view text);
[[nodiscard]] std::string format_iso_date(Date date);
[[nodiscard]] std::string format_month_key(const MonthKey& key);

}  // namespace plangrid::core

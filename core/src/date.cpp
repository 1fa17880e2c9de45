#include "plangrid/core/date.hpp"

#include <cctype>
#include <charconv>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace plangrid::core {

namespace {

std::chrono::sys_days to_sys_days(Date date) {
  return std::chrono::sys_days{std::chrono::days{date.days}};
}

Date from_sys_days(std::chrono::sys_days value) {
  return {static_cast<std::int32_t>(value.time_since_epoch().count())};
}

std::chrono::year_month_day to_ymd(Date date) {
  return std::chrono::year_month_day{to_sys_days(date)};
}

bool parse_number(std::string_view text, int& out) {
  for (const char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc{} && ptr == text.data() + text.size();
}

}  // namespace

Date Date::FromYmd(int year, unsigned month, unsigned day) {
  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
  return from_sys_days(std::chrono::sys_days{ymd});
}

int Date::year() const {
  return static_cast<int>(to_ymd(*this).year());
}

unsigned Date::month() const {
  return static_cast<unsigned>(to_ymd(*this).month());
}

unsigned Date::day() const {
  return static_cast<unsigned>(to_ymd(*this).day());
}

MonthKey month_key(Date date) {
  const auto ymd = to_ymd(date);
  return {static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month())};
}

Date first_day_of_month(Date date) {
  const auto ymd = to_ymd(date);
  return from_sys_days(std::chrono::sys_days{ymd.year() / ymd.month() / std::chrono::day{1}});
}

Date last_day_of_month(Date date) {
  const auto ymd = to_ymd(date);
  const std::chrono::year_month_day_last last{ymd.year(), std::chrono::month_day_last{ymd.month()}};
  return from_sys_days(std::chrono::sys_days{last});
}

std::optional<Date> parse_iso_date(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  int year = 0;
  int month = 0;
  int day = 0;
  if (!parse_number(text.substr(0, 4), year) || !parse_number(text.substr(5, 2), month) ||
      !parse_number(text.substr(8, 2), day)) {
    return std::nullopt;
  }
  const std::chrono::year_month_day ymd{
      std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
      std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  return from_sys_days(std::chrono::sys_days{ymd});
}

std::string format_iso_date(Date date) {
  const auto ymd = to_ymd(date);
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << "-" << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << "-" << std::setw(2) << static_cast<unsigned>(ymd.day());
  return oss.str();
}

std::string format_month_key(const MonthKey& key) {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << key.year << "-" << std::setw(2) << key.month;
  return oss.str();
}

}  // namespace plangrid::core

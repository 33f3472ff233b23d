#include "agentstream/utils/time.hpp"

#include <cctype>

namespace agentstream::utils {
namespace {

class Cursor {
public:
  explicit Cursor(std::string_view text) : text_(text) {}

  bool done() const { return pos_ >= text_.size(); }
  char peek() const { return done() ? '\0' : text_[pos_]; }
  void advance() { ++pos_; }

  bool consume(char expected) {
    if (peek() != expected) return false;
    ++pos_;
    return true;
  }

  std::optional<int> digits(std::size_t count) {
    if (pos_ + count > text_.size()) return std::nullopt;
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
      const unsigned char ch = static_cast<unsigned char>(text_[pos_ + i]);
      if (!std::isdigit(ch)) return std::nullopt;
      value = value * 10 + (ch - '0');
    }
    pos_ += count;
    return value;
  }

private:
  std::string_view text_;
  std::size_t pos_ = 0;
};

bool is_leap(std::int64_t year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(std::int64_t year, unsigned month) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap(year)) return 29;
  return kDays[month - 1];
}

}  // namespace

std::int64_t days_from_civil(std::int64_t year, unsigned month, unsigned day) {
  year -= month <= 2 ? 1 : 0;
  const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
  const auto year_of_era = static_cast<unsigned>(year - era * 400);
  const unsigned day_of_year = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
  const unsigned day_of_era = year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
  return era * 146097 + static_cast<std::int64_t>(day_of_era) - 719468;
}

std::optional<std::int64_t> parse_timestamp_ms(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);

  Cursor cursor(text);
  auto year = cursor.digits(4);
  if (!year || !cursor.consume('-')) return std::nullopt;
  auto month = cursor.digits(2);
  if (!month || !cursor.consume('-')) return std::nullopt;
  auto day = cursor.digits(2);
  if (!day) return std::nullopt;
  if (*month < 1 || *month > 12) return std::nullopt;
  if (*day < 1 || static_cast<unsigned>(*day) > days_in_month(*year, static_cast<unsigned>(*month))) {
    return std::nullopt;
  }

  int hour = 0;
  int minute = 0;
  int second = 0;
  int millis = 0;
  int offset_minutes = 0;

  if (!cursor.done()) {
    if (!cursor.consume('T') && !cursor.consume('t') && !cursor.consume(' ')) return std::nullopt;
    auto h = cursor.digits(2);
    if (!h || !cursor.consume(':')) return std::nullopt;
    auto m = cursor.digits(2);
    if (!m) return std::nullopt;
    std::optional<int> s = 0;
    if (cursor.consume(':')) {
      s = cursor.digits(2);
      if (!s) return std::nullopt;
    }
    hour = *h;
    minute = *m;
    second = *s;
    if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

    if (cursor.consume('.') || cursor.consume(',')) {
      int scale = 100;
      bool any = false;
      while (std::isdigit(static_cast<unsigned char>(cursor.peek()))) {
        millis += (cursor.peek() - '0') * scale;
        scale /= 10;
        any = true;
        cursor.advance();
      }
      if (!any) return std::nullopt;
    }

    if (cursor.consume('Z') || cursor.consume('z')) {
      offset_minutes = 0;
    } else if (cursor.peek() == '+' || cursor.peek() == '-') {
      const int sign = cursor.peek() == '-' ? -1 : 1;
      cursor.advance();
      auto oh = cursor.digits(2);
      if (!oh) return std::nullopt;
      cursor.consume(':');
      auto om = cursor.digits(2);
      if (!om || *oh > 23 || *om > 59) return std::nullopt;
      offset_minutes = sign * (*oh * 60 + *om);
    }
  }

  if (!cursor.done()) return std::nullopt;

  const std::int64_t days = days_from_civil(*year, static_cast<unsigned>(*month), static_cast<unsigned>(*day));
  const std::int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_minutes * 60;
  return seconds * 1000 + millis;
}

}  // namespace agentstream::utils

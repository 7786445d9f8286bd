#include "feedrank/common/time.hpp"

#include <chrono>
#include <cstdint>

namespace feedrank::common {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(std::int64_t year, const unsigned month, const unsigned day) {
  year -= month <= 2 ? 1 : 0;
  const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
  const auto yoe = static_cast<unsigned>(year - era * 400);
  const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool read_digits(const std::string &text, std::size_t &pos, const std::size_t count, int &out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char ch = text[pos + i];
    if (ch < '0' || ch > '9') {
      return false;
    }
    value = value * 10 + (ch - '0');
  }
  pos += count;
  out = value;
  return true;
}

bool expect(const std::string &text, std::size_t &pos, const char ch) {
  if (pos >= text.size() || text[pos] != ch) {
    return false;
  }
  ++pos;
  return true;
}

} // namespace

double unix_now() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}

Clock system_clock() { return [] { return unix_now(); }; }

Clock fixed_clock(const double now) { return [now] { return now; }; }

Result<double> parse_rfc3339(const std::string &value) {
  std::size_t pos = 0;
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!read_digits(value, pos, 4, year) || !expect(value, pos, '-') ||
      !read_digits(value, pos, 2, month) || !expect(value, pos, '-') ||
      !read_digits(value, pos, 2, day)) {
    return Result<double>::failure("invalid date: " + value);
  }
  if (pos >= value.size() || (value[pos] != 'T' && value[pos] != 't' && value[pos] != ' ')) {
    return Result<double>::failure("missing time: " + value);
  }
  ++pos;
  if (!read_digits(value, pos, 2, hour) || !expect(value, pos, ':') ||
      !read_digits(value, pos, 2, minute) || !expect(value, pos, ':') ||
      !read_digits(value, pos, 2, second)) {
    return Result<double>::failure("invalid time: " + value);
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
      second > 60) {
    return Result<double>::failure("timestamp out of range: " + value);
  }

  double fraction = 0.0;
  if (pos < value.size() && value[pos] == '.') {
    ++pos;
    double scale = 0.1;
    while (pos < value.size() && value[pos] >= '0' && value[pos] <= '9') {
      fraction += scale * (value[pos] - '0');
      scale /= 10.0;
      ++pos;
    }
  }

  int offset_seconds = 0;
  if (pos < value.size() && (value[pos] == 'Z' || value[pos] == 'z')) {
    ++pos;
  } else if (pos < value.size() && (value[pos] == '+' || value[pos] == '-')) {
    const int sign = value[pos] == '-' ? -1 : 1;
    ++pos;
    int off_hour = 0;
    int off_minute = 0;
    if (!read_digits(value, pos, 2, off_hour) || !expect(value, pos, ':') ||
        !read_digits(value, pos, 2, off_minute)) {
      return Result<double>::failure("invalid offset: " + value);
    }
    offset_seconds = sign * (off_hour * 3600 + off_minute * 60);
  } else {
    return Result<double>::failure("missing timezone: " + value);
  }
  if (pos != value.size()) {
    return Result<double>::failure("trailing characters: " + value);
  }

  const std::int64_t days =
      days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  const std::int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;
  return Result<double>::success(static_cast<double>(seconds) + fraction);
}

} // namespace feedrank::common

#include "stratlab/time/time_utils.hpp"

#include <cctype>
#include <cstdio>

namespace stratlab {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

bool is_leap(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                       31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap(year)) {
    return 29;
  }
  return kDays[month - 1];
}

// Reads exactly `width` digits starting at `pos`. Advances pos on success.
bool read_digits(const std::string& s, std::size_t& pos, std::size_t width,
                 int& out) {
  if (pos + width > s.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = 0; i < width; ++i) {
    char c = s[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  pos += width;
  out = value;
  return true;
}

bool expect(const std::string& s, std::size_t& pos, char c) {
  if (pos < s.size() && s[pos] == c) {
    ++pos;
    return true;
  }
  return false;
}

// Inverse of days_from_civil.
void civil_from_days(std::int64_t z, int& year, unsigned& month,
                     unsigned& day) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  day = doy - (153 * mp + 2) / 5 + 1;
  month = mp < 10 ? mp + 3 : mp - 9;
  year = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400) +
         (month <= 2 ? 1 : 0);
}

}  // namespace

// -----------------------------------------------------------------------------
// days_from_civil: Gregorian date → days since epoch
// -----------------------------------------------------------------------------
std::int64_t days_from_civil(int year, unsigned month, unsigned day) {
  // Shift the year so it starts in March; Feb 29 then falls at year end.
  year -= month <= 2 ? 1 : 0;
  const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
  const auto yoe = static_cast<unsigned>(year - era * 400);
  const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 +
                       day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

Timestamp make_timestamp(int year, unsigned month, unsigned day,
                         unsigned hour, unsigned minute, unsigned second) {
  const std::int64_t seconds = days_from_civil(year, month, day) *
                                   kSecondsPerDay +
                               hour * 3600 + minute * 60 + second;
  return Timestamp{std::chrono::seconds{seconds}};
}

// -----------------------------------------------------------------------------
// parse_timestamp
// -----------------------------------------------------------------------------
std::optional<Timestamp> parse_timestamp(const std::string& text) {
  std::size_t pos = 0;
  int year = 0;
  int month = 0;
  int day = 0;
  if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
      !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
      !read_digits(text, pos, 2, day)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 ||
      static_cast<unsigned>(day) >
          days_in_month(year, static_cast<unsigned>(month))) {
    return std::nullopt;
  }

  int hour = 0;
  int minute = 0;
  int second = 0;
  if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
    ++pos;
    if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, minute)) {
      return std::nullopt;
    }
    if (expect(text, pos, ':') && !read_digits(text, pos, 2, second)) {
      return std::nullopt;
    }
    if (hour > 23 || minute > 59 || second > 60) {
      return std::nullopt;
    }
    // Fractional seconds.
    if (expect(text, pos, '.')) {
      while (pos < text.size() &&
             std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
      }
    }
    expect(text, pos, 'Z');
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  return make_timestamp(year, static_cast<unsigned>(month),
                        static_cast<unsigned>(day),
                        static_cast<unsigned>(hour),
                        static_cast<unsigned>(minute),
                        static_cast<unsigned>(second));
}

// -----------------------------------------------------------------------------
// to_iso8601
// -----------------------------------------------------------------------------
std::string to_iso8601(Timestamp tp) {
  const std::int64_t total_seconds =
      std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch())
          .count();
  std::int64_t days = total_seconds / kSecondsPerDay;
  std::int64_t rem = total_seconds % kSecondsPerDay;
  if (rem < 0) {
    rem += kSecondsPerDay;
    --days;
  }

  int year = 0;
  unsigned month = 0;
  unsigned day = 0;
  civil_from_days(days, year, month, day);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d", year, month,
                day, static_cast<int>(rem / 3600),
                static_cast<int>((rem % 3600) / 60),
                static_cast<int>(rem % 60));
  return std::string(buf);
}

std::int64_t calendar_days_between(Timestamp from, Timestamp to) {
  return std::chrono::duration_cast<std::chrono::hours>(to - from).count() / 24;
}

}  // namespace stratlab

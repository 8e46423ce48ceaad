#include "chronicle/common/time.hpp"

#include "chronicle/common/fs.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdio>

namespace chronicle::common {

namespace {

struct CivilDate {
  std::int64_t year = 1970;
  unsigned month = 1;
  unsigned day = 1;
};

// Proleptic Gregorian conversions (H. Hinnant's days_from_civil / civil_from_days).
std::int64_t days_from_civil(std::int64_t y, const unsigned m, const unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

CivilDate civil_from_days(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return CivilDate{.year = y + (m <= 2 ? 1 : 0), .month = m, .day = d};
}

bool read_digits(const std::string &text, std::size_t &pos, std::size_t count, int &out) {
  if (pos + count > text.size()) {
    return false;
  }
  const auto *first = text.data() + pos;
  auto [ptr, ec] = std::from_chars(first, first + count, out);
  if (ec != std::errc() || ptr != first + count) {
    return false;
  }
  pos += count;
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

Timestamp now_timestamp() { return to_timestamp(std::chrono::system_clock::now()); }

Timestamp to_timestamp(const std::chrono::system_clock::time_point point) {
  return std::chrono::time_point_cast<std::chrono::microseconds>(point);
}

std::string format_iso8601(const Timestamp timestamp) {
  const auto micros = timestamp.time_since_epoch().count();
  constexpr std::int64_t kMicrosPerDay = 86'400'000'000LL;
  std::int64_t days = micros / kMicrosPerDay;
  std::int64_t rem = micros % kMicrosPerDay;
  if (rem < 0) {
    rem += kMicrosPerDay;
    --days;
  }
  const CivilDate date = civil_from_days(days);
  const auto seconds_of_day = rem / 1'000'000;
  const auto fraction = rem % 1'000'000;

  std::array<char, 40> buf{};
  std::snprintf(buf.data(), buf.size(), "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%06lldZ",
                static_cast<long long>(date.year), date.month, date.day,
                static_cast<long long>(seconds_of_day / 3600),
                static_cast<long long>((seconds_of_day / 60) % 60),
                static_cast<long long>(seconds_of_day % 60), static_cast<long long>(fraction));
  return buf.data();
}

std::optional<Timestamp> parse_iso8601(const std::string &input) {
  const std::string text = trim(input);
  std::size_t pos = 0;
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
      !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
      !read_digits(text, pos, 2, day)) {
    return std::nullopt;
  }
  if (pos < text.size() && (text[pos] == 'T' || text[pos] == 't' || text[pos] == ' ')) {
    ++pos;
    if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, minute)) {
      return std::nullopt;
    }
    if (pos < text.size() && text[pos] == ':') {
      ++pos;
      if (!read_digits(text, pos, 2, second)) {
        return std::nullopt;
      }
    }
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
      second > 60) {
    return std::nullopt;
  }

  std::int64_t micros = 0;
  if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
    ++pos;
    std::size_t digits = 0;
    std::int64_t scale = 100'000;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
      if (digits < 6) {
        micros += (text[pos] - '0') * scale;
        scale /= 10;
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
  }

  std::int64_t offset_seconds = 0;
  if (pos < text.size()) {
    const char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
      ++pos;
    } else if (zone == '+' || zone == '-') {
      ++pos;
      int off_h = 0;
      int off_m = 0;
      if (!read_digits(text, pos, 2, off_h)) {
        return std::nullopt;
      }
      if (pos < text.size() && text[pos] == ':') {
        ++pos;
      }
      if (!read_digits(text, pos, 2, off_m)) {
        return std::nullopt;
      }
      offset_seconds = (off_h * 3600 + off_m * 60) * (zone == '-' ? -1 : 1);
    }
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  const std::int64_t days =
      days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  const std::int64_t seconds = days * 86'400 + hour * 3600 + minute * 60 + second - offset_seconds;
  return Timestamp(std::chrono::microseconds(seconds * 1'000'000 + micros));
}

std::string month_partition(const Timestamp timestamp) {
  const std::string iso = format_iso8601(timestamp);
  // "YYYY-MM-..." → "YYYYMM"
  return iso.substr(0, 4) + iso.substr(5, 2);
}

} // namespace chronicle::common

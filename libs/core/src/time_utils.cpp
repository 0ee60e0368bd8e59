/**
 * @file time_utils.cpp
 * @brief UTC partition key and ISO-8601 parsing implementation.
 * @author Watosn
 */

#include "cloudcover/core/time_utils.hpp"

#include <chrono>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <string>

#include <fmt/format.h>

namespace cloudcover::core {
namespace {

constexpr double kSecondsPerDay = 86400.0;

std::tm to_tm_utc(const Epoch& epoch) {
  const std::time_t tt = static_cast<std::time_t>(std::floor(epoch.utc_seconds));
  std::tm tm_utc{};
#if defined(_WIN32)
  gmtime_s(&tm_utc, &tt);
#else
  gmtime_r(&tt, &tm_utc);
#endif
  return tm_utc;
}

bool is_leap_year(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

unsigned days_in_month(int y, unsigned m) {
  static constexpr unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2U && is_leap_year(y)) {
    return 29U;
  }
  return kDays[m - 1U];
}

// Reads exactly `width` decimal digits at `pos`.
bool read_digits(std::string_view text, std::size_t pos, std::size_t width, int& value) {
  if (pos + width > text.size()) {
    return false;
  }
  int out = 0;
  for (std::size_t i = pos; i < pos + width; ++i) {
    if (std::isdigit(static_cast<unsigned char>(text[i])) == 0) {
      return false;
    }
    out = out * 10 + (text[i] - '0');
  }
  value = out;
  return true;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
    s.remove_suffix(1);
  }
  return s;
}

}  // namespace

Epoch now_utc() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return Epoch{.utc_seconds = std::chrono::duration<double>(since_epoch).count()};
}

int days_from_civil(int y, unsigned m, unsigned d) {
  y -= static_cast<int>(m <= 2);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153U * (m + (m > 2 ? -3U : 9U)) + 2U) / 5U + d - 1U;
  const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
  return era * 146097 + static_cast<int>(doe) - 719468;
}

PartitionKey partition_key(const Epoch& epoch) {
  const std::tm tm_utc = to_tm_utc(epoch);
  return PartitionKey{.year = tm_utc.tm_year + 1900, .day_of_year = tm_utc.tm_yday + 1, .hour = tm_utc.tm_hour};
}

std::string format_partition(const PartitionKey& key) {
  return fmt::format("{:04d}/{:03d}/{:02d}", key.year, key.day_of_year, key.hour);
}

int utc_hour(const Epoch& epoch) { return to_tm_utc(epoch).tm_hour; }

std::optional<Epoch> parse_iso8601_utc(std::string_view text) {
  std::string s(trim(text));
  if (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) {
    s.pop_back();
    s += "+00:00";
  }

  int year = 0;
  int month = 0;
  int day = 0;
  if (s.size() < 10 || s[4] != '-' || s[7] != '-' || !read_digits(s, 0, 4, year) || !read_digits(s, 5, 2, month) ||
      !read_digits(s, 8, 2, day)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month))) {
    return std::nullopt;
  }

  int hour = 0;
  int minute = 0;
  int second = 0;
  double fraction = 0.0;
  int offset_s = 0;
  std::size_t pos = 10;

  if (pos < s.size()) {
    if (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ') {
      return std::nullopt;
    }
    ++pos;
    if (!read_digits(s, pos, 2, hour)) {
      return std::nullopt;
    }
    pos += 2;
    if (pos < s.size() && s[pos] == ':') {
      if (!read_digits(s, pos + 1, 2, minute)) {
        return std::nullopt;
      }
      pos += 3;
      if (pos < s.size() && s[pos] == ':') {
        if (!read_digits(s, pos + 1, 2, second)) {
          return std::nullopt;
        }
        pos += 3;
        if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
          const std::size_t start = ++pos;
          double scale = 0.1;
          while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])) != 0) {
            fraction += scale * static_cast<double>(s[pos] - '0');
            scale *= 0.1;
            ++pos;
          }
          if (pos == start) {
            return std::nullopt;
          }
        }
      }
    }

    if (pos < s.size()) {
      const char sign = s[pos];
      if (sign != '+' && sign != '-') {
        return std::nullopt;
      }
      int off_h = 0;
      int off_m = 0;
      if (!read_digits(s, pos + 1, 2, off_h)) {
        return std::nullopt;
      }
      pos += 3;
      if (pos < s.size() && s[pos] == ':') {
        ++pos;
      }
      if (pos < s.size()) {
        if (!read_digits(s, pos, 2, off_m)) {
          return std::nullopt;
        }
        pos += 2;
      }
      if (pos != s.size() || off_h > 23 || off_m > 59) {
        return std::nullopt;
      }
      offset_s = (sign == '-' ? -1 : 1) * (off_h * 3600 + off_m * 60);
    }
  }

  if (hour > 23 || minute > 59 || second > 59) {
    return std::nullopt;
  }

  const double day_start =
      static_cast<double>(days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day))) * kSecondsPerDay;
  const double local_s = static_cast<double>(hour * 3600 + minute * 60 + second) + fraction;
  return Epoch{.utc_seconds = day_start + local_s - static_cast<double>(offset_s)};
}

std::optional<Epoch> parse_epoch(const std::string& text) {
  if (const auto parsed = parse_iso8601_utc(text)) {
    return parsed;
  }
  if (text.empty() || std::isspace(static_cast<unsigned char>(text.front()))) {
    return std::nullopt;
  }
  char* end = nullptr;
  errno = 0;
  const double seconds = std::strtod(text.c_str(), &end);
  if (errno != 0 || end != text.c_str() + text.size() || !std::isfinite(seconds)) {
    return std::nullopt;
  }
  return Epoch{.utc_seconds = seconds};
}

}  // namespace cloudcover::core

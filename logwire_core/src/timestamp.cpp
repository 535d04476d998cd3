#include "logwire/timestamp.hpp"

#include <cstdlib>
#include <limits>
#include <regex>

#include "logwire/logger.hpp"
#include "logwire/platform.hpp"

#if defined(LOGWIRE_PLATFORM_LINUX) || defined(LOGWIRE_PLATFORM_MACOS)

#include <time.h>

namespace logwire
{

uint64_t wall_clock_now_ns()
{
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<uint64_t>(ts.tv_nsec);
}

}  // namespace logwire

#elif defined(LOGWIRE_PLATFORM_WINDOWS)

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

namespace logwire
{

uint64_t wall_clock_now_ns()
{
  FILETIME ft;
  GetSystemTimePreciseAsFileTime(&ft);
  uint64_t ticks = (static_cast<uint64_t>(ft.dwHighDateTime) << 32) |
                   static_cast<uint64_t>(ft.dwLowDateTime);
  // FILETIME epoch: 1601-01-01, Unix epoch offset: 11644473600 seconds
  constexpr uint64_t epoch_offset = 11644473600ULL * 10'000'000ULL;
  return (ticks - epoch_offset) * 100ULL;
}

}  // namespace logwire

#endif

namespace logwire
{

namespace
{

constexpr int64_t kNanosPerSecond = 1'000'000'000LL;

bool read_digits(std::string_view text, size_t pos, size_t count, int& out)
{
  if (pos + count > text.size())
  {
    return false;
  }
  int value = 0;
  for (size_t i = pos; i < pos + count; ++i)
  {
    char c = text[i];
    if (c < '0' || c > '9')
    {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  out = value;
  return true;
}

bool is_leap(int year) { return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0; }

int days_in_month(int year, int month)
{
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (month == 2 && is_leap(year)) ? 29 : kDays[month - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t days_from_civil(int year, int month, int day)
{
  int64_t y = year - (month <= 2 ? 1 : 0);
  int64_t era = (y >= 0 ? y : y - 399) / 400;
  int64_t yoe = y - era * 400;
  int64_t mp = (month + 9) % 12;
  int64_t doy = (153 * mp + 2) / 5 + day - 1;
  int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

int64_t floor_div(int64_t a, int64_t b)
{
  int64_t q = a / b;
  return (a % b != 0 && (a < 0) != (b < 0)) ? q - 1 : q;
}

}  // namespace

WallTime wall_time_now() { return WallTime{static_cast<int64_t>(wall_clock_now_ns())}; }

SecondsNanos to_seconds_nanos(WallTime wall)
{
  SecondsNanos pair;
  pair.seconds = floor_div(wall.unix_ns, kNanosPerSecond);
  pair.nanos = static_cast<int32_t>(wall.unix_ns - pair.seconds * kNanosPerSecond);
  return pair;
}

bool to_wall_time(const SecondsNanos& pair, WallTime& out)
{
  constexpr int64_t kMaxSeconds = std::numeric_limits<int64_t>::max() / kNanosPerSecond;
  constexpr int64_t kMinSeconds = std::numeric_limits<int64_t>::min() / kNanosPerSecond;
  if (pair.nanos < 0 || pair.nanos >= kNanosPerSecond || pair.seconds > kMaxSeconds ||
      pair.seconds < kMinSeconds)
  {
    return false;
  }
  int64_t base = pair.seconds * kNanosPerSecond;
  if (base > std::numeric_limits<int64_t>::max() - pair.nanos)
  {
    return false;
  }
  out = WallTime{base + pair.nanos};
  return true;
}

bool parse_utc_seconds(std::string_view text, int64_t& seconds_out)
{
  if (text.size() != 10 && text.size() != 16 && text.size() != 19)
  {
    return false;
  }

  int year = 0;
  int month = 0;
  int day = 0;
  if (!read_digits(text, 0, 4, year) || text[4] != '-' || !read_digits(text, 5, 2, month) ||
      text[7] != '-' || !read_digits(text, 8, 2, day))
  {
    return false;
  }
  if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month))
  {
    return false;
  }

  int hour = 0;
  int minute = 0;
  int second = 0;
  if (text.size() >= 16)
  {
    if ((text[10] != 'T' && text[10] != 't') || !read_digits(text, 11, 2, hour) ||
        text[13] != ':' || !read_digits(text, 14, 2, minute))
    {
      return false;
    }
  }
  if (text.size() == 19)
  {
    if (text[16] != ':' || !read_digits(text, 17, 2, second))
    {
      return false;
    }
  }
  if (hour > 23 || minute > 59 || second > 59)
  {
    return false;
  }

  seconds_out = days_from_civil(year, month, day) * 86400 + hour * 3600 + minute * 60 + second;
  return true;
}

SecondsNanos parse_rfc3339(std::string_view text)
{
  SecondsNanos pair;

  std::string_view whole = text.substr(0, text.find_first_of(".,Z"));
  int64_t seconds = 0;
  if (parse_utc_seconds(whole, seconds))
  {
    pair.seconds = seconds;
  }
  else
  {
    LOG_WARN("unparseable timestamp '{}', using epoch", text);
  }

  static const std::regex kFraction(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}.(\d{0,9})Z$)");
  std::match_results<std::string_view::const_iterator> match;
  if (std::regex_match(text.begin(), text.end(), match, kFraction) && match[1].length() > 0)
  {
    std::string digits = match[1].str();
    digits.resize(9, '0');
    pair.nanos = static_cast<int32_t>(std::strtol(digits.c_str(), nullptr, 10));
  }
  return pair;
}

SecondsNanos normalize_timestamp(const Timestamp& timestamp)
{
  if (const auto* wall = std::get_if<WallTime>(&timestamp))
  {
    return to_seconds_nanos(*wall);
  }
  if (const auto* text = std::get_if<std::string>(&timestamp))
  {
    return parse_rfc3339(*text);
  }
  return std::get<SecondsNanos>(timestamp);
}

}  // namespace logwire

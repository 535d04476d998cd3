#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace logwire
{

// Wall-clock instant, nanoseconds since the Unix epoch.
struct WallTime
{
  int64_t unix_ns = 0;
};

// Wire form of a timestamp. nanos is always in [0, 1e9).
struct SecondsNanos
{
  int64_t seconds = 0;
  int32_t nanos = 0;
};

inline bool operator==(const SecondsNanos& a, const SecondsNanos& b)
{
  return a.seconds == b.seconds && a.nanos == b.nanos;
}

inline bool operator!=(const SecondsNanos& a, const SecondsNanos& b) { return !(a == b); }

// An entry timestamp as supplied by a caller: wall clock, RFC3339 string or wire pair.
using Timestamp = std::variant<WallTime, std::string, SecondsNanos>;

uint64_t wall_clock_now_ns();
WallTime wall_time_now();

SecondsNanos to_seconds_nanos(WallTime wall);
// False when the instant does not fit in int64 nanoseconds (roughly
// years 1677 to 2262); out is left untouched.
bool to_wall_time(const SecondsNanos& pair, WallTime& out);

// Parses "YYYY-MM-DD", "YYYY-MM-DDTHH:MM" or "YYYY-MM-DDTHH:MM:SS" as UTC.
bool parse_utc_seconds(std::string_view text, int64_t& seconds_out);

// RFC3339 "Zulu" form. The whole-second part and the fraction are extracted
// independently; an unparseable whole-second part yields seconds = 0.
SecondsNanos parse_rfc3339(std::string_view text);

SecondsNanos normalize_timestamp(const Timestamp& timestamp);

}  // namespace logwire

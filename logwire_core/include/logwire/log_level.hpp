#pragma once
#include <cstdint>
#include <string_view>

namespace logwire
{

// Level of the in-process diagnostic logger. Entries carry LogSeverity instead.
enum class LogLevel : uint8_t
{
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  ERROR = 4,
  FATAL = 5,
  OFF = 6
};

constexpr std::string_view to_string(LogLevel level)
{
  switch (level)
  {
    case LogLevel::TRACE:
      return "TRACE";
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARN:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::FATAL:
      return "FATAL";
    case LogLevel::OFF:
      return "OFF";
  }
  return "UNKNOWN";
}

// 编译期最低活跃级别（通过 CMake -DLOGWIRE_ACTIVE_LEVEL=2 注入）
#ifndef LOGWIRE_ACTIVE_LEVEL
#ifdef NDEBUG
#define LOGWIRE_ACTIVE_LEVEL 2  // INFO
#else
#define LOGWIRE_ACTIVE_LEVEL 0  // TRACE
#endif
#endif

}  // namespace logwire

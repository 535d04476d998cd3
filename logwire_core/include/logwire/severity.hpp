#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

#include "log_level.hpp"

namespace logwire
{

// Severity of a wire log entry. Numeric values match the ingestion API.
enum class LogSeverity : uint16_t
{
  DEFAULT = 0,
  DEBUG = 100,
  INFO = 200,
  NOTICE = 300,
  WARNING = 400,
  ERROR = 500,
  CRITICAL = 600,
  ALERT = 700,
  EMERGENCY = 800
};

constexpr std::string_view to_string(LogSeverity severity)
{
  switch (severity)
  {
    case LogSeverity::DEFAULT:
      return "DEFAULT";
    case LogSeverity::DEBUG:
      return "DEBUG";
    case LogSeverity::INFO:
      return "INFO";
    case LogSeverity::NOTICE:
      return "NOTICE";
    case LogSeverity::WARNING:
      return "WARNING";
    case LogSeverity::ERROR:
      return "ERROR";
    case LogSeverity::CRITICAL:
      return "CRITICAL";
    case LogSeverity::ALERT:
      return "ALERT";
    case LogSeverity::EMERGENCY:
      return "EMERGENCY";
  }
  return "DEFAULT";
}

constexpr std::optional<LogSeverity> parse_severity(std::string_view name)
{
  constexpr LogSeverity kAll[] = {LogSeverity::DEFAULT, LogSeverity::DEBUG,
                                  LogSeverity::INFO,    LogSeverity::NOTICE,
                                  LogSeverity::WARNING, LogSeverity::ERROR,
                                  LogSeverity::CRITICAL, LogSeverity::ALERT,
                                  LogSeverity::EMERGENCY};
  for (LogSeverity s : kAll)
  {
    if (to_string(s) == name)
    {
      return s;
    }
  }
  return std::nullopt;
}

constexpr std::optional<LogSeverity> severity_from_number(int64_t value)
{
  if (value < 0 || value > 800 || value % 100 != 0)
  {
    return std::nullopt;
  }
  return static_cast<LogSeverity>(value);
}

constexpr LogSeverity severity_for_level(LogLevel level)
{
  switch (level)
  {
    case LogLevel::TRACE:
    case LogLevel::DEBUG:
      return LogSeverity::DEBUG;
    case LogLevel::INFO:
      return LogSeverity::INFO;
    case LogLevel::WARN:
      return LogSeverity::WARNING;
    case LogLevel::ERROR:
      return LogSeverity::ERROR;
    case LogLevel::FATAL:
      return LogSeverity::CRITICAL;
    case LogLevel::OFF:
      return LogSeverity::DEFAULT;
  }
  return LogSeverity::DEFAULT;
}

}  // namespace logwire

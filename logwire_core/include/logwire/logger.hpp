#pragma once
#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <shared_mutex>
#include <utility>

#include "backend.hpp"
#include "log_level.hpp"
#include "log_record.hpp"
#include "sinks/sink_interface.hpp"
#include "source_location.hpp"
#include "timestamp.hpp"

namespace logwire
{

// Largest length <= len that does not end inside a UTF-8 sequence.
size_t utf8_truncate(const char* data, size_t len);

class Logger
{
 public:
  static Logger& Instance();

  void AddSink(std::unique_ptr<ILogSink> sink);
  void SetLevel(LogLevel level);
  LogLevel Level() const;

  void Start();
  void Stop();

  size_t Drain(size_t max_records = 64);

  uint64_t DropCount() const;
  void ResetDropCount();

  // Labels copied into every record, and from there into entry labels.
  // Keys and values are truncated to the LOGWIRE_MAX_LABEL_*_LEN limits.
  bool SetLabel(const char* key, const char* value);
  void RemoveLabel(const char* key);

  template <typename... Args>
  void LogImpl(LogLevel level, const SourceLocation& loc, const char* format, Args&&... args);

 private:
  Logger();
  ~Logger();

  void FillLabels(LogRecord& record) const;

  LoggerBackend backend_;
  std::atomic<LogLevel> level_{LogLevel::INFO};
  std::atomic<uint64_t> sequence_{0};
  std::atomic<uint64_t> drop_count_{0};
  bool started_ = false;

  mutable std::shared_mutex labels_mutex_;
  uint8_t label_count_ = 0;
  LogLabel labels_[LOGWIRE_MAX_LABELS] = {};
};

template <typename... Args>
void Logger::LogImpl(LogLevel level, const SourceLocation& loc, const char* format,
                     Args&&... args)
{
  LogRecord record{};

  record.wall_clock_ns = wall_clock_now_ns();
  record.level = level;

  record.file_path = loc.file_path;
  record.file_name = loc.file_name;
  record.function_name = loc.function_name;
  record.line = loc.line;

  record.sequence_id = sequence_.fetch_add(1, std::memory_order_relaxed);

  FillLabels(record);

  auto result = fmt::format_to_n(record.msg, LOGWIRE_MAX_MSG_LEN - 1, fmt::runtime(format),
                                 std::forward<Args>(args)...);
  size_t len = std::min<size_t>(result.size, static_cast<size_t>(LOGWIRE_MAX_MSG_LEN - 1));
  if (result.size > len)
  {
    len = utf8_truncate(record.msg, len);
  }
  record.msg_len = static_cast<uint16_t>(len);
  record.msg[record.msg_len] = '\0';

  if (!backend_.TryPush(record))
  {
    drop_count_.fetch_add(1, std::memory_order_relaxed);
  }
}

}  // namespace logwire

// ===== Logging macros =====

#define LOGWIRE_LOG_CALL(lvl, fmt_str, ...)                                              \
  do                                                                                     \
  {                                                                                      \
    constexpr auto _lw_lvl = ::logwire::LogLevel::lvl;                                   \
    if (static_cast<int>(_lw_lvl) >= LOGWIRE_ACTIVE_LEVEL)                               \
    {                                                                                    \
      auto& _lw_logger = ::logwire::Logger::Instance();                                  \
      if (_lw_lvl >= _lw_logger.Level())                                                 \
      {                                                                                  \
        _lw_logger.LogImpl(_lw_lvl, LOGWIRE_CURRENT_LOCATION(), fmt_str, ##__VA_ARGS__); \
      }                                                                                  \
    }                                                                                    \
  } while (0)

#define LOG_TRACE(fmt, ...) LOGWIRE_LOG_CALL(TRACE, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) LOGWIRE_LOG_CALL(DEBUG, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) LOGWIRE_LOG_CALL(INFO, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) LOGWIRE_LOG_CALL(WARN, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) LOGWIRE_LOG_CALL(ERROR, fmt, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) LOGWIRE_LOG_CALL(FATAL, fmt, ##__VA_ARGS__)

#define LOG_INFO_IF(cond, fmt, ...) \
  do                                \
  {                                 \
    if (cond) LOG_INFO(fmt, ##__VA_ARGS__); \
  } while (0)
#define LOG_WARN_IF(cond, fmt, ...) \
  do                                \
  {                                 \
    if (cond) LOG_WARN(fmt, ##__VA_ARGS__); \
  } while (0)
#define LOG_ERROR_IF(cond, fmt, ...) \
  do                                 \
  {                                  \
    if (cond) LOG_ERROR(fmt, ##__VA_ARGS__); \
  } while (0)

#define LOG_EVERY_N(lvl, n, fmt, ...)                                     \
  do                                                                      \
  {                                                                       \
    static std::atomic<uint64_t> _lw_count{0};                            \
    if (_lw_count.fetch_add(1, std::memory_order_relaxed) % (n) == 0)     \
    {                                                                     \
      LOGWIRE_LOG_CALL(lvl, fmt, ##__VA_ARGS__);                          \
    }                                                                     \
  } while (0)

#define LOG_ONCE(lvl, fmt, ...)                                        \
  do                                                                   \
  {                                                                    \
    static std::atomic<bool> _lw_logged{false};                        \
    if (!_lw_logged.exchange(true, std::memory_order_relaxed))         \
    {                                                                  \
      LOGWIRE_LOG_CALL(lvl, fmt, ##__VA_ARGS__);                       \
    }                                                                  \
  } while (0)

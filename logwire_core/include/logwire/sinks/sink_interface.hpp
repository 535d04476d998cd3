#pragma once
#include <memory>
#include <string>

#include "../formatters/formatter_interface.hpp"
#include "../log_level.hpp"
#include "../log_record.hpp"

namespace logwire
{

class ILogSink
{
 public:
  virtual ~ILogSink() = default;

  // 写入一条日志（由后端线程调用）
  virtual void Write(const LogRecord& record) = 0;

  virtual void Flush() = 0;

  void SetFormatter(std::unique_ptr<IFormatter> formatter) { formatter_ = std::move(formatter); }

  // 该 Sink 的最低输出级别（独立于全局级别）
  void SetLevel(LogLevel level) { min_level_ = level; }

  LogLevel Level() const { return min_level_; }

  bool ShouldLog(LogLevel record_level) const { return record_level >= min_level_; }

 protected:
  std::unique_ptr<IFormatter> formatter_;
  LogLevel min_level_ = LogLevel::TRACE;
  std::string format_buf_;

  size_t DoFormat(const LogRecord& record)
  {
    if (formatter_)
    {
      return formatter_->Format(record, format_buf_);
    }
    format_buf_.clear();
    return 0;
  }
};

}  // namespace logwire

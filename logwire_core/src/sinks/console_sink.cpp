#include "logwire/sinks/console_sink.hpp"

#include <cstdio>

#include "logwire/formatters/json_formatter.hpp"

namespace logwire
{

ConsoleSink::ConsoleSink(LogLevel stderr_level) : stderr_level_(stderr_level) {}

void ConsoleSink::Write(const LogRecord& record)
{
  if (!ShouldLog(record.level))
  {
    return;
  }

  if (!formatter_)
  {
    formatter_ = std::make_unique<JsonFormatter>();
  }

  size_t len = DoFormat(record);
  if (len == 0)
  {
    return;
  }

  FILE* target = (record.level >= stderr_level_) ? stderr : stdout;
  std::fwrite(format_buf_.data(), 1, len, target);
  std::fwrite("\n", 1, 1, target);
}

void ConsoleSink::Flush()
{
  std::fflush(stdout);
  std::fflush(stderr);
}

}  // namespace logwire

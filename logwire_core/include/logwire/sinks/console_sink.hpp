#pragma once
#include "sink_interface.hpp"

namespace logwire
{

// One entry per line. Records at or above `stderr_level` go to stderr,
// the rest to stdout. Uses a compact JsonFormatter unless one is set.
class ConsoleSink : public ILogSink
{
 public:
  explicit ConsoleSink(LogLevel stderr_level = LogLevel::WARN);

  void Write(const LogRecord& record) override;
  void Flush() override;

  LogLevel StderrLevel() const { return stderr_level_; }

 private:
  LogLevel stderr_level_;
};

}  // namespace logwire

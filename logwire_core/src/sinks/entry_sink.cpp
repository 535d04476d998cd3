#include "logwire/sinks/entry_sink.hpp"

#include "logwire/record_entry.hpp"

namespace logwire
{

EntrySink::EntrySink(Callback cb) : callback_(std::move(cb)) {}

void EntrySink::Write(const LogRecord& record)
{
  if (!ShouldLog(record.level))
  {
    return;
  }
  if (callback_)
  {
    callback_(record_to_entry(record));
  }
}

void EntrySink::Flush() {}

}  // namespace logwire

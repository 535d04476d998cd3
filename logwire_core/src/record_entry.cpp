#include "logwire/record_entry.hpp"

#include <string>

namespace logwire
{

Entry record_to_entry(const LogRecord& record)
{
  LogEntryMetadata metadata;
  metadata.timestamp = WallTime{static_cast<int64_t>(record.wall_clock_ns)};
  metadata.severity = severity_for_level(record.level);

  for (uint8_t i = 0; i < record.label_count && i < LOGWIRE_MAX_LABELS; ++i)
  {
    metadata.labels[record.labels[i].key] = record.labels[i].value;
  }

  EntrySourceLocation location;
  if (record.file_path)
  {
    location.file = std::string(record.file_path);
  }
  if (record.line > 0)
  {
    location.line = static_cast<int64_t>(record.line);
  }
  if (record.function_name)
  {
    location.function = std::string(record.function_name);
  }
  metadata.source_location = location;

  return Entry(metadata, Value(std::string(record.msg, record.msg_len)));
}

}  // namespace logwire

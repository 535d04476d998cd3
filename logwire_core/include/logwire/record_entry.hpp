#pragma once
#include "entry.hpp"
#include "log_record.hpp"

namespace logwire
{

// Converts a captured log record into an entry: wall clock timestamp,
// severity mapped from the level, record labels, source location and the
// message as text payload. A fresh insert id is drawn from the generator.
Entry record_to_entry(const LogRecord& record);

}  // namespace logwire

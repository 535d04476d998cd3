#pragma once
#include <cstdint>
#include <type_traits>

#include "log_level.hpp"
#include "platform.hpp"

namespace logwire
{

struct LogLabel
{
  char key[LOGWIRE_MAX_LABEL_KEY_LEN];
  char value[LOGWIRE_MAX_LABEL_VAL_LEN];
};

// One diagnostic log call, captured on the producer thread and handed to the
// backend through the ring buffer. Sinks turn it into an Entry.
struct LogRecord
{
  uint64_t wall_clock_ns;

  LogLevel level;

  const char* file_path;
  const char* file_name;
  const char* function_name;
  uint32_t line;

  uint64_t sequence_id;

  uint8_t label_count;
  LogLabel labels[LOGWIRE_MAX_LABELS];

  uint16_t msg_len;
  char msg[LOGWIRE_MAX_MSG_LEN];
};

static_assert(std::is_trivially_copyable_v<LogRecord>,
              "LogRecord must be trivially copyable for lock-free ring buffer");

}  // namespace logwire

#include "logwire/logger.hpp"

#include <cstring>
#include <mutex>

namespace logwire
{

namespace
{

void copy_truncated(char* dst, size_t dst_size, const char* src)
{
  std::strncpy(dst, src, dst_size - 1);
  dst[dst_size - 1] = '\0';
  if (std::strlen(src) >= dst_size)
  {
    dst[utf8_truncate(dst, dst_size - 1)] = '\0';
  }
}

}  // namespace

size_t utf8_truncate(const char* data, size_t len)
{
  size_t lead = len;
  size_t continuation = 0;
  while (lead > 0 && continuation < 3 &&
         (static_cast<unsigned char>(data[lead - 1]) & 0xC0) == 0x80)
  {
    --lead;
    ++continuation;
  }
  if (lead == 0)
  {
    return len;
  }

  auto c = static_cast<unsigned char>(data[lead - 1]);
  size_t needed = 1;
  if ((c & 0xE0) == 0xC0)
  {
    needed = 2;
  }
  else if ((c & 0xF0) == 0xE0)
  {
    needed = 3;
  }
  else if ((c & 0xF8) == 0xF0)
  {
    needed = 4;
  }
  return (continuation + 1 < needed) ? lead - 1 : len;
}

Logger& Logger::Instance()
{
  static Logger inst;
  return inst;
}

Logger::Logger() = default;

Logger::~Logger() { Stop(); }

void Logger::AddSink(std::unique_ptr<ILogSink> sink) { backend_.AddSink(std::move(sink)); }

void Logger::SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }

LogLevel Logger::Level() const { return level_.load(std::memory_order_relaxed); }

void Logger::Start()
{
  if (started_)
  {
    return;
  }
  backend_.Start();
  started_ = true;
}

void Logger::Stop()
{
  if (!started_)
  {
    return;
  }
  backend_.Stop();
  started_ = false;
}

size_t Logger::Drain(size_t max_records) { return backend_.Drain(max_records); }

uint64_t Logger::DropCount() const { return drop_count_.load(std::memory_order_relaxed); }

void Logger::ResetDropCount() { drop_count_.store(0, std::memory_order_relaxed); }

bool Logger::SetLabel(const char* key, const char* value)
{
  if (!key || !value)
  {
    return false;
  }
  std::unique_lock<std::shared_mutex> lock(labels_mutex_);
  for (uint8_t i = 0; i < label_count_; ++i)
  {
    if (std::strncmp(labels_[i].key, key, LOGWIRE_MAX_LABEL_KEY_LEN - 1) == 0)
    {
      copy_truncated(labels_[i].value, LOGWIRE_MAX_LABEL_VAL_LEN, value);
      return true;
    }
  }
  if (label_count_ >= LOGWIRE_MAX_LABELS)
  {
    return false;
  }
  copy_truncated(labels_[label_count_].key, LOGWIRE_MAX_LABEL_KEY_LEN, key);
  copy_truncated(labels_[label_count_].value, LOGWIRE_MAX_LABEL_VAL_LEN, value);
  ++label_count_;
  return true;
}

void Logger::RemoveLabel(const char* key)
{
  if (!key)
  {
    return;
  }
  std::unique_lock<std::shared_mutex> lock(labels_mutex_);
  for (uint8_t i = 0; i < label_count_; ++i)
  {
    if (std::strncmp(labels_[i].key, key, LOGWIRE_MAX_LABEL_KEY_LEN - 1) == 0)
    {
      uint8_t last = label_count_ - 1;
      if (i != last)
      {
        labels_[i] = labels_[last];
      }
      --label_count_;
      return;
    }
  }
}

void Logger::FillLabels(LogRecord& record) const
{
  std::shared_lock<std::shared_mutex> lock(labels_mutex_);
  for (uint8_t i = 0; i < label_count_; ++i)
  {
    record.labels[i] = labels_[i];
  }
  record.label_count = label_count_;
}

}  // namespace logwire

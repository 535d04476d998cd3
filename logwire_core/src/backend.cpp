#include "logwire/backend.hpp"

#if LOGWIRE_HAS_THREAD
#include <chrono>
#endif

namespace logwire
{

LoggerBackend::LoggerBackend() = default;

LoggerBackend::~LoggerBackend() { Stop(); }

bool LoggerBackend::TryPush(const LogRecord& record) { return ring_.TryPush(record); }

void LoggerBackend::AddSink(std::unique_ptr<ILogSink> sink)
{
  if (sink)
  {
    sinks_.push_back(std::move(sink));
  }
}

void LoggerBackend::Start()
{
  if (running_.exchange(true, std::memory_order_acq_rel))
  {
    return;
  }
#if LOGWIRE_HAS_THREAD
  worker_ = std::thread(&LoggerBackend::WorkerLoop, this);
#endif
}

void LoggerBackend::Stop()
{
  running_.store(false, std::memory_order_release);
#if LOGWIRE_HAS_THREAD
  if (worker_.joinable())
  {
    worker_.join();
  }
#endif
  while (Drain(64) > 0)
  {
  }
  for (auto& sink : sinks_)
  {
    sink->Flush();
  }
}

size_t LoggerBackend::Drain(size_t max_records)
{
  size_t count = 0;
  LogRecord record{};
  while (count < max_records && ring_.TryPop(record))
  {
    Dispatch(record);
    ++count;
  }
  return count;
}

void LoggerBackend::Dispatch(const LogRecord& record)
{
  for (auto& sink : sinks_)
  {
    sink->Write(record);
  }
}

#if LOGWIRE_HAS_THREAD
void LoggerBackend::WorkerLoop()
{
  uint32_t idle_count = 0;
  while (running_.load(std::memory_order_acquire))
  {
    if (Drain(64) > 0)
    {
      idle_count = 0;
      continue;
    }
    ++idle_count;
    if (idle_count < 64)
    {
      std::this_thread::yield();
    }
    else
    {
      std::this_thread::sleep_for(std::chrono::microseconds(200));
    }
  }
}
#endif

}  // namespace logwire

#pragma once
#include <atomic>
#include <memory>
#include <vector>

#include "log_record.hpp"
#include "platform.hpp"
#include "ring_buffer.hpp"
#include "sinks/sink_interface.hpp"

#if LOGWIRE_HAS_THREAD
#include <thread>
#endif

namespace logwire
{

class LoggerBackend
{
 public:
  LoggerBackend();
  ~LoggerBackend();

  // 生产者调用（业务线程）
  bool TryPush(const LogRecord& record);

  // 管理 Sink，须在 Start() 之前调用
  void AddSink(std::unique_ptr<ILogSink> sink);

  void Start();
  void Stop();  // 等待线程退出，drain 残留日志并 flush 所有 sink

  // 无线程模式下手动调用
  size_t Drain(size_t max_records = 64);

 private:
  MPSCRingBuffer<LogRecord, LOGWIRE_RING_SIZE> ring_;
  std::vector<std::unique_ptr<ILogSink>> sinks_;
  std::atomic<bool> running_{false};

#if LOGWIRE_HAS_THREAD
  std::thread worker_;
  void WorkerLoop();
#endif

  void Dispatch(const LogRecord& record);
};

}  // namespace logwire

#include <json/json.h>
#include <logwire/entry.hpp>
#include <logwire/formatters/json_formatter.hpp>
#include <logwire/logger.hpp>
#include <logwire/sinks/console_sink.hpp>
#include <logwire/sinks/entry_sink.hpp>

#include <cstdio>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

int main()
{
  auto& logger = logwire::Logger::Instance();

  // --- Sink setup ---

  // 1) Console sink, one pretty-printed entry per record
  auto console = std::make_unique<logwire::ConsoleSink>();
  console->SetFormatter(std::make_unique<logwire::JsonFormatter>(true));
  logger.AddSink(std::move(console));

  // 2) Entry sink: where a transport would batch and send
  std::mutex batch_mutex;
  std::vector<logwire::Entry> batch;
  logger.AddSink(std::make_unique<logwire::EntrySink>(
      [&](const logwire::Entry& entry)
      {
        std::lock_guard<std::mutex> lock(batch_mutex);
        batch.push_back(entry);
      }));

  logger.SetLevel(logwire::LogLevel::TRACE);
  logger.SetLabel("env", "dev");
  logger.Start();

  // --- Diagnostic logging ---

  LOG_INFO("hello {}, version {}", "world", "1.0");
  LOG_WARN("disk usage at {}%", 85);

  int error_code = 404;
  LOG_WARN_IF(error_code != 200, "HTTP error: {}", error_code);

  for (int i = 0; i < 100; ++i)
  {
    LOG_EVERY_N(INFO, 25, "progress: iteration {}", i);
  }

  auto worker = [](int id)
  {
    for (int i = 0; i < 3; ++i)
    {
      LOG_INFO("task {} processing step {}", id, i);
    }
  };
  std::thread t1(worker, 1);
  std::thread t2(worker, 2);
  t1.join();
  t2.join();

  // --- Entries built directly ---

  logwire::LogEntryMetadata md;
  md.log_name = "projects/demo/logs/requests";
  md.severity = logwire::LogSeverity::NOTICE;
  md.timestamp = std::string("2024-05-01T10:20:30.5Z");
  md.extra["httpRequest"]["status"] = 200;

  logwire::Value payload = logwire::Value::Object();
  payload["path"] = "/checkout";
  payload["items"] = 3;
  payload["self"] = payload;

  logwire::Entry entry(md, payload);
  logwire::ToJsonOptions options;
  options.remove_circular = true;

  Json::Value wire;
  if (entry.ToJson(wire, options) == logwire::Status::OK)
  {
    std::cout << wire.toStyledString();
    logwire::Entry decoded = logwire::Entry::FromApiResponse(wire);
    std::printf("decoded insertId=%s payload=%s\n", decoded.Metadata().insert_id.c_str(),
                std::string(logwire::to_string(decoded.GetPayloadKind())).c_str());
  }
  payload.AsObject().clear();

  // --- Shutdown ---

  LOG_INFO("shutting down");
  logger.Stop();

  std::printf("Example finished, %zu entries handed to the entry sink.\n", batch.size());
  return 0;
}

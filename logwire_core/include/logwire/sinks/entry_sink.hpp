#pragma once
#include <functional>

#include "../entry.hpp"
#include "sink_interface.hpp"

namespace logwire
{

// Hands each record to a callback as an Entry. Transports and batching
// attach here.
class EntrySink : public ILogSink
{
 public:
  using Callback = std::function<void(const Entry&)>;

  explicit EntrySink(Callback cb);

  void Write(const LogRecord& record) override;
  void Flush() override;

 private:
  Callback callback_;
};

}  // namespace logwire

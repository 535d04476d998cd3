#pragma once
#include <json/writer.h>

#include <memory>

#include "formatter_interface.hpp"

namespace logwire
{

// Renders a record as one wire-shaped entry (the Entry::ToJson output).
class JsonFormatter : public IFormatter
{
 public:
  explicit JsonFormatter(bool pretty = false, bool remove_circular = false);

  size_t Format(const LogRecord& record, std::string& out) override;

 private:
  bool remove_circular_;
  std::unique_ptr<Json::StreamWriter> writer_;
};

}  // namespace logwire

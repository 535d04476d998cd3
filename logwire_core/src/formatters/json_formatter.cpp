#include "logwire/formatters/json_formatter.hpp"

#include <sstream>

#include "logwire/record_entry.hpp"

namespace logwire
{

JsonFormatter::JsonFormatter(bool pretty, bool remove_circular)
    : remove_circular_(remove_circular)
{
  Json::StreamWriterBuilder builder;
  builder["indentation"] = pretty ? "  " : "";
  builder["emitUTF8"] = true;
  writer_.reset(builder.newStreamWriter());
}

size_t JsonFormatter::Format(const LogRecord& record, std::string& out)
{
  out.clear();

  Entry entry = record_to_entry(record);
  ToJsonOptions options;
  options.remove_circular = remove_circular_;

  Json::Value json;
  if (entry.ToJson(json, options) != Status::OK)
  {
    return 0;
  }

  std::ostringstream oss;
  writer_->write(json, &oss);
  out = oss.str();
  return out.size();
}

}  // namespace logwire

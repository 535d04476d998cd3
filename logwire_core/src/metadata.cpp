#include <cerrno>
#include <cstdlib>

#include "logwire/entry.hpp"
#include "logwire/logger.hpp"

namespace logwire
{

namespace
{

void merge_json(Json::Value& base, const Json::Value& supplied)
{
  if (!base.isObject() || !supplied.isObject())
  {
    base = supplied;
    return;
  }
  for (const auto& name : supplied.getMemberNames())
  {
    merge_json(base[name], supplied[name]);
  }
}

void merge_labels(std::map<std::string, std::string>& base,
                  const std::map<std::string, std::string>& supplied)
{
  for (const auto& [key, value] : supplied)
  {
    base[key] = value;
  }
}

// Accepts JSON integers, doubles and decimal strings (int64 fields are
// often sent as strings).
bool json_to_int64(const Json::Value& json, int64_t& out)
{
  if (json.isInt64())
  {
    out = json.asInt64();
    return true;
  }
  if (json.isDouble())
  {
    double value = json.asDouble();
    if (!(value > -9.2e18 && value < 9.2e18))
    {
      return false;
    }
    out = static_cast<int64_t>(value);
    return true;
  }
  if (json.isString())
  {
    std::string text = json.asString();
    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || errno == ERANGE)
    {
      return false;
    }
    out = static_cast<int64_t>(value);
    return true;
  }
  return false;
}

std::map<std::string, std::string> labels_from_json(const Json::Value& json)
{
  std::map<std::string, std::string> labels;
  if (!json.isObject())
  {
    return labels;
  }
  for (const auto& name : json.getMemberNames())
  {
    const Json::Value& value = json[name];
    if (value.isString() || value.isNumeric() || value.isBool())
    {
      labels[name] = value.asString();
    }
  }
  return labels;
}

Json::Value labels_to_json(const std::map<std::string, std::string>& labels)
{
  Json::Value json(Json::objectValue);
  for (const auto& [key, value] : labels)
  {
    json[key] = value;
  }
  return json;
}

std::optional<Timestamp> timestamp_from_json(const Json::Value& json)
{
  if (json.isString())
  {
    return Timestamp(json.asString());
  }
  if (json.isObject())
  {
    SecondsNanos pair;
    int64_t nanos = 0;
    if (json.isMember("seconds") && !json_to_int64(json["seconds"], pair.seconds))
    {
      LOG_WARN("timestamp.seconds is not an integer");
      return std::nullopt;
    }
    if (json.isMember("nanos") && !json_to_int64(json["nanos"], nanos))
    {
      LOG_WARN("timestamp.nanos is not an integer");
      return std::nullopt;
    }
    if (nanos < 0 || nanos >= 1'000'000'000LL)
    {
      LOG_WARN("timestamp.nanos {} is outside [0, 1e9)", nanos);
      return std::nullopt;
    }
    pair.nanos = static_cast<int32_t>(nanos);
    return Timestamp(pair);
  }
  LOG_WARN("ignoring timestamp of unexpected JSON type {}", static_cast<int>(json.type()));
  return std::nullopt;
}

std::optional<LogSeverity> severity_from_json(const Json::Value& json)
{
  std::optional<LogSeverity> severity;
  int64_t number = 0;
  if (json.isString())
  {
    severity = parse_severity(json.asString());
  }
  if (!severity && json_to_int64(json, number))
  {
    severity = severity_from_number(number);
  }
  if (!severity && json.isString())
  {
    LOG_WARN("ignoring unknown severity '{}'", json.asString());
  }
  else if (!severity)
  {
    LOG_WARN("ignoring severity of JSON type {}", static_cast<int>(json.type()));
  }
  return severity;
}

bool is_payload_field(const std::string& name)
{
  return name == "payload" || name == "textPayload" || name == "jsonPayload" ||
         name == "protoPayload";
}

}  // namespace

void apply_metadata(LogEntryMetadata& base, const LogEntryMetadata& supplied)
{
  if (supplied.log_name)
  {
    base.log_name = supplied.log_name;
  }
  if (supplied.resource)
  {
    if (!base.resource)
    {
      base.resource = supplied.resource;
    }
    else
    {
      if (supplied.resource->type)
      {
        base.resource->type = supplied.resource->type;
      }
      merge_labels(base.resource->labels, supplied.resource->labels);
    }
  }
  if (supplied.timestamp)
  {
    base.timestamp = supplied.timestamp;
  }
  if (supplied.severity)
  {
    base.severity = supplied.severity;
  }
  if (!supplied.insert_id.empty())
  {
    base.insert_id = supplied.insert_id;
  }
  merge_labels(base.labels, supplied.labels);
  if (supplied.trace)
  {
    base.trace = supplied.trace;
  }
  if (supplied.span_id)
  {
    base.span_id = supplied.span_id;
  }
  if (supplied.trace_sampled)
  {
    base.trace_sampled = supplied.trace_sampled;
  }
  if (supplied.source_location)
  {
    if (!base.source_location)
    {
      base.source_location = supplied.source_location;
    }
    else
    {
      const EntrySourceLocation& loc = *supplied.source_location;
      if (loc.file) base.source_location->file = loc.file;
      if (loc.line) base.source_location->line = loc.line;
      if (loc.function) base.source_location->function = loc.function;
    }
  }
  merge_json(base.extra, supplied.extra);
}

Json::Value metadata_to_json(const LogEntryMetadata& metadata)
{
  Json::Value json = metadata.extra.isObject() ? metadata.extra : Json::Value(Json::objectValue);

  if (metadata.log_name)
  {
    json["logName"] = *metadata.log_name;
  }
  if (metadata.resource)
  {
    Json::Value resource(Json::objectValue);
    if (metadata.resource->type)
    {
      resource["type"] = *metadata.resource->type;
    }
    if (!metadata.resource->labels.empty())
    {
      resource["labels"] = labels_to_json(metadata.resource->labels);
    }
    json["resource"] = std::move(resource);
  }
  if (metadata.timestamp)
  {
    SecondsNanos pair = normalize_timestamp(*metadata.timestamp);
    Json::Value timestamp(Json::objectValue);
    timestamp["seconds"] = Json::Int64(pair.seconds);
    timestamp["nanos"] = pair.nanos;
    json["timestamp"] = std::move(timestamp);
  }
  if (metadata.severity)
  {
    json["severity"] = std::string(to_string(*metadata.severity));
  }
  if (!metadata.insert_id.empty())
  {
    json["insertId"] = metadata.insert_id;
  }
  if (!metadata.labels.empty())
  {
    json["labels"] = labels_to_json(metadata.labels);
  }
  if (metadata.trace)
  {
    json["trace"] = *metadata.trace;
  }
  if (metadata.span_id)
  {
    json["spanId"] = *metadata.span_id;
  }
  if (metadata.trace_sampled)
  {
    json["traceSampled"] = *metadata.trace_sampled;
  }
  if (metadata.source_location)
  {
    const EntrySourceLocation& loc = *metadata.source_location;
    Json::Value source(Json::objectValue);
    if (loc.file) source["file"] = *loc.file;
    if (loc.line) source["line"] = Json::Int64(*loc.line);
    if (loc.function) source["function"] = *loc.function;
    json["sourceLocation"] = std::move(source);
  }
  return json;
}

LogEntryMetadata metadata_from_json(const Json::Value& json)
{
  LogEntryMetadata metadata;
  if (!json.isObject())
  {
    return metadata;
  }

  for (const auto& name : json.getMemberNames())
  {
    const Json::Value& field = json[name];
    if (name == "logName" && field.isString())
    {
      metadata.log_name = field.asString();
    }
    else if (name == "resource" && field.isObject())
    {
      MonitoredResource resource;
      if (field["type"].isString())
      {
        resource.type = field["type"].asString();
      }
      resource.labels = labels_from_json(field["labels"]);
      metadata.resource = std::move(resource);
    }
    else if (name == "timestamp")
    {
      if (!field.isNull())
      {
        metadata.timestamp = timestamp_from_json(field);
      }
    }
    else if (name == "severity")
    {
      if (!field.isNull())
      {
        metadata.severity = severity_from_json(field);
      }
    }
    else if (name == "insertId" && field.isString())
    {
      metadata.insert_id = field.asString();
    }
    else if (name == "labels")
    {
      metadata.labels = labels_from_json(field);
    }
    else if (name == "trace" && field.isString())
    {
      metadata.trace = field.asString();
    }
    else if (name == "spanId" && field.isString())
    {
      metadata.span_id = field.asString();
    }
    else if (name == "traceSampled" && field.isBool())
    {
      metadata.trace_sampled = field.asBool();
    }
    else if (name == "sourceLocation" && field.isObject())
    {
      EntrySourceLocation loc;
      int64_t line = 0;
      if (field["file"].isString()) loc.file = field["file"].asString();
      if (field["function"].isString()) loc.function = field["function"].asString();
      if (field.isMember("line") && json_to_int64(field["line"], line)) loc.line = line;
      metadata.source_location = std::move(loc);
    }
    else if (!is_payload_field(name))
    {
      metadata.extra[name] = field;
    }
  }
  return metadata;
}

}  // namespace logwire

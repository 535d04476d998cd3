#include "logwire/entry.hpp"

#include "logwire/insert_id.hpp"
#include "logwire/logger.hpp"
#include "logwire/struct_codec.hpp"

namespace logwire
{

PayloadKind payload_kind_of(const Value& data)
{
  switch (data.GetKind())
  {
    case Value::Kind::NULL_VALUE:
      return PayloadKind::UNSET;
    case Value::Kind::STRING:
      return PayloadKind::TEXT;
    case Value::Kind::OBJECT:
      return PayloadKind::STRUCTURED;
    case Value::Kind::BOOL:
    case Value::Kind::NUMBER:
    case Value::Kind::BLOB:
    case Value::Kind::LIST:
      return PayloadKind::UNSUPPORTED;
  }
  return PayloadKind::UNSUPPORTED;
}

Entry::Entry(const LogEntryMetadata& metadata, Value data)
    : data_(std::move(data)), payload_kind_(payload_kind_of(data_))
{
  metadata_.timestamp = wall_time_now();
  apply_metadata(metadata_, metadata);

  // 时间戳只有毫秒精度的来源很常见，insertId 作为同一时间戳下的二级排序键
  if (metadata_.insert_id.empty())
  {
    metadata_.insert_id = InsertIdGenerator::Instance().Next();
  }
}

Status Entry::ToJson(Json::Value& out, const ToJsonOptions& options) const
{
  Json::Value json = metadata_to_json(metadata_);
  json.removeMember("textPayload");
  json.removeMember("jsonPayload");

  switch (payload_kind_)
  {
    case PayloadKind::STRUCTURED:
    {
      StructOptions struct_options;
      struct_options.remove_circular = options.remove_circular;
      Json::Value payload;
      Status status = object_to_struct(data_, struct_options, payload);
      if (status != Status::OK)
      {
        out = Json::Value();
        return status;
      }
      json["jsonPayload"] = std::move(payload);
      break;
    }
    case PayloadKind::TEXT:
      json["textPayload"] = data_.AsString();
      break;
    case PayloadKind::UNSUPPORTED:
      LOG_WARN("entry {}: payload kind {} is neither text nor object, no payload written",
               metadata_.insert_id, static_cast<int>(data_.GetKind()));
      break;
    case PayloadKind::UNSET:
      break;
  }

  out = std::move(json);
  return Status::OK;
}

Entry Entry::FromApiResponse(const Json::Value& response)
{
  if (!response.isObject())
  {
    LOG_WARN("API entry is not a JSON object");
    return Entry();
  }

  std::string field;
  if (response["payload"].isString())
  {
    field = response["payload"].asString();
  }
  else
  {
    for (const char* candidate : {"textPayload", "jsonPayload", "protoPayload"})
    {
      if (response.isMember(candidate))
      {
        field = candidate;
        break;
      }
    }
  }

  Value data;
  if (field == "jsonPayload")
  {
    data = struct_to_object(response[field]);
  }
  else if (!field.empty())
  {
    data = value_from_json(response[field]);
  }

  LogEntryMetadata metadata = metadata_from_json(response);
  Entry entry(metadata, std::move(data));
  if (metadata.timestamp && !std::holds_alternative<WallTime>(*metadata.timestamp))
  {
    SecondsNanos pair = normalize_timestamp(*metadata.timestamp);
    WallTime wall;
    if (to_wall_time(pair, wall))
    {
      entry.metadata_.timestamp = wall;
    }
    else
    {
      LOG_WARN("timestamp seconds={} nanos={} is outside the wall clock range, kept as a pair",
               pair.seconds, pair.nanos);
      entry.metadata_.timestamp = pair;
    }
  }
  return entry;
}

}  // namespace logwire

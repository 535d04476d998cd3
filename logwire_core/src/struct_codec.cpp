#include "logwire/struct_codec.hpp"

#include <unordered_set>

#include "logwire/logger.hpp"

namespace logwire
{

namespace
{

const char kBase64Chars[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const Value::BlobType& bytes)
{
  std::string out;
  out.reserve((bytes.size() + 2) / 3 * 4);
  size_t i = 0;
  for (; i + 2 < bytes.size(); i += 3)
  {
    uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
    out += kBase64Chars[(n >> 18) & 0x3F];
    out += kBase64Chars[(n >> 12) & 0x3F];
    out += kBase64Chars[(n >> 6) & 0x3F];
    out += kBase64Chars[n & 0x3F];
  }
  size_t rest = bytes.size() - i;
  if (rest > 0)
  {
    uint32_t n = bytes[i] << 16;
    if (rest == 2)
    {
      n |= bytes[i + 1] << 8;
    }
    out += kBase64Chars[(n >> 18) & 0x3F];
    out += kBase64Chars[(n >> 12) & 0x3F];
    out += (rest == 2) ? kBase64Chars[(n >> 6) & 0x3F] : '=';
    out += '=';
  }
  return out;
}

int base64_index(char c)
{
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+' || c == '-') return 62;
  if (c == '/' || c == '_') return 63;
  return -1;
}

// Stops at the first padding or invalid character.
Value::BlobType base64_decode(const std::string& text)
{
  Value::BlobType out;
  uint32_t acc = 0;
  int bits = 0;
  for (char c : text)
  {
    int idx = base64_index(c);
    if (idx < 0)
    {
      break;
    }
    acc = (acc << 6) | static_cast<uint32_t>(idx);
    bits += 6;
    if (bits >= 8)
    {
      bits -= 8;
      out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
    }
  }
  return out;
}

class StructEncoder
{
 public:
  explicit StructEncoder(const StructOptions& options) : options_(options) {}

  bool EncodeObject(const Value& object, Json::Value& out)
  {
    ancestors_.insert(object.Identity());
    Json::Value fields(Json::objectValue);
    for (const auto& [name, field] : object.AsObject())
    {
      if (!EncodeValue(field, fields[name]))
      {
        return false;
      }
    }
    ancestors_.erase(object.Identity());
    out = Json::Value(Json::objectValue);
    out["fields"] = std::move(fields);
    return true;
  }

 private:
  bool EncodeValue(const Value& value, Json::Value& out)
  {
    out = Json::Value(Json::objectValue);
    switch (value.GetKind())
    {
      case Value::Kind::NULL_VALUE:
        out["nullValue"] = "NULL_VALUE";
        return true;
      case Value::Kind::BOOL:
        out["boolValue"] = value.AsBool();
        return true;
      case Value::Kind::NUMBER:
        out["numberValue"] = value.AsNumber();
        return true;
      case Value::Kind::STRING:
        out["stringValue"] = value.AsString();
        return true;
      case Value::Kind::BLOB:
        out["blobValue"] = base64_encode(value.AsBlob());
        return true;
      case Value::Kind::LIST:
      case Value::Kind::OBJECT:
        break;
    }

    if (ancestors_.count(value.Identity()) > 0)
    {
      if (!options_.remove_circular)
      {
        return false;
      }
      out["stringValue"] = kCircularMarker;
      return true;
    }

    if (value.IsObject())
    {
      return EncodeObject(value, out["structValue"]);
    }

    ancestors_.insert(value.Identity());
    Json::Value values(Json::arrayValue);
    for (const auto& item : value.AsList())
    {
      if (!EncodeValue(item, values.append(Json::Value())))
      {
        return false;
      }
    }
    ancestors_.erase(value.Identity());
    out["listValue"]["values"] = std::move(values);
    return true;
  }

  const StructOptions& options_;
  std::unordered_set<const void*> ancestors_;
};

const char* const kValueKinds[] = {"nullValue",   "numberValue", "stringValue", "boolValue",
                                   "structValue", "listValue",   "blobValue"};

Value decode_value(const Json::Value& wire)
{
  if (!wire.isObject())
  {
    return Value();
  }

  std::string kind;
  if (wire["kind"].isString())
  {
    kind = wire["kind"].asString();
  }
  else
  {
    for (const char* candidate : kValueKinds)
    {
      if (wire.isMember(candidate))
      {
        kind = candidate;
        break;
      }
    }
  }

  const Json::Value& field = wire[kind];
  if (kind == "numberValue" && field.isNumeric())
  {
    return Value(field.asDouble());
  }
  if (kind == "stringValue" && field.isString())
  {
    return Value(field.asString());
  }
  if (kind == "boolValue" && field.isBool())
  {
    return Value(field.asBool());
  }
  if (kind == "blobValue" && field.isString())
  {
    return Value::Blob(base64_decode(field.asString()));
  }
  if (kind == "structValue")
  {
    return struct_to_object(field);
  }
  if (kind == "listValue")
  {
    Value list = Value::List();
    for (const auto& item : field["values"])
    {
      list.Append(decode_value(item));
    }
    return list;
  }
  return Value();
}

}  // namespace

Status object_to_struct(const Value& object, const StructOptions& options, Json::Value& out)
{
  if (!object.IsObject())
  {
    out = Json::Value();
    return Status::NOT_AN_OBJECT;
  }

  StructEncoder encoder(options);
  Json::Value encoded;
  if (!encoder.EncodeObject(object, encoded))
  {
    LOG_ERROR("payload contains a circular reference, set remove_circular to replace it");
    out = Json::Value();
    return Status::CIRCULAR_REFERENCE;
  }
  out = std::move(encoded);
  return Status::OK;
}

Value struct_to_object(const Json::Value& wire)
{
  Value object = Value::Object();
  if (!wire.isObject())
  {
    return object;
  }
  const Json::Value& fields = wire["fields"];
  if (!fields.isObject())
  {
    return object;
  }
  for (const auto& name : fields.getMemberNames())
  {
    object[name] = decode_value(fields[name]);
  }
  return object;
}

}  // namespace logwire

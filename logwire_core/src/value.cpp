#include "logwire/value.hpp"

#include <json/json.h>

namespace logwire
{

Value Value::Object()
{
  Value v;
  v.data_ = std::make_shared<ObjectType>();
  return v;
}

Value Value::List()
{
  Value v;
  v.data_ = std::make_shared<ListType>();
  return v;
}

Value Value::Blob(BlobType bytes)
{
  Value v;
  v.data_ = std::make_shared<BlobType>(std::move(bytes));
  return v;
}

const void* Value::Identity() const
{
  switch (GetKind())
  {
    case Kind::LIST:
      return std::get<std::shared_ptr<ListType>>(data_).get();
    case Kind::OBJECT:
      return std::get<std::shared_ptr<ObjectType>>(data_).get();
    default:
      return nullptr;
  }
}

Value value_from_json(const Json::Value& json)
{
  switch (json.type())
  {
    case Json::nullValue:
      return Value();
    case Json::booleanValue:
      return Value(json.asBool());
    case Json::intValue:
    case Json::uintValue:
    case Json::realValue:
      return Value(json.asDouble());
    case Json::stringValue:
      return Value(json.asString());
    case Json::arrayValue:
    {
      Value list = Value::List();
      for (const auto& item : json)
      {
        list.Append(value_from_json(item));
      }
      return list;
    }
    case Json::objectValue:
    {
      Value object = Value::Object();
      for (const auto& name : json.getMemberNames())
      {
        object[name] = value_from_json(json[name]);
      }
      return object;
    }
  }
  return Value();
}

}  // namespace logwire

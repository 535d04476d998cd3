#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace Json
{
class Value;
}

namespace logwire
{

// Raw data value of an entry. Copies share list, object and blob storage,
// so a Value can reference itself through one of its fields. A cycle keeps
// its storage alive until the caller breaks it.
class Value
{
 public:
  enum class Kind : uint8_t
  {
    NULL_VALUE,
    BOOL,
    NUMBER,
    STRING,
    BLOB,
    LIST,
    OBJECT
  };

  using ListType = std::vector<Value>;
  using ObjectType = std::map<std::string, Value>;
  using BlobType = std::vector<uint8_t>;

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : data_(b) {}
  // Any integer type other than bool, stored as a double.
  template <typename T,
            typename = std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>>
  Value(T n) : data_(static_cast<double>(n))
  {
  }
  Value(double n) : data_(n) {}
  Value(const char* s) : data_(std::string(s)) {}
  Value(std::string s) : data_(std::move(s)) {}

  static Value Object();
  static Value List();
  static Value Blob(BlobType bytes);

  Kind GetKind() const { return static_cast<Kind>(data_.index()); }
  bool IsNull() const { return GetKind() == Kind::NULL_VALUE; }
  bool IsString() const { return GetKind() == Kind::STRING; }
  bool IsObject() const { return GetKind() == Kind::OBJECT; }
  bool IsList() const { return GetKind() == Kind::LIST; }

  bool AsBool() const { return std::get<bool>(data_); }
  double AsNumber() const { return std::get<double>(data_); }
  const std::string& AsString() const { return std::get<std::string>(data_); }
  const BlobType& AsBlob() const { return *std::get<std::shared_ptr<BlobType>>(data_); }
  ListType& AsList() const { return *std::get<std::shared_ptr<ListType>>(data_); }
  ObjectType& AsObject() const { return *std::get<std::shared_ptr<ObjectType>>(data_); }

  // Object field access; inserts a null field when missing. Requires IsObject().
  Value& operator[](const std::string& key) const { return AsObject()[key]; }
  // Requires IsList().
  void Append(Value item) const { AsList().push_back(std::move(item)); }

  // Address of the shared list/object storage, nullptr for other kinds.
  const void* Identity() const;

 private:
  std::variant<std::monostate, bool, double, std::string, std::shared_ptr<BlobType>,
               std::shared_ptr<ListType>, std::shared_ptr<ObjectType>>
      data_;
};

// Plain JSON to Value. Objects become OBJECT, arrays LIST, integers NUMBER.
Value value_from_json(const Json::Value& json);

}  // namespace logwire

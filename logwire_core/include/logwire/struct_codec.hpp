#pragma once
#include <json/value.h>

#include "status.hpp"
#include "value.hpp"

namespace logwire
{

inline constexpr const char* kCircularMarker = "[Circular]";

struct StructOptions
{
  // Replace self-references with kCircularMarker instead of failing.
  bool remove_circular = false;
};

// Encodes an OBJECT value as {"fields": {name: {"<kind>Value": ...}}}.
// On failure `out` is set to null.
Status object_to_struct(const Value& object, const StructOptions& options, Json::Value& out);

// Decodes the wire struct form back to an OBJECT value. Fields whose kind
// cannot be determined decode to null.
Value struct_to_object(const Json::Value& wire);

}  // namespace logwire

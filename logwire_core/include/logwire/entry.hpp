#pragma once
#include <json/value.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "severity.hpp"
#include "status.hpp"
#include "timestamp.hpp"
#include "value.hpp"

namespace logwire
{

struct MonitoredResource
{
  std::optional<std::string> type;
  std::map<std::string, std::string> labels;
};

// Code location that produced an entry ("sourceLocation" on the wire).
struct EntrySourceLocation
{
  std::optional<std::string> file;
  std::optional<int64_t> line;
  std::optional<std::string> function;
};

// Entry metadata. Unset optionals and empty maps mean "not supplied".
struct LogEntryMetadata
{
  std::optional<std::string> log_name;
  std::optional<MonitoredResource> resource;
  std::optional<Timestamp> timestamp;
  std::optional<LogSeverity> severity;
  std::string insert_id;
  std::map<std::string, std::string> labels;
  std::optional<std::string> trace;
  std::optional<std::string> span_id;
  std::optional<bool> trace_sampled;
  std::optional<EntrySourceLocation> source_location;

  // Any other wire fields, keyed by wire name. Always a JSON object.
  Json::Value extra{Json::objectValue};
};

// Overlays the fields `supplied` actually sets onto `base`. Maps merge per
// key, nested records recurse, JSON objects in `extra` merge recursively
// and everything else is replaced.
void apply_metadata(LogEntryMetadata& base, const LogEntryMetadata& supplied);

// Wire JSON <-> metadata. The timestamp is written in its normalized
// {seconds, nanos} form. Payload fields are not part of metadata.
Json::Value metadata_to_json(const LogEntryMetadata& metadata);
LogEntryMetadata metadata_from_json(const Json::Value& json);

enum class PayloadKind : uint8_t
{
  UNSET,        // data is null
  TEXT,         // textPayload
  STRUCTURED,   // jsonPayload
  UNSUPPORTED   // number, bool, blob or list: no payload field is written
};

constexpr std::string_view to_string(PayloadKind kind)
{
  switch (kind)
  {
    case PayloadKind::UNSET:
      return "UNSET";
    case PayloadKind::TEXT:
      return "TEXT";
    case PayloadKind::STRUCTURED:
      return "STRUCTURED";
    case PayloadKind::UNSUPPORTED:
      return "UNSUPPORTED";
  }
  return "UNSET";
}

PayloadKind payload_kind_of(const Value& data);

struct ToJsonOptions
{
  // Replace circular references in the payload with "[Circular]".
  bool remove_circular = false;
};

class Entry
{
 public:
  explicit Entry(const LogEntryMetadata& metadata = LogEntryMetadata(), Value data = Value());

  // Builds an entry from an API record such as an entries.list result.
  static Entry FromApiResponse(const Json::Value& response);

  // Serializes to the wire shape. On failure `out` is null; the only failure
  // is CIRCULAR_REFERENCE when options.remove_circular is false.
  Status ToJson(Json::Value& out, const ToJsonOptions& options = ToJsonOptions()) const;

  LogEntryMetadata& Metadata() { return metadata_; }
  const LogEntryMetadata& Metadata() const { return metadata_; }
  const Value& Data() const { return data_; }
  PayloadKind GetPayloadKind() const { return payload_kind_; }

 private:
  LogEntryMetadata metadata_;
  Value data_;
  PayloadKind payload_kind_;
};

}  // namespace logwire

#include <gtest/gtest.h>
#include <json/json.h>

#include <memory>
#include <string>

#include "logwire/entry.hpp"

using namespace logwire;

namespace
{

Json::Value parse(const std::string& text)
{
  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errors;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  EXPECT_TRUE(reader->parse(text.data(), text.data() + text.size(), &root, &errors)) << errors;
  return root;
}

}  // namespace

TEST(EntryFromApi, TextPayloadAndPairTimestamp)
{
  Json::Value response = parse(R"({
    "insertId": "abc",
    "logName": "projects/p/logs/l",
    "severity": "ERROR",
    "timestamp": {"seconds": 1577836800, "nanos": 5},
    "payload": "textPayload",
    "textPayload": "boom"
  })");

  Entry entry = Entry::FromApiResponse(response);
  EXPECT_EQ(entry.GetPayloadKind(), PayloadKind::TEXT);
  EXPECT_EQ(entry.Data().AsString(), "boom");
  EXPECT_EQ(entry.Metadata().insert_id, "abc");
  EXPECT_EQ(entry.Metadata().log_name, std::optional<std::string>("projects/p/logs/l"));
  EXPECT_EQ(entry.Metadata().severity, LogSeverity::ERROR);

  ASSERT_TRUE(entry.Metadata().timestamp.has_value());
  ASSERT_TRUE(std::holds_alternative<WallTime>(*entry.Metadata().timestamp));
  EXPECT_EQ(std::get<WallTime>(*entry.Metadata().timestamp).unix_ns, 1577836800000000005LL);
}

TEST(EntryFromApi, FarRangeTimestampsKeptAsPair)
{
  for (int64_t seconds : {253402300799LL, -62135596800LL})
  {
    Json::Value response(Json::objectValue);
    response["timestamp"]["seconds"] = Json::Int64(seconds);
    response["timestamp"]["nanos"] = 999'999'999;
    response["textPayload"] = "x";

    Entry entry = Entry::FromApiResponse(response);
    ASSERT_TRUE(entry.Metadata().timestamp.has_value());
    ASSERT_TRUE(std::holds_alternative<SecondsNanos>(*entry.Metadata().timestamp));
    EXPECT_EQ(std::get<SecondsNanos>(*entry.Metadata().timestamp),
              (SecondsNanos{seconds, 999'999'999}));

    Json::Value out;
    ASSERT_EQ(entry.ToJson(out), Status::OK);
    EXPECT_EQ(out["timestamp"]["seconds"].asInt64(), seconds);
    EXPECT_EQ(out["timestamp"]["nanos"].asInt(), 999'999'999);
  }
}

TEST(EntryFromApi, OutOfRangeTimestampFieldsFallBackToNow)
{
  const char* responses[] = {
      R"({"timestamp": {"seconds": "99999999999999999999"}, "textPayload": "x"})",
      R"({"timestamp": {"seconds": 1, "nanos": 1000000000}, "textPayload": "x"})",
      R"({"timestamp": {"seconds": 1, "nanos": -1}, "textPayload": "x"})",
  };
  for (const char* text : responses)
  {
    int64_t before = to_seconds_nanos(wall_time_now()).seconds;
    Entry entry = Entry::FromApiResponse(parse(text));
    ASSERT_TRUE(entry.Metadata().timestamp.has_value()) << text;
    SecondsNanos pair = normalize_timestamp(*entry.Metadata().timestamp);
    EXPECT_GE(pair.seconds, before) << text;
    EXPECT_LE(pair.seconds, before + 60) << text;
  }
}

TEST(EntryFromApi, JsonPayloadDecodedToObject)
{
  Json::Value response = parse(R"({
    "insertId": "s1",
    "payload": "jsonPayload",
    "jsonPayload": {"fields": {
      "msg": {"stringValue": "hi"},
      "n": {"numberValue": 2},
      "inner": {"structValue": {"fields": {"ok": {"boolValue": true}}}}
    }}
  })");

  Entry entry = Entry::FromApiResponse(response);
  ASSERT_EQ(entry.GetPayloadKind(), PayloadKind::STRUCTURED);
  const Value& data = entry.Data();
  EXPECT_EQ(data["msg"].AsString(), "hi");
  EXPECT_DOUBLE_EQ(data["n"].AsNumber(), 2.0);
  EXPECT_TRUE(data["inner"]["ok"].AsBool());
}

TEST(EntryFromApi, StringSecondsAccepted)
{
  Json::Value response = parse(R"({
    "insertId": "s2",
    "timestamp": {"seconds": "1700000000", "nanos": 250000000},
    "textPayload": "x"
  })");

  Entry entry = Entry::FromApiResponse(response);
  ASSERT_TRUE(entry.Metadata().timestamp.has_value());
  EXPECT_EQ(std::get<WallTime>(*entry.Metadata().timestamp).unix_ns, 1700000000250000000LL);
}

TEST(EntryFromApi, Rfc3339TimestampNormalized)
{
  Json::Value response = parse(R"({
    "insertId": "s3",
    "timestamp": "2020-01-01T00:00:00.123456789Z",
    "textPayload": "x"
  })");

  Entry entry = Entry::FromApiResponse(response);
  EXPECT_EQ(std::get<WallTime>(*entry.Metadata().timestamp).unix_ns, 1577836800123456789LL);
}

TEST(EntryFromApi, DiscriminatorFallsBackToPresentField)
{
  Json::Value response = parse(R"({"insertId": "s4", "textPayload": "fallback"})");

  Entry entry = Entry::FromApiResponse(response);
  EXPECT_EQ(entry.GetPayloadKind(), PayloadKind::TEXT);
  EXPECT_EQ(entry.Data().AsString(), "fallback");
}

TEST(EntryFromApi, ProtoPayloadKeptAsPlainObject)
{
  Json::Value response = parse(R"({
    "insertId": "s5",
    "payload": "protoPayload",
    "protoPayload": {"@type": "type.googleapis.com/google.cloud.audit.AuditLog", "methodName": "Get"}
  })");

  Entry entry = Entry::FromApiResponse(response);
  ASSERT_TRUE(entry.Data().IsObject());
  EXPECT_EQ(entry.Data()["methodName"].AsString(), "Get");
}

TEST(EntryFromApi, NoPayloadMeansNullData)
{
  Json::Value response = parse(R"({"insertId": "s6", "severity": "INFO"})");

  Entry entry = Entry::FromApiResponse(response);
  EXPECT_TRUE(entry.Data().IsNull());
  EXPECT_EQ(entry.GetPayloadKind(), PayloadKind::UNSET);
}

TEST(EntryFromApi, UnknownFieldsKeptAsExtra)
{
  Json::Value response = parse(R"({
    "insertId": "s7",
    "httpRequest": {"status": 404},
    "receiveTimestamp": "2020-01-01T00:00:01Z",
    "payload": "textPayload",
    "textPayload": "x"
  })");

  Entry entry = Entry::FromApiResponse(response);
  const Json::Value& extra = entry.Metadata().extra;
  EXPECT_EQ(extra["httpRequest"]["status"].asInt(), 404);
  EXPECT_EQ(extra["receiveTimestamp"].asString(), "2020-01-01T00:00:01Z");
  EXPECT_FALSE(extra.isMember("payload"));
  EXPECT_FALSE(extra.isMember("textPayload"));
}

TEST(EntryFromApi, NumericSeverityAccepted)
{
  Json::Value response = parse(R"({"insertId": "s8", "severity": 400})");
  EXPECT_EQ(Entry::FromApiResponse(response).Metadata().severity, LogSeverity::WARNING);
}

TEST(EntryFromApi, MissingInsertIdIsGenerated)
{
  Json::Value response = parse(R"({"textPayload": "x"})");
  EXPECT_EQ(Entry::FromApiResponse(response).Metadata().insert_id.size(), 32u);
}

TEST(EntryFromApi, NonObjectResponseGivesEmptyEntry)
{
  Entry entry = Entry::FromApiResponse(Json::Value("garbage"));
  EXPECT_TRUE(entry.Data().IsNull());
  EXPECT_FALSE(entry.Metadata().insert_id.empty());
}

TEST(EntryFromApi, SerializeThenDeserializeKeepsEntry)
{
  LogEntryMetadata md;
  md.insert_id = "round";
  md.severity = LogSeverity::NOTICE;
  md.timestamp = SecondsNanos{1600000000, 123};
  md.labels["k"] = "v";
  Value data = Value::Object();
  data["msg"] = "hello";
  data["count"] = 3;
  Entry original(md, data);

  Json::Value wire;
  ASSERT_EQ(original.ToJson(wire), Status::OK);
  Entry decoded = Entry::FromApiResponse(wire);

  EXPECT_EQ(decoded.Metadata().insert_id, "round");
  EXPECT_EQ(decoded.Metadata().severity, LogSeverity::NOTICE);
  EXPECT_EQ(decoded.Metadata().labels.at("k"), "v");
  EXPECT_EQ(decoded.Data()["msg"].AsString(), "hello");
  EXPECT_DOUBLE_EQ(decoded.Data()["count"].AsNumber(), 3.0);

  Json::Value again;
  ASSERT_EQ(decoded.ToJson(again), Status::OK);
  EXPECT_EQ(again["timestamp"]["seconds"].asInt64(), 1600000000);
  EXPECT_EQ(again["timestamp"]["nanos"].asInt(), 123);
  EXPECT_EQ(again, wire);
}

#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>

namespace blockforge::util {

/*
  JSON helpers on top of protobuf's well-known Value/Struct types.

  Block payloads and layouts are opaque JSON; they are carried as
  google::protobuf::Value / Struct in memory and as text in the store.
*/

// Parses exactly one JSON document. Returns nullopt on any syntax error.
std::optional<google::protobuf::Value> ParseJsonValue(const std::string& json);

// Parses a JSON object. Returns nullopt when the text is not an object.
std::optional<google::protobuf::Struct> ParseJsonObject(const std::string& json);

std::string ToJson(const google::protobuf::Value& value);
std::string ToJson(const google::protobuf::Struct& value);

} // namespace blockforge::util

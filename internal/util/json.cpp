#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace blockforge::util {

std::optional<google::protobuf::Value> ParseJsonValue(const std::string& json) {
  google::protobuf::Value value;
  auto                    status = google::protobuf::util::JsonStringToMessage(json, &value);
  if (!status.ok()) {
    return std::nullopt;
  }
  return value;
}

std::optional<google::protobuf::Struct> ParseJsonObject(const std::string& json) {
  google::protobuf::Struct object;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &object);
  if (!status.ok()) {
    return std::nullopt;
  }
  return object;
}

std::string ToJson(const google::protobuf::Value& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize JSON value: " + std::string(status.message()));
  }
  return json;
}

std::string ToJson(const google::protobuf::Struct& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize JSON object: " + std::string(status.message()));
  }
  return json;
}

} // namespace blockforge::util

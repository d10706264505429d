#include "metadata.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <stdexcept>

namespace freightline::token {

void SetString(Metadata& metadata, const std::string& key, const std::string& value) {
  (*metadata.mutable_fields())[key].set_string_value(value);
}

void SetNumber(Metadata& metadata, const std::string& key, double value) {
  (*metadata.mutable_fields())[key].set_number_value(value);
}

void SetBool(Metadata& metadata, const std::string& key, bool value) {
  (*metadata.mutable_fields())[key].set_bool_value(value);
}

void SetObject(Metadata& metadata, const std::string& key, const Metadata& value) {
  *(*metadata.mutable_fields())[key].mutable_struct_value() = value;
}

void SetList(Metadata& metadata, const std::string& key, const google::protobuf::ListValue& value) {
  *(*metadata.mutable_fields())[key].mutable_list_value() = value;
}

std::optional<std::string> GetString(const Metadata& metadata, const std::string& key) {
  auto it = metadata.fields().find(key);
  if (it == metadata.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return std::nullopt;
  }
  return it->second.string_value();
}

std::optional<double> GetNumber(const Metadata& metadata, const std::string& key) {
  auto it = metadata.fields().find(key);
  if (it == metadata.fields().end() || it->second.kind_case() != google::protobuf::Value::kNumberValue) {
    return std::nullopt;
  }
  return it->second.number_value();
}

bool Equal(const Metadata& a, const Metadata& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

std::string MetadataToJson(const Metadata& metadata) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(metadata, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize metadata: " + std::string(status.message()));
  }
  return json;
}

Metadata MetadataFromJson(const std::string& json) {
  Metadata metadata;
  auto     status = google::protobuf::util::JsonStringToMessage(json, &metadata);
  if (!status.ok()) {
    throw std::runtime_error("Failed to parse metadata: " + std::string(status.message()));
  }
  return metadata;
}

} // namespace freightline::token

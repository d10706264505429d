#pragma once

#include <map>
#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

namespace freightline::token {

/*
  Token metadata is a JSON-compatible object (google.protobuf.Struct) so
  it serializes losslessly to the registry's JSON payload column.
*/
using Metadata  = google::protobuf::Struct;
using Relations = std::map<std::string, std::string>; // role -> token id

void SetString(Metadata& metadata, const std::string& key, const std::string& value);
void SetNumber(Metadata& metadata, const std::string& key, double value);
void SetBool(Metadata& metadata, const std::string& key, bool value);
void SetObject(Metadata& metadata, const std::string& key, const Metadata& value);
void SetList(Metadata& metadata, const std::string& key, const google::protobuf::ListValue& value);

std::optional<std::string> GetString(const Metadata& metadata, const std::string& key);
std::optional<double>      GetNumber(const Metadata& metadata, const std::string& key);

// Deep structural equality.
bool Equal(const Metadata& a, const Metadata& b);

// Throws std::runtime_error on conversion failure.
std::string MetadataToJson(const Metadata& metadata);
Metadata    MetadataFromJson(const std::string& json);

} // namespace freightline::token

/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

#include "colmap/json_internal.h"

#include <charconv>
#include <cstdint>
#include <format>
#include <limits>
#include <regex>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "colmap/util/formatter.h"  // IWYU pragma: keep
#include "colmap/util/json_util_internal.h"
#include "colmap/util/macros.h"

namespace colmap {

namespace {

constexpr std::string_view kType = "type";
constexpr std::string_view kStruct = "struct";
constexpr std::string_view kArray = "array";
constexpr std::string_view kMap = "map";
constexpr std::string_view kFields = "fields";
constexpr std::string_view kName = "name";
constexpr std::string_view kNullable = "nullable";
constexpr std::string_view kMetadata = "metadata";
constexpr std::string_view kElementType = "elementType";
constexpr std::string_view kContainsNull = "containsNull";
constexpr std::string_view kKeyType = "keyType";
constexpr std::string_view kValueType = "valueType";
constexpr std::string_view kValueContainsNull = "valueContainsNull";

constexpr int32_t kDefaultDecimalPrecision = 10;

Result<MetadataValue> MetadataValueFromJson(const nlohmann::json& json) {
  if (json.is_string()) {
    return MetadataValue(std::in_place_type<std::string>, json.get<std::string>());
  } else if (json.is_boolean()) {
    return MetadataValue(std::in_place_type<bool>, json.get<bool>());
  } else if (json.is_number_unsigned() &&
             json.get<uint64_t>() >
                 static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    return JsonParseError("Field metadata value out of range: {}", SafeDumpJson(json));
  } else if (json.is_number_integer()) {
    return MetadataValue(std::in_place_type<int64_t>, json.get<int64_t>());
  } else if (json.is_object()) {
    COLMAP_ASSIGN_OR_RAISE(auto nested, FieldMetadataFromJson(json));
    return MetadataValue(std::in_place_type<std::shared_ptr<const FieldMetadata>>,
                         std::make_shared<const FieldMetadata>(std::move(nested)));
  }
  return JsonParseError("Unsupported field metadata value: {}", SafeDumpJson(json));
}

Result<int32_t> DecimalComponentFromString(const std::string& str,
                                           const std::string& type_str) {
  int32_t value = 0;
  const char* end = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(str.data(), end, value);
  if (ec != std::errc() || ptr != end) [[unlikely]] {
    return JsonParseError("Invalid decimal precision or scale: {}", type_str);
  }
  return value;
}

Result<std::shared_ptr<const DataType>> PrimitiveTypeFromJson(const std::string& type_str) {
  if (type_str == "boolean") {
    return boolean();
  } else if (type_str == "byte") {
    return int8();
  } else if (type_str == "short") {
    return int16();
  } else if (type_str == "integer") {
    return int32();
  } else if (type_str == "long") {
    return int64();
  } else if (type_str == "float") {
    return float32();
  } else if (type_str == "double") {
    return float64();
  } else if (type_str == "string") {
    return string();
  } else if (type_str == "binary") {
    return binary();
  } else if (type_str == "date") {
    return date();
  } else if (type_str == "timestamp") {
    return timestamp();
  } else if (type_str == "timestamp_ntz") {
    return timestamp_ntz();
  } else if (type_str == "decimal") {
    return decimal(kDefaultDecimalPrecision, 0);
  } else if (type_str.starts_with("decimal")) {
    std::regex decimal_regex(R"(decimal\(\s*(\d+)\s*,\s*(\d+)\s*\))");
    std::smatch match;
    if (std::regex_match(type_str, match, decimal_regex)) {
      COLMAP_ASSIGN_OR_RAISE(auto precision,
                             DecimalComponentFromString(match[1].str(), type_str));
      COLMAP_ASSIGN_OR_RAISE(auto scale,
                             DecimalComponentFromString(match[2].str(), type_str));
      if (precision < 1 || precision > PrimitiveType::kMaxPrecision || scale > precision) {
        return JsonParseError("Invalid decimal precision or scale: {}", type_str);
      }
      return decimal(precision, scale);
    }
    return JsonParseError("Invalid decimal type: {}", type_str);
  }
  return JsonParseError("Unknown primitive type: {}", type_str);
}

Result<std::shared_ptr<const DataType>> ArrayTypeFromJson(const nlohmann::json& json) {
  COLMAP_ASSIGN_OR_RAISE(
      auto element_type,
      GetJsonValue<nlohmann::json>(json, kElementType).and_then(TypeFromJson));
  COLMAP_ASSIGN_OR_RAISE(auto contains_null, GetJsonValue<bool>(json, kContainsNull));
  return array(std::move(element_type), contains_null);
}

Result<std::shared_ptr<const DataType>> MapTypeFromJson(const nlohmann::json& json) {
  COLMAP_ASSIGN_OR_RAISE(
      auto key_type, GetJsonValue<nlohmann::json>(json, kKeyType).and_then(TypeFromJson));
  COLMAP_ASSIGN_OR_RAISE(
      auto value_type,
      GetJsonValue<nlohmann::json>(json, kValueType).and_then(TypeFromJson));
  COLMAP_ASSIGN_OR_RAISE(auto value_contains_null,
                         GetJsonValue<bool>(json, kValueContainsNull));
  return map(std::move(key_type), std::move(value_type), value_contains_null);
}

}  // namespace

nlohmann::json ToJson(const FieldMetadata& metadata) {
  nlohmann::json json = nlohmann::json::object();
  for (const auto& [key, value] : metadata.entries()) {
    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::shared_ptr<const FieldMetadata>>) {
            json[key] = v != nullptr ? ToJson(*v) : nlohmann::json::object();
          } else {
            json[key] = v;
          }
        },
        value);
  }
  return json;
}

Result<FieldMetadata> FieldMetadataFromJson(const nlohmann::json& json) {
  if (!json.is_object()) [[unlikely]] {
    return JsonParseError("Cannot parse field metadata from non-object: {}",
                          SafeDumpJson(json));
  }
  FieldMetadata::Builder builder;
  for (const auto& [key, value_json] : json.items()) {
    COLMAP_ASSIGN_OR_RAISE(auto value, MetadataValueFromJson(value_json));
    builder.Put(key, std::move(value));
  }
  return builder.Build();
}

nlohmann::json ToJson(const DataType& type) {
  if (const auto* struct_type = type.As<StructType>()) {
    return ToJson(*struct_type);
  }
  if (const auto* array_type = type.As<ArrayType>()) {
    nlohmann::json json;
    json[kType] = kArray;
    json[kElementType] = ToJson(*array_type->element_type());
    json[kContainsNull] = array_type->contains_null();
    return json;
  }
  if (const auto* map_type = type.As<MapType>()) {
    nlohmann::json json;
    json[kType] = kMap;
    json[kKeyType] = ToJson(*map_type->key_type());
    json[kValueType] = ToJson(*map_type->value_type());
    json[kValueContainsNull] = map_type->value_contains_null();
    return json;
  }
  return type.ToString();
}

Result<std::shared_ptr<const DataType>> TypeFromJson(const nlohmann::json& json) {
  if (json.is_string()) {
    return PrimitiveTypeFromJson(json.get<std::string>());
  }

  COLMAP_ASSIGN_OR_RAISE(auto type_str, GetJsonValue<std::string>(json, kType));
  if (type_str == kStruct) {
    COLMAP_ASSIGN_OR_RAISE(auto struct_type, StructTypeFromJson(json));
    return std::make_shared<const DataType>(std::move(struct_type));
  } else if (type_str == kArray) {
    return ArrayTypeFromJson(json);
  } else if (type_str == kMap) {
    return MapTypeFromJson(json);
  }
  return JsonParseError("Unknown complex type: {}", type_str);
}

nlohmann::json ToJson(const StructField& field) {
  nlohmann::json json;
  json[kName] = field.name();
  json[kType] = ToJson(*field.type());
  json[kNullable] = field.nullable();
  json[kMetadata] = ToJson(field.metadata());
  return json;
}

Result<StructField> FieldFromJson(const nlohmann::json& json) {
  COLMAP_ASSIGN_OR_RAISE(auto name, GetJsonValue<std::string>(json, kName));
  COLMAP_ASSIGN_OR_RAISE(
      auto type, GetJsonValue<nlohmann::json>(json, kType).and_then(TypeFromJson));
  COLMAP_ASSIGN_OR_RAISE(auto nullable, GetJsonValue<bool>(json, kNullable));
  COLMAP_ASSIGN_OR_RAISE(
      auto metadata_json,
      GetJsonValueOrDefault<nlohmann::json>(json, kMetadata, nlohmann::json::object()));
  COLMAP_ASSIGN_OR_RAISE(auto metadata, FieldMetadataFromJson(metadata_json));
  return StructField(std::move(name), std::move(type), nullable, std::move(metadata));
}

nlohmann::json ToJson(const StructType& struct_type) {
  nlohmann::json fields = nlohmann::json::array();
  for (const auto& field : struct_type.fields()) {
    fields.push_back(ToJson(field));
  }
  nlohmann::json json;
  json[kType] = kStruct;
  json[kFields] = std::move(fields);
  return json;
}

Result<StructType> StructTypeFromJson(const nlohmann::json& json) {
  COLMAP_ASSIGN_OR_RAISE(auto type_str, GetJsonValue<std::string>(json, kType));
  if (type_str != kStruct) [[unlikely]] {
    return JsonParseError("Expected a struct type but got '{}'", type_str);
  }
  COLMAP_ASSIGN_OR_RAISE(auto fields_json, GetJsonValue<nlohmann::json>(json, kFields));
  if (!fields_json.is_array()) [[unlikely]] {
    return JsonParseError("Cannot parse '{}' from non-array: {}", kFields,
                          SafeDumpJson(fields_json));
  }

  std::vector<StructField> fields;
  fields.reserve(fields_json.size());
  for (const auto& field_json : fields_json) {
    COLMAP_ASSIGN_OR_RAISE(auto field, FieldFromJson(field_json));
    fields.push_back(std::move(field));
  }
  return StructType(std::move(fields));
}

Result<std::string> ToJsonString(const StructType& struct_type) {
  return ToJsonString(ToJson(struct_type));
}

Result<nlohmann::json> FromJsonString(const std::string& json_string) {
  auto json =
      nlohmann::json::parse(json_string, /*cb=*/nullptr, /*allow_exceptions=*/false);
  if (json.is_discarded()) [[unlikely]] {
    return JsonParseError("Failed to parse JSON string: {}", json_string);
  }
  return json;
}

Result<std::string> ToJsonString(const nlohmann::json& json) {
  try {
    return json.dump();
  } catch (const std::exception& e) {
    return JsonParseError("Failed to serialize to JSON string: {}", e.what());
  }
}

}  // namespace colmap

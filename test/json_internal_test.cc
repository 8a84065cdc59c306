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

#include <limits>
#include <memory>
#include <string>
#include <string_view>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "colmap/column_mapping.h"
#include "colmap/field_metadata.h"
#include "matchers.h"
#include "colmap/type.h"

namespace colmap {

struct TypeJsonParam {
  std::string json;
  std::shared_ptr<const DataType> type;
};

class TypeJsonTest : public ::testing::TestWithParam<TypeJsonParam> {};

TEST_P(TypeJsonTest, SingleTypeRoundTrip) {
  // To Json
  const auto& param = GetParam();
  auto json = ToJson(*param.type).dump();
  ASSERT_EQ(param.json, json);

  // From Json
  auto type_result = TypeFromJson(nlohmann::json::parse(param.json));
  ASSERT_TRUE(type_result.has_value()) << "Failed to deserialize " << param.json
                                       << " with error " << type_result.error().message;
  auto type = std::move(type_result.value());
  ASSERT_EQ(*param.type, *type);
}

INSTANTIATE_TEST_SUITE_P(
    JsonSerialization, TypeJsonTest,
    ::testing::Values(
        TypeJsonParam{.json = "\"boolean\"", .type = boolean()},
        TypeJsonParam{.json = "\"byte\"", .type = int8()},
        TypeJsonParam{.json = "\"short\"", .type = int16()},
        TypeJsonParam{.json = "\"integer\"", .type = int32()},
        TypeJsonParam{.json = "\"long\"", .type = int64()},
        TypeJsonParam{.json = "\"float\"", .type = float32()},
        TypeJsonParam{.json = "\"double\"", .type = float64()},
        TypeJsonParam{.json = "\"string\"", .type = string()},
        TypeJsonParam{.json = "\"binary\"", .type = binary()},
        TypeJsonParam{.json = "\"date\"", .type = date()},
        TypeJsonParam{.json = "\"timestamp\"", .type = timestamp()},
        TypeJsonParam{.json = "\"timestamp_ntz\"", .type = timestamp_ntz()},
        TypeJsonParam{.json = "\"decimal(10,2)\"", .type = decimal(10, 2)},
        TypeJsonParam{
            .json = R"({"containsNull":false,"elementType":"string","type":"array"})",
            .type = array(string(), false)},
        TypeJsonParam{
            .json =
                R"({"keyType":"string","type":"map","valueContainsNull":true,"valueType":"double"})",
            .type = map(string(), float64())},
        TypeJsonParam{
            .json =
                R"({"fields":[{"metadata":{},"name":"a","nullable":false,"type":"integer"}],"type":"struct"})",
            .type = struct_({StructField("a", int32(), false)})}));

TEST(TypeJsonTest, DecimalVariants) {
  EXPECT_THAT(TypeFromJson("decimal"), HasValue(::testing::Pointee(*decimal(10, 0))));
  EXPECT_THAT(TypeFromJson("decimal( 38 , 0 )"),
              HasValue(::testing::Pointee(*decimal(38, 0))));
  EXPECT_THAT(TypeFromJson("decimal(39,0)"), IsError(ErrorKind::kJsonParseError));
  EXPECT_THAT(TypeFromJson("decimal(5,6)"), IsError(ErrorKind::kJsonParseError));
  EXPECT_THAT(TypeFromJson("decimal(a,b)"), IsError(ErrorKind::kJsonParseError));
}

TEST(TypeJsonTest, InvalidTypes) {
  auto unknown = TypeFromJson("uuid");
  EXPECT_THAT(unknown, IsError(ErrorKind::kJsonParseError));
  EXPECT_THAT(unknown, HasErrorMessage("Unknown primitive type: uuid"));

  EXPECT_THAT(TypeFromJson(nlohmann::json::parse(R"({"type":"list"})")),
              HasErrorMessage("Unknown complex type: list"));
  EXPECT_THAT(TypeFromJson(nlohmann::json::parse(R"({"type":"array"})")),
              HasErrorMessage("Missing 'elementType'"));
  EXPECT_THAT(TypeFromJson(nlohmann::json::parse(
                  R"({"type":"array","elementType":"string","containsNull":"yes"})")),
              IsError(ErrorKind::kJsonParseError));
  EXPECT_THAT(TypeFromJson(nlohmann::json(42)), IsError(ErrorKind::kJsonParseError));

  auto overflowing_precision = TypeFromJson("decimal(99999999999,0)");
  EXPECT_THAT(overflowing_precision, IsError(ErrorKind::kJsonParseError));
  EXPECT_THAT(overflowing_precision,
              HasErrorMessage("precision or scale: decimal(99999999999,0)"));
  EXPECT_THAT(TypeFromJson("decimal(10,99999999999)"),
              IsError(ErrorKind::kJsonParseError));
}

TEST(FieldMetadataJsonTest, RoundTrip) {
  auto metadata =
      FieldMetadata::Builder()
          .PutLong(std::string(kColumnMappingIdKey), 5)
          .PutString(std::string(kColumnMappingPhysicalNameKey), "col-5")
          .PutBoolean("flag", true)
          .PutMetadata(std::string(kColumnMappingNestedIdsKey),
                       FieldMetadata::Builder().PutLong("col-5.element", 6).Build())
          .Build();

  auto json = ToJson(metadata);
  EXPECT_EQ(json.dump(),
            R"({"delta.columnMapping.id":5,"delta.columnMapping.nested.ids":{"col-5.element":6},)"
            R"("delta.columnMapping.physicalName":"col-5","flag":true})");
  EXPECT_THAT(FieldMetadataFromJson(json), HasValue(::testing::Eq(metadata)));
}

TEST(FieldMetadataJsonTest, UnsupportedValues) {
  EXPECT_THAT(FieldMetadataFromJson(nlohmann::json::parse(R"({"a":1.5})")),
              IsError(ErrorKind::kJsonParseError));
  EXPECT_THAT(FieldMetadataFromJson(nlohmann::json::parse(R"({"a":[1,2]})")),
              IsError(ErrorKind::kJsonParseError));
  EXPECT_THAT(FieldMetadataFromJson(nlohmann::json::parse(R"({"a":{"b":null}})")),
              HasErrorMessage("Unsupported field metadata value: null"));
  EXPECT_THAT(FieldMetadataFromJson(nlohmann::json::parse("[]")),
              HasErrorMessage("non-object"));
}

TEST(FieldMetadataJsonTest, LongValuesOutOfRange) {
  auto too_large = FieldMetadataFromJson(
      nlohmann::json::parse(R"({"delta.columnMapping.id":18446744073709551615})"));
  EXPECT_THAT(too_large, IsError(ErrorKind::kJsonParseError));
  EXPECT_THAT(too_large,
              HasErrorMessage("Field metadata value out of range: 18446744073709551615"));

  auto largest_json =
      nlohmann::json::parse(R"({"delta.columnMapping.id":9223372036854775807})");
  COLMAP_UNWRAP_OR_FAIL(auto largest, FieldMetadataFromJson(largest_json));
  EXPECT_THAT(largest.GetLong(kColumnMappingIdKey),
              HasValue(::testing::Optional(std::numeric_limits<int64_t>::max())));
}

TEST(StructFieldJsonTest, MetadataIsOptional) {
  auto field_json = nlohmann::json::parse(R"({"name":"a","type":"long","nullable":true})");
  COLMAP_UNWRAP_OR_FAIL(auto field, FieldFromJson(field_json));
  EXPECT_EQ(field, StructField("a", int64()));
  EXPECT_EQ(ToJson(field).dump(),
            R"({"metadata":{},"name":"a","nullable":true,"type":"long"})");

  EXPECT_THAT(FieldFromJson(nlohmann::json::parse(R"({"name":"a","type":"long"})")),
              HasErrorMessage("Missing 'nullable'"));
}

TEST(SchemaJsonTest, RoundTrip) {
  constexpr std::string_view json_string =
      R"({"fields":[)"
      R"({"metadata":{"delta.columnMapping.id":1,"delta.columnMapping.physicalName":"col-1"},)"
      R"("name":"id","nullable":false,"type":"long"},)"
      R"({"metadata":{"delta.columnMapping.id":2,)"
      R"("delta.columnMapping.nested.ids":{"col-2.key":4,"col-2.value":5},)"
      R"("delta.columnMapping.physicalName":"col-2"},"name":"tags","nullable":true,)"
      R"("type":{"keyType":"string","type":"map","valueContainsNull":true,)"
      R"("valueType":{"fields":[{"metadata":{"delta.columnMapping.id":3,)"
      R"("delta.columnMapping.physicalName":"col-3"},"name":"weight","nullable":true,)"
      R"("type":"decimal(10,2)"}],"type":"struct"}}}],"type":"struct"})";

  COLMAP_UNWRAP_OR_FAIL(auto json, FromJsonString(std::string(json_string)));
  COLMAP_UNWRAP_OR_FAIL(auto schema, StructTypeFromJson(json));
  ASSERT_EQ(schema.fields().size(), 2U);
  EXPECT_EQ(schema.fields()[0].name(), "id");
  EXPECT_FALSE(schema.fields()[0].nullable());
  EXPECT_THAT(GetColumnId(schema.fields()[1]), HasValue(::testing::Eq(2)));
  auto nested_ids = schema.fields()[1].metadata().GetMetadata(kColumnMappingNestedIdsKey);
  ASSERT_THAT(nested_ids, HasValue(::testing::NotNull()));
  EXPECT_THAT((*nested_ids)->GetLong("col-2.value"),
              HasValue(::testing::Optional(int64_t{5})));

  EXPECT_THAT(ToJsonString(schema), HasValue(::testing::Eq(std::string(json_string))));
}

TEST(SchemaJsonTest, Errors) {
  EXPECT_THAT(FromJsonString("{not json"), IsError(ErrorKind::kJsonParseError));
  EXPECT_THAT(StructTypeFromJson(nlohmann::json::parse(R"({"type":"array"})")),
              HasErrorMessage("Expected a struct type but got 'array'"));
  EXPECT_THAT(StructTypeFromJson(nlohmann::json::parse(R"({"type":"struct","fields":{}})")),
              HasErrorMessage("Cannot parse 'fields' from non-array"));
  EXPECT_THAT(StructTypeFromJson(nlohmann::json::parse(R"({"type":"struct"})")),
              HasErrorMessage("Missing 'fields'"));
  EXPECT_THAT(StructTypeFromJson(nlohmann::json::parse(
                  R"({"type":"struct","fields":[{"name":"a","type":"int","nullable":true}]})")),
              HasErrorMessage("Unknown primitive type: int"));
}

TEST(SchemaJsonTest, EmptyStruct) {
  StructType empty;
  EXPECT_EQ(ToJson(empty).dump(), R"({"fields":[],"type":"struct"})");
  EXPECT_THAT(StructTypeFromJson(ToJson(empty)), HasValue(::testing::Eq(empty)));
}

}  // namespace colmap

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

#include "colmap/table_properties.h"

#include <cstdint>
#include <string>

#include <gtest/gtest.h>

namespace colmap {

TEST(TablePropertiesTest, Defaults) {
  TableProperties properties;

  ASSERT_EQ(properties.Get(TableProperties::kColumnMappingMode), "none");
  ASSERT_EQ(properties.Get(TableProperties::kColumnMappingMaxColumnId), 0);
  ASSERT_FALSE(properties.Get(TableProperties::kIcebergCompatV2Enabled));
  ASSERT_FALSE(properties.Get(TableProperties::kIcebergWriterCompatV1Enabled));
  ASSERT_FALSE(properties.Contains(TableProperties::kColumnMappingMode));
  ASSERT_EQ(properties.GetRaw(TableProperties::kColumnMappingMode), std::nullopt);
  ASSERT_TRUE(properties.configs().empty());
}

TEST(TablePropertiesTest, SetOverwritesAndUnset) {
  TableProperties properties;

  properties.Set(TableProperties::kColumnMappingMode, std::string("name"))
      .Set(TableProperties::kColumnMappingMaxColumnId, int64_t{7})
      .Set(TableProperties::kIcebergCompatV2Enabled, true);
  ASSERT_EQ(properties.Get(TableProperties::kColumnMappingMode), "name");
  ASSERT_EQ(properties.Get(TableProperties::kColumnMappingMaxColumnId), 7);
  ASSERT_EQ(properties.GetRaw(TableProperties::kColumnMappingMaxColumnId), "7");
  ASSERT_TRUE(properties.Get(TableProperties::kIcebergCompatV2Enabled));
  ASSERT_EQ(properties.configs().at("delta.enableIcebergCompatV2"), "true");

  properties.Set(TableProperties::kColumnMappingMode, std::string("id"));
  ASSERT_EQ(properties.Get(TableProperties::kColumnMappingMode), "id");

  properties.Unset(TableProperties::kColumnMappingMaxColumnId);
  ASSERT_EQ(properties.Get(TableProperties::kColumnMappingMaxColumnId), 0);
  ASSERT_EQ(properties.configs().size(), 2);

  properties.Reset();
  ASSERT_TRUE(properties.configs().empty());
}

TEST(TablePropertiesTest, BooleanValuesIgnoreCase) {
  auto properties = TableProperties::FromMap({{"delta.enableIcebergCompatV2", "TRUE"},
                                              {"delta.enableIcebergWriterCompatV1", "yes"}});

  ASSERT_TRUE(properties.Get(TableProperties::kIcebergCompatV2Enabled));
  ASSERT_FALSE(properties.Get(TableProperties::kIcebergWriterCompatV1Enabled));
}

TEST(TablePropertiesTest, FromMapKeepsUnknownKeys) {
  auto properties = TableProperties::FromMap(
      {{"delta.columnMapping.mode", "id"}, {"delta.appendOnly", "true"}});

  ASSERT_EQ(properties.Get(TableProperties::kColumnMappingMode), "id");
  ASSERT_EQ(properties.configs().at("delta.appendOnly"), "true");
}

TEST(TablePropertiesTest, MergeReturnsNewValue) {
  auto original = TableProperties::FromMap(
      {{"delta.columnMapping.mode", "name"}, {"delta.columnMapping.maxColumnId", "3"}});

  auto merged = original.Merge({{"delta.columnMapping.maxColumnId", "5"}, {"other", "x"}});

  ASSERT_EQ(merged.Get(TableProperties::kColumnMappingMaxColumnId), 5);
  ASSERT_EQ(merged.Get(TableProperties::kColumnMappingMode), "name");
  ASSERT_EQ(merged.configs().at("other"), "x");
  ASSERT_EQ(original.Get(TableProperties::kColumnMappingMaxColumnId), 3);
  ASSERT_FALSE(original == merged);
  ASSERT_TRUE(original == original.Merge({}));
}

}  // namespace colmap

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

#include "colmap/table_metadata.h"

#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "colmap/table_properties.h"
#include "colmap/type.h"

namespace colmap {

namespace {

std::shared_ptr<const StructType> MakeSchema() {
  return std::make_shared<const StructType>(
      std::vector<StructField>{StructField("a", int32()), StructField("b", string())});
}

}  // namespace

TEST(TableMetadataTest, EqualityComparesSchemaByValue) {
  TableMetadata lhs{.schema = MakeSchema(),
                    .configuration = TableProperties::FromMap({{"k", "v"}})};
  TableMetadata rhs{.schema = MakeSchema(),
                    .configuration = TableProperties::FromMap({{"k", "v"}})};
  EXPECT_NE(lhs.schema, rhs.schema);
  EXPECT_EQ(lhs, rhs);

  EXPECT_NE(lhs, rhs.WithMergedConfiguration({{"k", "w"}}));
  EXPECT_NE(lhs, rhs.WithSchema(nullptr));
  EXPECT_EQ(lhs.WithSchema(nullptr), rhs.WithSchema(nullptr));
  EXPECT_NE(lhs, rhs.WithSchema(std::make_shared<const StructType>()));
}

TEST(TableMetadataTest, WithFunctionsCopy) {
  TableMetadata original{.schema = MakeSchema(), .configuration = {}};

  auto merged = original.WithMergedConfiguration({{"delta.columnMapping.mode", "id"}});
  EXPECT_EQ(merged.schema, original.schema);
  EXPECT_EQ(merged.configuration.Get(TableProperties::kColumnMappingMode), "id");
  EXPECT_TRUE(original.configuration.configs().empty());

  auto replaced = merged.WithSchema(std::make_shared<const StructType>());
  EXPECT_TRUE(replaced.schema->empty());
  EXPECT_EQ(replaced.configuration, merged.configuration);
  EXPECT_EQ(merged.schema->fields().size(), 2U);
}

}  // namespace colmap

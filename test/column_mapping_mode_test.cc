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

#include "colmap/column_mapping_mode.h"

#include <format>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "colmap/table_properties.h"
#include "matchers.h"
#include "colmap/util/formatter.h"  // IWYU pragma: keep

namespace colmap {

namespace {

TableProperties WithMode(const std::string& mode) {
  return TableProperties::FromMap({{"delta.columnMapping.mode", mode}});
}

}  // namespace

TEST(ColumnMappingModeTest, OnlyNameAndIdAreEnabled) {
  EXPECT_FALSE(IsColumnMappingModeEnabled(ColumnMappingMode::kNone));
  EXPECT_TRUE(IsColumnMappingModeEnabled(ColumnMappingMode::kName));
  EXPECT_TRUE(IsColumnMappingModeEnabled(ColumnMappingMode::kId));
}

TEST(ColumnMappingModeTest, ToStringAndParse) {
  for (auto mode : {ColumnMappingMode::kNone, ColumnMappingMode::kName,
                    ColumnMappingMode::kId}) {
    EXPECT_THAT(ColumnMappingModeFromString(ToString(mode)),
                HasValue(::testing::Eq(mode)));
  }
  EXPECT_EQ(ToString(ColumnMappingMode::kName), "name");
  EXPECT_EQ(std::format("{}", ColumnMappingMode::kId), "id");
  EXPECT_THAT(ColumnMappingModeFromString("NaMe"),
              HasValue(::testing::Eq(ColumnMappingMode::kName)));

  auto invalid = ColumnMappingModeFromString("physical");
  EXPECT_THAT(invalid, IsError(ErrorKind::kInvalidConfig));
  EXPECT_THAT(invalid, HasErrorMessage("'delta.columnMapping.mode': 'physical'"));
}

TEST(ColumnMappingModeTest, ModeOfConfiguration) {
  EXPECT_THAT(GetColumnMappingMode(TableProperties()),
              HasValue(::testing::Eq(ColumnMappingMode::kNone)));
  EXPECT_THAT(GetColumnMappingMode(WithMode("id")),
              HasValue(::testing::Eq(ColumnMappingMode::kId)));
  EXPECT_THAT(GetColumnMappingMode(WithMode("bogus")),
              IsError(ErrorKind::kInvalidConfig));
}

TEST(ColumnMappingModeTest, ChangeWithEmptyConfiguration) {
  EXPECT_THAT(VerifyColumnMappingChange(TableProperties(), TableProperties(),
                                        /*is_new_table=*/false),
              IsOk());
  EXPECT_THAT(VerifyColumnMappingChange(TableProperties(), TableProperties(),
                                        /*is_new_table=*/true),
              IsOk());
}

TEST(ColumnMappingModeTest, AnyChangeIsAllowedOnNewTable) {
  for (const auto* from : {"none", "name", "id"}) {
    for (const auto* to : {"none", "name", "id"}) {
      EXPECT_THAT(
          VerifyColumnMappingChange(WithMode(from), WithMode(to), /*is_new_table=*/true),
          IsOk())
          << from << " -> " << to;
    }
  }
  EXPECT_THAT(
      VerifyColumnMappingChange(TableProperties(), WithMode("id"), /*is_new_table=*/true),
      IsOk());
}

TEST(ColumnMappingModeTest, SameModeIsAllowedOnExistingTable) {
  for (const auto* mode : {"none", "name", "id"}) {
    EXPECT_THAT(
        VerifyColumnMappingChange(WithMode(mode), WithMode(mode), /*is_new_table=*/false),
        IsOk());
  }
  // A missing key is the same as "none"
  EXPECT_THAT(VerifyColumnMappingChange(TableProperties(), WithMode("none"),
                                        /*is_new_table=*/false),
              IsOk());
}

TEST(ColumnMappingModeTest, ChangeNotAllowedOnExistingTable) {
  auto name_to_id =
      VerifyColumnMappingChange(WithMode("name"), WithMode("id"), /*is_new_table=*/false);
  EXPECT_THAT(name_to_id, IsError(ErrorKind::kInvalidConfig));
  EXPECT_THAT(name_to_id, HasErrorMessage("Changing column mapping mode from 'name' to "
                                          "'id' is not supported"));

  EXPECT_THAT(
      VerifyColumnMappingChange(WithMode("id"), WithMode("none"), /*is_new_table=*/false),
      HasErrorMessage("from 'id' to 'none' is not supported"));

  EXPECT_THAT(VerifyColumnMappingChange(TableProperties(), WithMode("id"),
                                        /*is_new_table=*/false),
              HasErrorMessage("from 'none' to 'id' is not supported"));
}

}  // namespace colmap

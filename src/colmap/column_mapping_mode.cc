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

#include <utility>

#include "colmap/table_properties.h"
#include "colmap/util/macros.h"
#include "colmap/util/string_util.h"

namespace colmap {

std::string_view ToString(ColumnMappingMode mode) {
  switch (mode) {
    case ColumnMappingMode::kNone:
      return "none";
    case ColumnMappingMode::kName:
      return "name";
    case ColumnMappingMode::kId:
      return "id";
  }
  std::unreachable();
}

Result<ColumnMappingMode> ColumnMappingModeFromString(std::string_view str) {
  auto lower = StringUtils::ToLower(str);
  if (lower == "none") {
    return ColumnMappingMode::kNone;
  } else if (lower == "name") {
    return ColumnMappingMode::kName;
  } else if (lower == "id") {
    return ColumnMappingMode::kId;
  }
  return InvalidConfig("Invalid value for table property '{}': '{}'",
                       TableProperties::kColumnMappingMode.key(), str);
}

bool IsColumnMappingModeEnabled(ColumnMappingMode mode) {
  return mode == ColumnMappingMode::kName || mode == ColumnMappingMode::kId;
}

Result<ColumnMappingMode> GetColumnMappingMode(const TableProperties& configuration) {
  return ColumnMappingModeFromString(
      configuration.Get(TableProperties::kColumnMappingMode));
}

Status VerifyColumnMappingChange(const TableProperties& old_configuration,
                                 const TableProperties& new_configuration,
                                 bool is_new_table) {
  COLMAP_ASSIGN_OR_RAISE(auto new_mode, GetColumnMappingMode(new_configuration));
  if (is_new_table) {
    return {};
  }

  COLMAP_ASSIGN_OR_RAISE(auto old_mode, GetColumnMappingMode(old_configuration));
  if (old_mode != new_mode) {
    return InvalidConfig("Changing column mapping mode from '{}' to '{}' is not supported",
                         ToString(old_mode), ToString(new_mode));
  }
  return {};
}

}  // namespace colmap

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

#pragma once

/// \file colmap/physical_column.h
/// Translation of logical column references and read schemas to the physical
/// names stored in data files.

#include <memory>
#include <string_view>

#include "colmap/colmap_export.h"
#include "colmap/column_path.h"
#include "colmap/result.h"
#include "colmap/type.h"
#include "colmap/type_fwd.h"

namespace colmap {

/// Physical schema metadata key of the column id, read by the file writer.
constexpr std::string_view kParquetFieldIdKey = "parquet.field.id";
/// Physical schema metadata key of the nested ids of an array or map column.
constexpr std::string_view kParquetFieldNestedIdsKey = "parquet.field.nested.ids";

/// \brief A logical column resolved against a table schema.
struct COLMAP_EXPORT ResolvedColumn {
  /// The physical path, in the case stored in the schema
  ColumnPath physical_path;
  /// The declared type of the column
  std::shared_ptr<const DataType> type;
};

/// \brief Resolve a logical column path to its physical path and type.
///
/// Each name matches a struct field ignoring case.  The field's physical name
/// replaces it when the field has one.  Arrays and maps are entered only
/// through an explicit "element", "key" or "value" name.
///
/// \return NotFound naming the full logical path if some name does not
/// match.
COLMAP_EXPORT Result<ResolvedColumn> GetPhysicalColumnNameAndDataType(
    const StructType& schema, const ColumnPath& logical_path);

/// \brief Resolve a logical column path under a column mapping mode.
///
/// In kNone mode the stored logical names are returned and physical names are
/// ignored; otherwise this is GetPhysicalColumnNameAndDataType(schema, path).
COLMAP_EXPORT Result<ResolvedColumn> GetPhysicalColumnNameAndDataType(
    const StructType& schema, const ColumnPath& logical_path, ColumnMappingMode mode);

/// \brief Convert a read schema to the schema of the physical columns.
///
/// Every field of `read_schema` is looked up by name in `table_schema` and
/// renamed to its physical name.  In kId mode the physical fields carry the
/// column id under kParquetFieldIdKey and, for arrays and maps, the nested ids
/// under kParquetFieldNestedIdsKey.  In kNone mode `read_schema` is returned
/// as is.
///
/// \return NotFound if a read field is not in the table schema, InvalidSchema
/// if a table field has no physical name.
COLMAP_EXPORT Result<StructType> ConvertToPhysicalSchema(const StructType& read_schema,
                                                         const StructType& table_schema,
                                                         ColumnMappingMode mode);

}  // namespace colmap

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

/// \file colmap/column_mapping.h
/// Assignment of column ids and physical names to the fields of a table schema.
///
/// With column mapping enabled every struct field carries a column id and a
/// physical name in its metadata.  Both are assigned once and never change, so
/// a field can be renamed or moved without rewriting data files.  When
/// IcebergCompatV2 is enabled, array and map fields additionally record ids for
/// their element, key and value positions under kColumnMappingNestedIdsKey.

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "colmap/colmap_export.h"
#include "colmap/result.h"
#include "colmap/table_metadata.h"
#include "colmap/type.h"
#include "colmap/type_fwd.h"
#include "colmap/util/uuid.h"

namespace colmap {

/// Field metadata key of the column id (long).
constexpr std::string_view kColumnMappingIdKey = "delta.columnMapping.id";
/// Field metadata key of the physical name (string).
constexpr std::string_view kColumnMappingPhysicalNameKey =
    "delta.columnMapping.physicalName";
/// Field metadata key of the nested ids of an array or map field (metadata of
/// longs keyed by "<prefix>.element", "<prefix>.key", "<prefix>.value", ...).
constexpr std::string_view kColumnMappingNestedIdsKey = "delta.columnMapping.nested.ids";

/// \brief Source of the random tokens used in physical names of new tables.
using UuidGenerator = std::function<Uuid()>;

/// \brief Does the field carry a column id?
COLMAP_EXPORT bool HasColumnId(const StructField& field);

/// \brief Does the field carry a physical name?
COLMAP_EXPORT bool HasPhysicalName(const StructField& field);

/// \brief Get the column id of a field.
///
/// \return InvalidSchema if the field has no column id.
COLMAP_EXPORT Result<int64_t> GetColumnId(const StructField& field);

/// \brief Get the physical name of a field, or its logical name if it has none.
COLMAP_EXPORT Result<std::string> GetPhysicalName(const StructField& field);

/// \brief Find the largest column id used anywhere in `schema`.
///
/// Column ids of struct fields at every depth, including structs inside arrays
/// and maps, and every value recorded in nested ids are considered.  Missing
/// or malformed ids count as 0, so an unannotated schema yields 0.
COLMAP_EXPORT int64_t FindMaxColumnId(const StructType& schema);

/// \brief Assign column ids and physical names to the fields that lack them.
///
/// Numbering continues after the larger of the configured max column id and
/// FindMaxColumnId(schema).  Fields are visited depth first in declaration
/// order; a field is numbered before its children.  Physical names are
/// "col-<uuid>" for new tables and the logical name for existing tables, or
/// "col-<id>" for either when IcebergWriterCompatV1 is enabled.  With
/// IcebergCompatV2, missing nested ids are assigned afterwards in a second
/// walk of the same order.  Finally the configured max column id is set to the
/// highest id handed out.
///
/// \param[in] metadata The table metadata to update.
/// \param[in] is_new_table Whether the table is being created.
/// \param[in] uuid_generator Source of the tokens for "col-<uuid>" physical
/// names.  Uuid::GenerateV4() is used when empty.
/// \return std::nullopt if column mapping is disabled or the metadata already
/// holds every id, every physical name and the right max column id.
/// InvalidSchema if a field has only one of column id and physical name.
/// InvalidConfig if the mode or the max column id cannot be parsed.
COLMAP_EXPORT Result<std::optional<TableMetadata>> UpdateColumnMappingMetadataIfNeeded(
    const TableMetadata& metadata, bool is_new_table,
    const UuidGenerator& uuid_generator = {});

}  // namespace colmap

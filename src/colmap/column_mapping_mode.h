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

/// \file colmap/column_mapping_mode.h
/// Parsing and validation of the table's column mapping mode.

#include <string_view>

#include "colmap/colmap_export.h"
#include "colmap/result.h"
#include "colmap/type_fwd.h"

namespace colmap {

/// \brief Get the lower-case name of a mode: "none", "name" or "id".
COLMAP_EXPORT std::string_view ToString(ColumnMappingMode mode);

/// \brief Parse a mode name, ignoring case.
///
/// \return InvalidConfig if `str` names no mode.
COLMAP_EXPORT Result<ColumnMappingMode> ColumnMappingModeFromString(std::string_view str);

/// \brief Is column mapping active, i.e. the mode is "name" or "id"?
COLMAP_EXPORT bool IsColumnMappingModeEnabled(ColumnMappingMode mode);

/// \brief Get the mode of a table configuration.  A missing key means kNone.
COLMAP_EXPORT Result<ColumnMappingMode> GetColumnMappingMode(
    const TableProperties& configuration);

/// \brief Check that a configuration update changes the mode legally.
///
/// A new table may start with any mode.  An existing table must keep its
/// mode; any change fails with InvalidConfig.
COLMAP_EXPORT Status VerifyColumnMappingChange(const TableProperties& old_configuration,
                                               const TableProperties& new_configuration,
                                               bool is_new_table);

}  // namespace colmap

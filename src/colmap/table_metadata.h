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

/// \file colmap/table_metadata.h
/// The parts of a table's metadata that column mapping reads and rewrites.

#include <memory>
#include <string>
#include <unordered_map>

#include "colmap/colmap_export.h"
#include "colmap/table_properties.h"
#include "colmap/type.h"

namespace colmap {

/// \brief A table's logical schema together with its configuration.
///
/// Values are never modified in place; the With* functions return updated
/// copies.
struct COLMAP_EXPORT TableMetadata {
  /// The logical schema of the table
  std::shared_ptr<const StructType> schema;
  /// The table configuration
  TableProperties configuration;

  /// \brief Return a copy with the schema replaced.
  TableMetadata WithSchema(std::shared_ptr<const StructType> new_schema) const;

  /// \brief Return a copy with `entries` merged into the configuration,
  /// overwriting existing keys.
  TableMetadata WithMergedConfiguration(
      const std::unordered_map<std::string, std::string>& entries) const;

  COLMAP_EXPORT friend bool operator==(const TableMetadata& lhs,
                                       const TableMetadata& rhs);
};

}  // namespace colmap

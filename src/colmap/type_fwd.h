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

/// \file colmap/type_fwd.h
/// Forward declarations and enum definitions.  When writing your own headers,
/// you can include this instead of the "full" headers to help reduce compile
/// times.

#include <cstdint>

namespace colmap {

/// \brief The kind of a primitive (leaf) data type.
enum class PrimitiveKind : uint8_t {
  kBoolean,
  kByte,
  kShort,
  kInteger,
  kLong,
  kFloat,
  kDouble,
  kDecimal,
  kString,
  kBinary,
  kDate,
  kTimestamp,
  kTimestampNtz,
};

/// \brief How logical columns map to physical columns in data files.
enum class ColumnMappingMode : uint8_t {
  /// Physical columns are the logical columns.
  kNone,
  /// Physical columns are found by the physical name stored in field metadata.
  kName,
  /// Physical columns are found by the column id stored in field metadata.
  kId,
};

class ArrayType;
class ColumnPath;
class DataType;
class FieldMetadata;
class MapType;
class PrimitiveType;
class StructField;
class StructType;
class TableProperties;
class Uuid;

struct ResolvedColumn;
struct TableMetadata;

}  // namespace colmap

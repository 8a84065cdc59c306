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

/// \file colmap/json_internal.h
/// JSON serialization of schemas in the table-protocol layout:
///
///     {"type": "struct", "fields": [
///       {"name": "a", "type": "integer", "nullable": true, "metadata": {}},
///       {"name": "b", "type": {"type": "array", "elementType": "string",
///                              "containsNull": true},
///        "nullable": true, "metadata": {"delta.columnMapping.id": 2}}]}
///
/// Maps are {"type": "map", "keyType": ..., "valueType": ...,
/// "valueContainsNull": ...}; primitive types are plain strings.

#include <memory>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "colmap/colmap_export.h"
#include "colmap/field_metadata.h"
#include "colmap/result.h"
#include "colmap/type.h"

namespace colmap {

/// \brief Serialize field metadata to a JSON object.
///
/// Nested metadata becomes a nested object.
COLMAP_EXPORT nlohmann::json ToJson(const FieldMetadata& metadata);

/// \brief Deserialize field metadata from a JSON object.
///
/// Integral numbers become longs.  Fractional numbers, arrays and nulls are
/// rejected with JsonParseError.
COLMAP_EXPORT Result<FieldMetadata> FieldMetadataFromJson(const nlohmann::json& json);

/// \brief Serialize a data type.  Primitive types become strings.
COLMAP_EXPORT nlohmann::json ToJson(const DataType& type);

/// \brief Deserialize a data type.
COLMAP_EXPORT Result<std::shared_ptr<const DataType>> TypeFromJson(
    const nlohmann::json& json);

/// \brief Serialize a struct field.
COLMAP_EXPORT nlohmann::json ToJson(const StructField& field);

/// \brief Deserialize a struct field.  "metadata" may be omitted.
COLMAP_EXPORT Result<StructField> FieldFromJson(const nlohmann::json& json);

/// \brief Serialize a struct type, e.g. a table schema.
COLMAP_EXPORT nlohmann::json ToJson(const StructType& struct_type);

/// \brief Deserialize a struct type, e.g. a table schema.
///
/// \return JsonParseError if the JSON is malformed or not a struct.
COLMAP_EXPORT Result<StructType> StructTypeFromJson(const nlohmann::json& json);

/// \brief Serialize a struct type to a JSON string.
COLMAP_EXPORT Result<std::string> ToJsonString(const StructType& struct_type);

/// \brief Parse a JSON string.
COLMAP_EXPORT Result<nlohmann::json> FromJsonString(const std::string& json_string);

/// \brief Dump a JSON value to a string.
COLMAP_EXPORT Result<std::string> ToJsonString(const nlohmann::json& json);

}  // namespace colmap

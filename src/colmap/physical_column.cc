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

#include "colmap/physical_column.h"

#include <string>
#include <utility>
#include <vector>

#include "colmap/column_mapping.h"
#include "colmap/column_mapping_mode.h"
#include "colmap/util/formatter.h"  // IWYU pragma: keep
#include "colmap/util/logging.h"
#include "colmap/util/macros.h"
#include "colmap/util/string_util.h"

namespace colmap {

namespace {

Result<ResolvedColumn> ResolveColumn(const StructType& schema,
                                     const ColumnPath& logical_path,
                                     bool use_physical_names) {
  auto not_found = [&logical_path]() {
    return NotFound("Column '{}' was not found in the table schema", logical_path);
  };

  std::vector<std::string> physical_names;
  physical_names.reserve(logical_path.size());
  std::shared_ptr<const DataType> type;
  // nullptr stands for the schema itself
  const DataType* parent = nullptr;

  for (const auto& name : logical_path.names()) {
    const StructType* parent_struct =
        parent == nullptr ? &schema : parent->As<StructType>();
    const StructField* field = nullptr;

    if (parent_struct != nullptr) {
      COLMAP_ASSIGN_OR_RAISE(auto found,
                             parent_struct->GetFieldByName(name, /*case_sensitive=*/false));
      if (!found.has_value()) {
        return not_found();
      }
      field = &found->get();
      if (use_physical_names) {
        COLMAP_ASSIGN_OR_RAISE(auto physical_name, GetPhysicalName(*field));
        physical_names.push_back(std::move(physical_name));
      } else {
        physical_names.push_back(field->name());
      }
    } else if (const auto* array_type = parent->As<ArrayType>()) {
      if (!StringUtils::EqualsIgnoreCase(name, ArrayType::kElementName)) {
        return not_found();
      }
      field = &array_type->element();
      physical_names.push_back(field->name());
    } else if (const auto* map_type = parent->As<MapType>()) {
      if (StringUtils::EqualsIgnoreCase(name, MapType::kKeyName)) {
        field = &map_type->key();
      } else if (StringUtils::EqualsIgnoreCase(name, MapType::kValueName)) {
        field = &map_type->value();
      } else {
        return not_found();
      }
      physical_names.push_back(field->name());
    } else {
      return not_found();
    }

    type = field->type();
    parent = type.get();
  }

  ColumnPath physical_path(std::move(physical_names));
  COLMAP_LOG_DEBUG("Resolved column {} to physical column {}", logical_path.ToString(),
                   physical_path.ToString());
  return ResolvedColumn{.physical_path = std::move(physical_path), .type = std::move(type)};
}

/// \brief Rewrites a read schema field by field against the table schema.
class PhysicalSchemaConverter {
 public:
  explicit PhysicalSchemaConverter(ColumnMappingMode mode) : mode_(mode) {}

  Result<StructType> ConvertStruct(const StructType& read_struct,
                                   const StructType& table_struct) {
    std::vector<StructField> fields;
    fields.reserve(read_struct.fields().size());
    for (const auto& read_field : read_struct.fields()) {
      path_.push_back(read_field.name());
      COLMAP_ASSIGN_OR_RAISE(auto table_field,
                             table_struct.GetFieldByName(read_field.name()));
      if (!table_field.has_value()) {
        return NotFound("Column '{}' was not found in the table schema",
                        ColumnPath(path_));
      }
      COLMAP_ASSIGN_OR_RAISE(auto physical_field,
                             ConvertField(read_field, table_field->get()));
      fields.push_back(std::move(physical_field));
      path_.pop_back();
    }
    return StructType(std::move(fields));
  }

 private:
  Result<StructField> ConvertField(const StructField& read_field,
                                   const StructField& table_field) {
    if (!HasPhysicalName(table_field)) {
      return InvalidSchema("Column '{}' has no physical name", ColumnPath(path_));
    }
    COLMAP_ASSIGN_OR_RAISE(auto physical_name, GetPhysicalName(table_field));

    FieldMetadata::Builder metadata;
    if (mode_ == ColumnMappingMode::kId) {
      COLMAP_ASSIGN_OR_RAISE(auto column_id, GetColumnId(table_field));
      metadata.PutLong(std::string(kParquetFieldIdKey), column_id);
      COLMAP_ASSIGN_OR_RAISE(auto nested_ids,
                             table_field.metadata().GetMetadata(kColumnMappingNestedIdsKey));
      if (nested_ids != nullptr) {
        metadata.PutMetadata(std::string(kParquetFieldNestedIdsKey), *nested_ids);
      }
    }

    COLMAP_ASSIGN_OR_RAISE(auto type, ConvertType(read_field.type(), table_field.type()));
    return StructField(std::move(physical_name), std::move(type), read_field.nullable(),
                       metadata.Build());
  }

  Result<std::shared_ptr<const DataType>> ConvertType(
      const std::shared_ptr<const DataType>& read_type,
      const std::shared_ptr<const DataType>& table_type) {
    if (read_type->is_primitive()) {
      return read_type;
    }
    if (read_type->value().index() != table_type->value().index()) [[unlikely]] {
      return InvalidSchema("Column '{}' is {} in the read schema but {} in the table schema",
                           ColumnPath(path_), *read_type, *table_type);
    }

    if (const auto* read_struct = read_type->As<StructType>()) {
      COLMAP_ASSIGN_OR_RAISE(auto converted,
                             ConvertStruct(*read_struct, *table_type->As<StructType>()));
      return std::make_shared<const DataType>(std::move(converted));
    }
    if (const auto* read_array = read_type->As<ArrayType>()) {
      const auto* table_array = table_type->As<ArrayType>();
      COLMAP_ASSIGN_OR_RAISE(
          auto element_type,
          ConvertType(read_array->element_type(), table_array->element_type()));
      return std::make_shared<const DataType>(
          ArrayType(read_array->element().WithType(std::move(element_type))));
    }
    const auto* read_map = read_type->As<MapType>();
    const auto* table_map = table_type->As<MapType>();
    COLMAP_ASSIGN_OR_RAISE(auto key_type,
                           ConvertType(read_map->key_type(), table_map->key_type()));
    COLMAP_ASSIGN_OR_RAISE(auto value_type,
                           ConvertType(read_map->value_type(), table_map->value_type()));
    return std::make_shared<const DataType>(
        MapType(read_map->key().WithType(std::move(key_type)),
                read_map->value().WithType(std::move(value_type))));
  }

  const ColumnMappingMode mode_;
  std::vector<std::string> path_;
};

}  // namespace

Result<ResolvedColumn> GetPhysicalColumnNameAndDataType(const StructType& schema,
                                                        const ColumnPath& logical_path) {
  return ResolveColumn(schema, logical_path, /*use_physical_names=*/true);
}

Result<ResolvedColumn> GetPhysicalColumnNameAndDataType(const StructType& schema,
                                                        const ColumnPath& logical_path,
                                                        ColumnMappingMode mode) {
  return ResolveColumn(schema, logical_path, IsColumnMappingModeEnabled(mode));
}

Result<StructType> ConvertToPhysicalSchema(const StructType& read_schema,
                                           const StructType& table_schema,
                                           ColumnMappingMode mode) {
  if (!IsColumnMappingModeEnabled(mode)) {
    return read_schema;
  }
  PhysicalSchemaConverter converter(mode);
  return converter.ConvertStruct(read_schema, table_schema);
}

}  // namespace colmap

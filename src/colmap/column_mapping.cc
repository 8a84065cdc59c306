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

#include "colmap/column_mapping.h"

#include <algorithm>
#include <charconv>
#include <format>
#include <limits>
#include <memory>
#include <utility>
#include <vector>

#include "colmap/column_mapping_mode.h"
#include "colmap/table_properties.h"
#include "colmap/util/formatter.h"  // IWYU pragma: keep
#include "colmap/util/logging.h"
#include "colmap/util/macros.h"

namespace colmap {

namespace {

int64_t IdOrZero(const MetadataValue* value) {
  if (value == nullptr) {
    return 0;
  }
  if (const auto* id = std::get_if<int64_t>(value)) {
    return *id;
  }
  return 0;
}

int64_t FindMaxColumnIdInType(const DataType& type);

int64_t FindMaxColumnIdInField(const StructField& field) {
  const auto& metadata = field.metadata();
  int64_t max_id = IdOrZero(metadata.Find(kColumnMappingIdKey));
  if (const auto* value = metadata.Find(kColumnMappingNestedIdsKey)) {
    const auto* nested_ids = std::get_if<std::shared_ptr<const FieldMetadata>>(value);
    if (nested_ids != nullptr && *nested_ids != nullptr) {
      for (const auto& [_, nested_id] : (*nested_ids)->entries()) {
        max_id = std::max(max_id, IdOrZero(&nested_id));
      }
    }
  }
  return std::max(max_id, FindMaxColumnIdInType(*field.type()));
}

int64_t FindMaxColumnIdInType(const DataType& type) {
  int64_t max_id = 0;
  if (const auto* struct_type = type.As<StructType>()) {
    for (const auto& field : struct_type->fields()) {
      max_id = std::max(max_id, FindMaxColumnIdInField(field));
    }
  } else if (const auto* array_type = type.As<ArrayType>()) {
    max_id = FindMaxColumnIdInField(array_type->element());
  } else if (const auto* map_type = type.As<MapType>()) {
    max_id = std::max(FindMaxColumnIdInField(map_type->key()),
                      FindMaxColumnIdInField(map_type->value()));
  }
  return max_id;
}

Result<int64_t> GetConfiguredMaxColumnId(const TableProperties& configuration) {
  const auto& entry = TableProperties::kColumnMappingMaxColumnId;
  auto raw = configuration.GetRaw(entry);
  if (!raw.has_value()) {
    return 0;
  }
  int64_t max_column_id = 0;
  const char* end = raw->data() + raw->size();
  auto [ptr, ec] = std::from_chars(raw->data(), end, max_column_id);
  if (ec != std::errc() || ptr != end) [[unlikely]] {
    return InvalidConfig("Invalid value for table property '{}': '{}'", entry.key(),
                         *raw);
  }
  return max_column_id;
}

Result<int64_t> NextColumnId(int64_t& max_column_id) {
  if (max_column_id == std::numeric_limits<int64_t>::max()) [[unlikely]] {
    return InvalidSchema("Cannot assign a column id after {}", max_column_id);
  }
  return ++max_column_id;
}

/// \brief Gives every struct field without a column id the next id and a
/// physical name.  Parents are numbered before their children.
class ColumnIdAssigner {
 public:
  ColumnIdAssigner(int64_t max_column_id, bool is_new_table,
                   bool use_column_id_as_physical_name,
                   const UuidGenerator& uuid_generator)
      : max_column_id_(max_column_id),
        is_new_table_(is_new_table),
        use_column_id_as_physical_name_(use_column_id_as_physical_name),
        uuid_generator_(uuid_generator) {}

  Result<StructType> Assign(const StructType& schema) {
    std::vector<StructField> fields;
    fields.reserve(schema.fields().size());
    for (const auto& field : schema.fields()) {
      COLMAP_ASSIGN_OR_RAISE(auto assigned, AssignField(field));
      fields.push_back(std::move(assigned));
    }
    return StructType(std::move(fields));
  }

  int64_t max_column_id() const { return max_column_id_; }

 private:
  Result<StructField> AssignField(const StructField& field) {
    const auto& metadata = field.metadata();
    COLMAP_ASSIGN_OR_RAISE(auto column_id, metadata.GetLong(kColumnMappingIdKey));
    COLMAP_ASSIGN_OR_RAISE(auto physical_name,
                           metadata.GetString(kColumnMappingPhysicalNameKey));
    if (column_id.has_value() != physical_name.has_value()) [[unlikely]] {
      return InvalidSchema(
          "Both columnId and physicalName must be present if one is present");
    }

    StructField assigned = field;
    if (!column_id.has_value()) {
      COLMAP_ASSIGN_OR_RAISE(auto new_column_id, NextColumnId(max_column_id_));
      std::string new_physical_name = NewPhysicalName(field, new_column_id);
      COLMAP_LOG_DEBUG("Assigning column id {} and physical name '{}' to field '{}'",
                       new_column_id, new_physical_name, field.name());
      assigned = field.WithMetadata(
          FieldMetadata::Builder()
              .FromMetadata(metadata)
              .PutLong(std::string(kColumnMappingIdKey), new_column_id)
              .PutString(std::string(kColumnMappingPhysicalNameKey),
                         std::move(new_physical_name))
              .Build());
    }

    COLMAP_ASSIGN_OR_RAISE(auto type, AssignType(field.type()));
    return assigned.WithType(std::move(type));
  }

  Result<std::shared_ptr<const DataType>> AssignType(
      const std::shared_ptr<const DataType>& type) {
    if (const auto* struct_type = type->As<StructType>()) {
      COLMAP_ASSIGN_OR_RAISE(auto assigned, Assign(*struct_type));
      return std::make_shared<const DataType>(std::move(assigned));
    }
    if (const auto* array_type = type->As<ArrayType>()) {
      // The element itself never gets an id, only structs below it.
      COLMAP_ASSIGN_OR_RAISE(auto element_type, AssignType(array_type->element_type()));
      return std::make_shared<const DataType>(
          ArrayType(array_type->element().WithType(std::move(element_type))));
    }
    if (const auto* map_type = type->As<MapType>()) {
      COLMAP_ASSIGN_OR_RAISE(auto key_type, AssignType(map_type->key_type()));
      COLMAP_ASSIGN_OR_RAISE(auto value_type, AssignType(map_type->value_type()));
      return std::make_shared<const DataType>(
          MapType(map_type->key().WithType(std::move(key_type)),
                  map_type->value().WithType(std::move(value_type))));
    }
    return type;
  }

  std::string NewPhysicalName(const StructField& field, int64_t column_id) const {
    if (use_column_id_as_physical_name_) {
      return std::format("col-{}", column_id);
    }
    if (is_new_table_) {
      return std::format("col-{}", uuid_generator_());
    }
    return field.name();
  }

  int64_t max_column_id_;
  const bool is_new_table_;
  const bool use_column_id_as_physical_name_;
  const UuidGenerator& uuid_generator_;
};

/// \brief Gives the element, key and value positions of every array and map
/// field an id, unless the field already records one for that position.
///
/// Ids are keyed by "<prefix>.element", "<prefix>.key" and "<prefix>.value",
/// extended position by position through directly nested containers, and
/// stored on the struct field that owns the outermost container.  Positions
/// are numbered depth first, key before value.
class NestedIdAssigner {
 public:
  NestedIdAssigner(int64_t max_column_id, bool use_column_id_as_prefix)
      : max_column_id_(max_column_id), use_column_id_as_prefix_(use_column_id_as_prefix) {}

  Result<StructType> Assign(const StructType& schema) {
    std::vector<StructField> fields;
    fields.reserve(schema.fields().size());
    for (const auto& field : schema.fields()) {
      COLMAP_ASSIGN_OR_RAISE(auto assigned, AssignField(field));
      fields.push_back(std::move(assigned));
    }
    return StructType(std::move(fields));
  }

  int64_t max_column_id() const { return max_column_id_; }

 private:
  Result<StructField> AssignField(const StructField& field) {
    StructField assigned = field;
    if (field.type()->is_container()) {
      COLMAP_ASSIGN_OR_RAISE(auto prefix, NestedIdPrefix(field));
      COLMAP_ASSIGN_OR_RAISE(auto existing,
                             field.metadata().GetMetadata(kColumnMappingNestedIdsKey));

      FieldMetadata::Builder nested_ids;
      if (existing != nullptr) {
        nested_ids.FromMetadata(*existing);
      }
      COLMAP_ASSIGN_OR_RAISE(
          auto added, AssignNestedIds(prefix, *field.type(), existing.get(), nested_ids));
      if (added) {
        assigned = field.WithMetadata(
            FieldMetadata::Builder()
                .FromMetadata(field.metadata())
                .PutMetadata(std::string(kColumnMappingNestedIdsKey), nested_ids.Build())
                .Build());
      }
    }

    COLMAP_ASSIGN_OR_RAISE(auto type, AssignType(field.type()));
    return assigned.WithType(std::move(type));
  }

  /// \brief Continue into the structs below a type.
  Result<std::shared_ptr<const DataType>> AssignType(
      const std::shared_ptr<const DataType>& type) {
    if (const auto* struct_type = type->As<StructType>()) {
      COLMAP_ASSIGN_OR_RAISE(auto assigned, Assign(*struct_type));
      return std::make_shared<const DataType>(std::move(assigned));
    }
    if (const auto* array_type = type->As<ArrayType>()) {
      COLMAP_ASSIGN_OR_RAISE(auto element_type, AssignType(array_type->element_type()));
      return std::make_shared<const DataType>(
          ArrayType(array_type->element().WithType(std::move(element_type))));
    }
    if (const auto* map_type = type->As<MapType>()) {
      COLMAP_ASSIGN_OR_RAISE(auto key_type, AssignType(map_type->key_type()));
      COLMAP_ASSIGN_OR_RAISE(auto value_type, AssignType(map_type->value_type()));
      return std::make_shared<const DataType>(
          MapType(map_type->key().WithType(std::move(key_type)),
                  map_type->value().WithType(std::move(value_type))));
    }
    return type;
  }

  /// \return whether any id was added to `nested_ids`.
  Result<bool> AssignNestedIds(const std::string& path, const DataType& type,
                               const FieldMetadata* existing,
                               FieldMetadata::Builder& nested_ids) {
    bool added = false;
    auto assign_position = [&](std::string_view position, const DataType& child) -> Status {
      std::string child_path = std::format("{}.{}", path, position);
      if (existing == nullptr || !existing->Contains(child_path)) {
        COLMAP_ASSIGN_OR_RAISE(auto nested_id, NextColumnId(max_column_id_));
        nested_ids.PutLong(child_path, nested_id);
        added = true;
      }
      COLMAP_ASSIGN_OR_RAISE(auto child_added,
                             AssignNestedIds(child_path, child, existing, nested_ids));
      added = added || child_added;
      return {};
    };

    if (const auto* array_type = type.As<ArrayType>()) {
      COLMAP_RETURN_UNEXPECTED(
          assign_position(ArrayType::kElementName, *array_type->element_type()));
    } else if (const auto* map_type = type.As<MapType>()) {
      COLMAP_RETURN_UNEXPECTED(assign_position(MapType::kKeyName, *map_type->key_type()));
      COLMAP_RETURN_UNEXPECTED(
          assign_position(MapType::kValueName, *map_type->value_type()));
    }
    return added;
  }

  Result<std::string> NestedIdPrefix(const StructField& field) const {
    if (use_column_id_as_prefix_) {
      COLMAP_ASSIGN_OR_RAISE(auto column_id, GetColumnId(field));
      return std::format("col-{}", column_id);
    }
    return GetPhysicalName(field);
  }

  int64_t max_column_id_;
  const bool use_column_id_as_prefix_;
};

}  // namespace

bool HasColumnId(const StructField& field) {
  return field.metadata().Contains(kColumnMappingIdKey);
}

bool HasPhysicalName(const StructField& field) {
  return field.metadata().Contains(kColumnMappingPhysicalNameKey);
}

Result<int64_t> GetColumnId(const StructField& field) {
  COLMAP_ASSIGN_OR_RAISE(auto column_id, field.metadata().GetLong(kColumnMappingIdKey));
  if (!column_id.has_value()) {
    return InvalidSchema("Field '{}' has no column id", field.name());
  }
  return *column_id;
}

Result<std::string> GetPhysicalName(const StructField& field) {
  COLMAP_ASSIGN_OR_RAISE(auto physical_name,
                         field.metadata().GetString(kColumnMappingPhysicalNameKey));
  return physical_name.value_or(field.name());
}

int64_t FindMaxColumnId(const StructType& schema) {
  int64_t max_id = 0;
  for (const auto& field : schema.fields()) {
    max_id = std::max(max_id, FindMaxColumnIdInField(field));
  }
  return max_id;
}

Result<std::optional<TableMetadata>> UpdateColumnMappingMetadataIfNeeded(
    const TableMetadata& metadata, bool is_new_table,
    const UuidGenerator& uuid_generator) {
  static const UuidGenerator kDefaultUuidGenerator = [] { return Uuid::GenerateV4(); };

  const auto& configuration = metadata.configuration;
  COLMAP_ASSIGN_OR_RAISE(auto mode, GetColumnMappingMode(configuration));
  if (!IsColumnMappingModeEnabled(mode)) {
    return std::nullopt;
  }
  if (metadata.schema == nullptr) [[unlikely]] {
    return InvalidArgument("Cannot assign column mapping metadata without a schema");
  }

  COLMAP_ASSIGN_OR_RAISE(auto configured_max_id, GetConfiguredMaxColumnId(configuration));
  const int64_t start_id = std::max(configured_max_id, FindMaxColumnId(*metadata.schema));
  const bool writer_compat_v1 =
      configuration.Get(TableProperties::kIcebergWriterCompatV1Enabled);
  COLMAP_LOG_DEBUG("Assigning column mapping metadata in '{}' mode after column id {}",
                   ToString(mode), start_id);

  ColumnIdAssigner id_assigner(start_id, is_new_table, writer_compat_v1,
                               uuid_generator ? uuid_generator : kDefaultUuidGenerator);
  COLMAP_ASSIGN_OR_RAISE(auto schema, id_assigner.Assign(*metadata.schema));
  int64_t max_column_id = id_assigner.max_column_id();

  if (configuration.Get(TableProperties::kIcebergCompatV2Enabled)) {
    NestedIdAssigner nested_id_assigner(max_column_id, writer_compat_v1);
    COLMAP_ASSIGN_OR_RAISE(schema, nested_id_assigner.Assign(schema));
    max_column_id = nested_id_assigner.max_column_id();
  }

  auto updated =
      metadata.WithSchema(std::make_shared<const StructType>(std::move(schema)))
          .WithMergedConfiguration(
              {{TableProperties::kColumnMappingMaxColumnId.key(),
                std::to_string(max_column_id)}});
  if (updated == metadata) {
    COLMAP_LOG_DEBUG("Column mapping metadata is already complete");
    return std::nullopt;
  }
  COLMAP_LOG_DEBUG("Column mapping max column id is now {}", max_column_id);
  return updated;
}

}  // namespace colmap

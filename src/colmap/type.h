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

/// \file colmap/type.h
/// The schema tree.  A DataType is a primitive, a struct, an array or a map;
/// nested types hold their children as StructFields so that every position in
/// the tree carries a name, a nullability flag and field metadata.  A table
/// schema is a StructType.

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "colmap/colmap_export.h"
#include "colmap/field_metadata.h"
#include "colmap/result.h"
#include "colmap/type_fwd.h"
#include "colmap/util/formattable.h"

namespace colmap {

/// \brief A type combined with a name, a nullability flag and metadata.
class COLMAP_EXPORT StructField : public util::Formattable {
 public:
  /// \brief Construct a field.
  /// \param[in] name The field name.
  /// \param[in] type The field type, must not be null.
  /// \param[in] nullable Whether values of this field may be null.
  /// \param[in] metadata The field metadata.
  StructField(std::string name, std::shared_ptr<const DataType> type,
              bool nullable = true, FieldMetadata metadata = {});

  [[nodiscard]] const std::string& name() const { return name_; }

  [[nodiscard]] const std::shared_ptr<const DataType>& type() const { return type_; }

  [[nodiscard]] bool nullable() const { return nullable_; }

  [[nodiscard]] const FieldMetadata& metadata() const { return metadata_; }

  /// \brief Return a copy of this field with another name.
  StructField WithName(std::string name) const;

  /// \brief Return a copy of this field with another type.
  StructField WithType(std::shared_ptr<const DataType> type) const;

  /// \brief Return a copy of this field with its metadata replaced.
  StructField WithMetadata(FieldMetadata metadata) const;

  std::string ToString() const override;

  friend bool operator==(const StructField& lhs, const StructField& rhs) {
    return lhs.Equals(rhs);
  }

 private:
  bool Equals(const StructField& other) const;

  std::string name_;
  std::shared_ptr<const DataType> type_;
  bool nullable_;
  FieldMetadata metadata_;
};

/// \brief A leaf type.  Decimals additionally carry a precision and a scale.
class COLMAP_EXPORT PrimitiveType : public util::Formattable {
 public:
  constexpr static int32_t kMaxPrecision = 38;

  /// \brief Construct a non-decimal primitive type.
  explicit PrimitiveType(PrimitiveKind kind);

  /// \brief Construct a decimal type.
  static PrimitiveType Decimal(int32_t precision, int32_t scale);

  [[nodiscard]] PrimitiveKind kind() const { return kind_; }

  /// \brief The decimal precision, 0 for other kinds.
  [[nodiscard]] int32_t precision() const { return precision_; }

  /// \brief The decimal scale, 0 for other kinds.
  [[nodiscard]] int32_t scale() const { return scale_; }

  std::string ToString() const override;

  friend bool operator==(const PrimitiveType& lhs, const PrimitiveType& rhs) {
    return lhs.kind_ == rhs.kind_ && lhs.precision_ == rhs.precision_ &&
           lhs.scale_ == rhs.scale_;
  }

 private:
  PrimitiveType(PrimitiveKind kind, int32_t precision, int32_t scale);

  PrimitiveKind kind_;
  int32_t precision_ = 0;
  int32_t scale_ = 0;
};

/// \brief A type with named child fields.
class COLMAP_EXPORT StructType : public util::Formattable {
 public:
  using StructFieldConstRef = std::reference_wrapper<const StructField>;

  StructType() = default;
  explicit StructType(std::vector<StructField> fields);

  [[nodiscard]] const std::vector<StructField>& fields() const { return fields_; }

  [[nodiscard]] bool empty() const { return fields_.empty(); }

  /// \brief Get a field by name.
  ///
  /// A case-insensitive lookup fails with InvalidArgument if more than one
  /// field matches.
  ///
  /// \return the field, or std::nullopt if no field has this name.
  Result<std::optional<StructFieldConstRef>> GetFieldByName(
      std::string_view name, bool case_sensitive = true) const;

  std::string ToString() const override;

  friend bool operator==(const StructType& lhs, const StructType& rhs) {
    return lhs.fields_ == rhs.fields_;
  }

 private:
  std::vector<StructField> fields_;
};

/// \brief A variable-length sequence of elements.  The element is modeled as
/// a field named "element" whose nullability is containsNull.
class COLMAP_EXPORT ArrayType : public util::Formattable {
 public:
  constexpr static std::string_view kElementName = "element";

  explicit ArrayType(std::shared_ptr<const DataType> element_type,
                     bool contains_null = true);
  /// \brief Construct from an element field, which must be named "element".
  explicit ArrayType(StructField element);

  [[nodiscard]] const StructField& element() const { return element_; }

  [[nodiscard]] const std::shared_ptr<const DataType>& element_type() const {
    return element_.type();
  }

  [[nodiscard]] bool contains_null() const { return element_.nullable(); }

  std::string ToString() const override;

  friend bool operator==(const ArrayType& lhs, const ArrayType& rhs) {
    return lhs.element_ == rhs.element_;
  }

 private:
  StructField element_;
};

/// \brief A map from keys to values.  Keys are never null; the value field's
/// nullability is valueContainsNull.
class COLMAP_EXPORT MapType : public util::Formattable {
 public:
  constexpr static std::string_view kKeyName = "key";
  constexpr static std::string_view kValueName = "value";

  MapType(std::shared_ptr<const DataType> key_type,
          std::shared_ptr<const DataType> value_type, bool value_contains_null = true);
  /// \brief Construct from key and value fields, which must be named "key" and
  /// "value".
  MapType(StructField key, StructField value);

  [[nodiscard]] const StructField& key() const { return key_; }
  [[nodiscard]] const StructField& value() const { return value_; }

  [[nodiscard]] const std::shared_ptr<const DataType>& key_type() const {
    return key_.type();
  }
  [[nodiscard]] const std::shared_ptr<const DataType>& value_type() const {
    return value_.type();
  }

  [[nodiscard]] bool value_contains_null() const { return value_.nullable(); }

  std::string ToString() const override;

  friend bool operator==(const MapType& lhs, const MapType& rhs) {
    return lhs.key_ == rhs.key_ && lhs.value_ == rhs.value_;
  }

 private:
  StructField key_;
  StructField value_;
};

/// \brief A node of the schema tree.
class COLMAP_EXPORT DataType : public util::Formattable {
 public:
  using Variant = std::variant<PrimitiveType, StructType, ArrayType, MapType>;

  DataType(PrimitiveType type) : value_(std::move(type)) {}  // NOLINT
  DataType(StructType type) : value_(std::move(type)) {}     // NOLINT
  DataType(ArrayType type) : value_(std::move(type)) {}      // NOLINT
  DataType(MapType type) : value_(std::move(type)) {}        // NOLINT

  [[nodiscard]] const Variant& value() const { return value_; }

  [[nodiscard]] bool is_primitive() const {
    return std::holds_alternative<PrimitiveType>(value_);
  }
  [[nodiscard]] bool is_struct() const {
    return std::holds_alternative<StructType>(value_);
  }
  [[nodiscard]] bool is_array() const { return std::holds_alternative<ArrayType>(value_); }
  [[nodiscard]] bool is_map() const { return std::holds_alternative<MapType>(value_); }

  /// \brief Is this an array or a map?
  [[nodiscard]] bool is_container() const { return is_array() || is_map(); }

  /// \brief Get the alternative held by this type, or nullptr.
  template <typename T>
  [[nodiscard]] const T* As() const {
    return std::get_if<T>(&value_);
  }

  std::string ToString() const override;

  friend bool operator==(const DataType& lhs, const DataType& rhs) {
    return lhs.value_ == rhs.value_;
  }

 private:
  Variant value_;
};

/// \brief Compare two possibly null type pointers by content.
COLMAP_EXPORT bool TypeEquals(const std::shared_ptr<const DataType>& lhs,
                              const std::shared_ptr<const DataType>& rhs);

/// \defgroup type-factories Factory functions for creating data types
///
/// Factory functions for creating data types.  Primitive types are shared
/// instances.
/// @{

COLMAP_EXPORT const std::shared_ptr<const DataType>& boolean();
COLMAP_EXPORT const std::shared_ptr<const DataType>& int8();
COLMAP_EXPORT const std::shared_ptr<const DataType>& int16();
COLMAP_EXPORT const std::shared_ptr<const DataType>& int32();
COLMAP_EXPORT const std::shared_ptr<const DataType>& int64();
COLMAP_EXPORT const std::shared_ptr<const DataType>& float32();
COLMAP_EXPORT const std::shared_ptr<const DataType>& float64();
COLMAP_EXPORT const std::shared_ptr<const DataType>& string();
COLMAP_EXPORT const std::shared_ptr<const DataType>& binary();
COLMAP_EXPORT const std::shared_ptr<const DataType>& date();
COLMAP_EXPORT const std::shared_ptr<const DataType>& timestamp();
COLMAP_EXPORT const std::shared_ptr<const DataType>& timestamp_ntz();

/// \brief Create a DecimalType with the given precision and scale.
COLMAP_EXPORT std::shared_ptr<const DataType> decimal(int32_t precision, int32_t scale);

/// \brief Create a StructType with the given fields.
COLMAP_EXPORT std::shared_ptr<const DataType> struct_(std::vector<StructField> fields);

/// \brief Create an ArrayType with the given element type.
COLMAP_EXPORT std::shared_ptr<const DataType> array(
    std::shared_ptr<const DataType> element_type, bool contains_null = true);

/// \brief Create a MapType with the given key and value types.
COLMAP_EXPORT std::shared_ptr<const DataType> map(
    std::shared_ptr<const DataType> key_type, std::shared_ptr<const DataType> value_type,
    bool value_contains_null = true);

/// @}

/// \brief Get the wire name of a primitive kind, e.g. "integer".  Decimals are
/// rendered without precision and scale.
COLMAP_EXPORT std::string_view ToString(PrimitiveKind kind);

}  // namespace colmap

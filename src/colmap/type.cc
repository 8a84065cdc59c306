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

#include "colmap/type.h"

#include <format>
#include <iterator>
#include <utility>

#include "colmap/exception.h"
#include "colmap/util/formatter.h"  // IWYU pragma: keep
#include "colmap/util/string_util.h"

namespace colmap {

StructField::StructField(std::string name, std::shared_ptr<const DataType> type,
                         bool nullable, FieldMetadata metadata)
    : name_(std::move(name)),
      type_(std::move(type)),
      nullable_(nullable),
      metadata_(std::move(metadata)) {
  COLMAP_CHECK_OR_DIE(type_ != nullptr, "StructField: type of '{}' must not be null",
                      name_);
}

StructField StructField::WithName(std::string name) const {
  return {std::move(name), type_, nullable_, metadata_};
}

StructField StructField::WithType(std::shared_ptr<const DataType> type) const {
  return {name_, std::move(type), nullable_, metadata_};
}

StructField StructField::WithMetadata(FieldMetadata metadata) const {
  return {name_, type_, nullable_, std::move(metadata)};
}

std::string StructField::ToString() const {
  return std::format("{}: {}{}", name_, *type_, nullable_ ? "" : " not null");
}

bool StructField::Equals(const StructField& other) const {
  return name_ == other.name_ && nullable_ == other.nullable_ &&
         TypeEquals(type_, other.type_) && metadata_ == other.metadata_;
}

PrimitiveType::PrimitiveType(PrimitiveKind kind) : PrimitiveType(kind, 0, 0) {
  COLMAP_CHECK_OR_DIE(kind != PrimitiveKind::kDecimal,
                      "PrimitiveType: use PrimitiveType::Decimal for decimals");
}

PrimitiveType::PrimitiveType(PrimitiveKind kind, int32_t precision, int32_t scale)
    : kind_(kind), precision_(precision), scale_(scale) {}

PrimitiveType PrimitiveType::Decimal(int32_t precision, int32_t scale) {
  COLMAP_CHECK_OR_DIE(precision >= 1 && precision <= kMaxPrecision,
                      "DecimalType: precision must be in [1, 38], was {}", precision);
  COLMAP_CHECK_OR_DIE(scale >= 0 && scale <= precision,
                      "DecimalType: scale must be in [0, {}], was {}", precision, scale);
  return {PrimitiveKind::kDecimal, precision, scale};
}

std::string PrimitiveType::ToString() const {
  if (kind_ == PrimitiveKind::kDecimal) {
    return std::format("decimal({},{})", precision_, scale_);
  }
  return std::string(colmap::ToString(kind_));
}

StructType::StructType(std::vector<StructField> fields) : fields_(std::move(fields)) {}

Result<std::optional<StructType::StructFieldConstRef>> StructType::GetFieldByName(
    std::string_view name, bool case_sensitive) const {
  std::optional<StructFieldConstRef> found;
  for (const auto& field : fields_) {
    if (case_sensitive) {
      if (field.name() == name) {
        return field;
      }
      continue;
    }
    if (StringUtils::EqualsIgnoreCase(field.name(), name)) {
      if (found.has_value()) [[unlikely]] {
        return InvalidArgument("Ambiguous field name '{}': matches '{}' and '{}'", name,
                               found->get().name(), field.name());
      }
      found = field;
    }
  }
  return found;
}

std::string StructType::ToString() const {
  std::string repr = "struct<";
  for (size_t i = 0; i < fields_.size(); ++i) {
    if (i > 0) {
      repr += ", ";
    }
    std::format_to(std::back_inserter(repr), "{}", fields_[i]);
  }
  repr += ">";
  return repr;
}

ArrayType::ArrayType(std::shared_ptr<const DataType> element_type, bool contains_null)
    : element_(std::string(kElementName), std::move(element_type), contains_null) {}

ArrayType::ArrayType(StructField element) : element_(std::move(element)) {
  COLMAP_CHECK_OR_DIE(element_.name() == kElementName,
                      "ArrayType: child field name should be '{}', was '{}'",
                      kElementName, element_.name());
}

std::string ArrayType::ToString() const {
  return std::format("array<{}>", *element_.type());
}

MapType::MapType(std::shared_ptr<const DataType> key_type,
                 std::shared_ptr<const DataType> value_type, bool value_contains_null)
    : key_(std::string(kKeyName), std::move(key_type), /*nullable=*/false),
      value_(std::string(kValueName), std::move(value_type), value_contains_null) {}

MapType::MapType(StructField key, StructField value)
    : key_(std::move(key)), value_(std::move(value)) {
  COLMAP_CHECK_OR_DIE(key_.name() == kKeyName,
                      "MapType: key field name should be '{}', was '{}'", kKeyName,
                      key_.name());
  COLMAP_CHECK_OR_DIE(value_.name() == kValueName,
                      "MapType: value field name should be '{}', was '{}'", kValueName,
                      value_.name());
}

std::string MapType::ToString() const {
  return std::format("map<{}, {}>", *key_.type(), *value_.type());
}

std::string DataType::ToString() const {
  return std::visit([](const auto& type) { return type.ToString(); }, value_);
}

bool TypeEquals(const std::shared_ptr<const DataType>& lhs,
                const std::shared_ptr<const DataType>& rhs) {
  if (lhs == rhs) {
    return true;
  }
  if (lhs == nullptr || rhs == nullptr) {
    return false;
  }
  return *lhs == *rhs;
}

#define TYPE_FACTORY(NAME, KIND)                                         \
  const std::shared_ptr<const DataType>& NAME() {                        \
    static const auto kType =                                            \
        std::make_shared<const DataType>(PrimitiveType(PrimitiveKind::KIND)); \
    return kType;                                                        \
  }

TYPE_FACTORY(boolean, kBoolean)
TYPE_FACTORY(int8, kByte)
TYPE_FACTORY(int16, kShort)
TYPE_FACTORY(int32, kInteger)
TYPE_FACTORY(int64, kLong)
TYPE_FACTORY(float32, kFloat)
TYPE_FACTORY(float64, kDouble)
TYPE_FACTORY(string, kString)
TYPE_FACTORY(binary, kBinary)
TYPE_FACTORY(date, kDate)
TYPE_FACTORY(timestamp, kTimestamp)
TYPE_FACTORY(timestamp_ntz, kTimestampNtz)

#undef TYPE_FACTORY

std::shared_ptr<const DataType> decimal(int32_t precision, int32_t scale) {
  return std::make_shared<const DataType>(PrimitiveType::Decimal(precision, scale));
}

std::shared_ptr<const DataType> struct_(std::vector<StructField> fields) {
  return std::make_shared<const DataType>(StructType(std::move(fields)));
}

std::shared_ptr<const DataType> array(std::shared_ptr<const DataType> element_type,
                                      bool contains_null) {
  return std::make_shared<const DataType>(
      ArrayType(std::move(element_type), contains_null));
}

std::shared_ptr<const DataType> map(std::shared_ptr<const DataType> key_type,
                                    std::shared_ptr<const DataType> value_type,
                                    bool value_contains_null) {
  return std::make_shared<const DataType>(
      MapType(std::move(key_type), std::move(value_type), value_contains_null));
}

std::string_view ToString(PrimitiveKind kind) {
  switch (kind) {
    case PrimitiveKind::kBoolean:
      return "boolean";
    case PrimitiveKind::kByte:
      return "byte";
    case PrimitiveKind::kShort:
      return "short";
    case PrimitiveKind::kInteger:
      return "integer";
    case PrimitiveKind::kLong:
      return "long";
    case PrimitiveKind::kFloat:
      return "float";
    case PrimitiveKind::kDouble:
      return "double";
    case PrimitiveKind::kDecimal:
      return "decimal";
    case PrimitiveKind::kString:
      return "string";
    case PrimitiveKind::kBinary:
      return "binary";
    case PrimitiveKind::kDate:
      return "date";
    case PrimitiveKind::kTimestamp:
      return "timestamp";
    case PrimitiveKind::kTimestampNtz:
      return "timestamp_ntz";
  }
  std::unreachable();
}

}  // namespace colmap

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

/// \file colmap/field_metadata.h
/// Typed key/value metadata attached to every field of a schema.

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "colmap/colmap_export.h"
#include "colmap/result.h"
#include "colmap/type_fwd.h"
#include "colmap/util/formattable.h"

namespace colmap {

/// \brief A single metadata value: a string, a long, a boolean or a nested
/// metadata map.
using MetadataValue =
    std::variant<std::string, int64_t, bool, std::shared_ptr<const FieldMetadata>>;

/// \brief An immutable mapping from string keys to typed values, ordered by key.
///
/// Instances are created with FieldMetadata::Builder.  Column mapping stores the
/// column id, the physical name and the nested ids of a field here.
class COLMAP_EXPORT FieldMetadata : public util::Formattable {
 public:
  class Builder;

  using Map = std::map<std::string, MetadataValue, std::less<>>;

  FieldMetadata() = default;

  /// \brief Get a shared empty metadata instance.
  static const FieldMetadata& Empty();

  const Map& entries() const { return entries_; }

  bool empty() const { return entries_.empty(); }

  size_t size() const { return entries_.size(); }

  bool Contains(std::string_view key) const;

  /// \brief Find the raw value stored under a key.
  /// \return nullptr if the key is absent.
  const MetadataValue* Find(std::string_view key) const;

  /// \brief Get a long value.
  ///
  /// \return std::nullopt if the key is absent, or an InvalidSchema error if
  /// the key holds a value of another type.
  Result<std::optional<int64_t>> GetLong(std::string_view key) const;

  /// \brief Get a string value.  See GetLong() for the error contract.
  Result<std::optional<std::string>> GetString(std::string_view key) const;

  /// \brief Get a boolean value.  See GetLong() for the error contract.
  Result<std::optional<bool>> GetBoolean(std::string_view key) const;

  /// \brief Get a nested metadata value.  See GetLong() for the error contract.
  Result<std::shared_ptr<const FieldMetadata>> GetMetadata(std::string_view key) const;

  std::string ToString() const override;

  friend bool operator==(const FieldMetadata& lhs, const FieldMetadata& rhs) {
    return lhs.Equals(rhs);
  }

 private:
  explicit FieldMetadata(Map entries) : entries_(std::move(entries)) {}

  /// \brief Compare two metadata maps, nested values by content.
  bool Equals(const FieldMetadata& other) const;

  Map entries_;
};

/// \brief Builder for FieldMetadata.  Putting a key that already exists
/// replaces its value.
class COLMAP_EXPORT FieldMetadata::Builder {
 public:
  Builder() = default;

  /// \brief Copy all entries of `metadata` into this builder.
  Builder& FromMetadata(const FieldMetadata& metadata);

  Builder& PutString(std::string key, std::string value);
  Builder& PutLong(std::string key, int64_t value);
  Builder& PutBoolean(std::string key, bool value);
  Builder& PutMetadata(std::string key, FieldMetadata value);
  Builder& Put(std::string key, MetadataValue value);

  Builder& Remove(std::string_view key);

  FieldMetadata Build() const;

 private:
  Map entries_;
};

/// \brief Get the name of the type held by a metadata value.
COLMAP_EXPORT std::string_view MetadataValueTypeName(const MetadataValue& value);

}  // namespace colmap

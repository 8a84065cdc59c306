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

#include "colmap/field_metadata.h"

#include <format>
#include <iterator>
#include <utility>

#include "colmap/util/formatter.h"  // IWYU pragma: keep

namespace colmap {

namespace {

template <typename T>
Result<std::optional<T>> GetTyped(const FieldMetadata& metadata, std::string_view key,
                                  std::string_view expected) {
  const MetadataValue* value = metadata.Find(key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (const auto* typed = std::get_if<T>(value)) {
    return *typed;
  }
  return InvalidSchema("Field metadata '{}' holds a {} value, expected {}", key,
                       MetadataValueTypeName(*value), expected);
}

std::string FormatValue(const MetadataValue& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return std::format("\"{}\"", v);
        } else if constexpr (std::is_same_v<T, std::shared_ptr<const FieldMetadata>>) {
          return v != nullptr ? v->ToString() : "{}";
        } else {
          return std::format("{}", v);
        }
      },
      value);
}

bool ValueEquals(const MetadataValue& lhs, const MetadataValue& rhs) {
  if (lhs.index() != rhs.index()) {
    return false;
  }
  if (const auto* nested = std::get_if<std::shared_ptr<const FieldMetadata>>(&lhs)) {
    const auto& other = std::get<std::shared_ptr<const FieldMetadata>>(rhs);
    if (*nested == nullptr || other == nullptr) {
      return *nested == other;
    }
    return **nested == *other;
  }
  return lhs == rhs;
}

}  // namespace

const FieldMetadata& FieldMetadata::Empty() {
  static const FieldMetadata kEmpty;
  return kEmpty;
}

bool FieldMetadata::Contains(std::string_view key) const {
  return entries_.contains(key);
}

const MetadataValue* FieldMetadata::Find(std::string_view key) const {
  auto it = entries_.find(key);
  return it != entries_.end() ? &it->second : nullptr;
}

Result<std::optional<int64_t>> FieldMetadata::GetLong(std::string_view key) const {
  return GetTyped<int64_t>(*this, key, "long");
}

Result<std::optional<std::string>> FieldMetadata::GetString(std::string_view key) const {
  return GetTyped<std::string>(*this, key, "string");
}

Result<std::optional<bool>> FieldMetadata::GetBoolean(std::string_view key) const {
  return GetTyped<bool>(*this, key, "boolean");
}

Result<std::shared_ptr<const FieldMetadata>> FieldMetadata::GetMetadata(
    std::string_view key) const {
  auto nested = GetTyped<std::shared_ptr<const FieldMetadata>>(*this, key, "metadata");
  if (!nested) {
    return std::unexpected<Error>(nested.error());
  }
  return nested->value_or(nullptr);
}

std::string FieldMetadata::ToString() const {
  std::string repr = "{";
  bool first = true;
  for (const auto& [key, value] : entries_) {
    if (!first) {
      repr += ", ";
    }
    first = false;
    std::format_to(std::back_inserter(repr), "{}: {}", key, FormatValue(value));
  }
  repr += "}";
  return repr;
}

bool FieldMetadata::Equals(const FieldMetadata& other) const {
  if (entries_.size() != other.entries_.size()) {
    return false;
  }
  for (auto lit = entries_.begin(), rit = other.entries_.begin(); lit != entries_.end();
       ++lit, ++rit) {
    if (lit->first != rit->first || !ValueEquals(lit->second, rit->second)) {
      return false;
    }
  }
  return true;
}

FieldMetadata::Builder& FieldMetadata::Builder::FromMetadata(
    const FieldMetadata& metadata) {
  for (const auto& [key, value] : metadata.entries()) {
    entries_.insert_or_assign(key, value);
  }
  return *this;
}

FieldMetadata::Builder& FieldMetadata::Builder::PutString(std::string key,
                                                          std::string value) {
  return Put(std::move(key), MetadataValue(std::in_place_type<std::string>,
                                           std::move(value)));
}

FieldMetadata::Builder& FieldMetadata::Builder::PutLong(std::string key, int64_t value) {
  return Put(std::move(key), MetadataValue(std::in_place_type<int64_t>, value));
}

FieldMetadata::Builder& FieldMetadata::Builder::PutBoolean(std::string key, bool value) {
  return Put(std::move(key), MetadataValue(std::in_place_type<bool>, value));
}

FieldMetadata::Builder& FieldMetadata::Builder::PutMetadata(std::string key,
                                                            FieldMetadata value) {
  return Put(std::move(key),
             MetadataValue(std::in_place_type<std::shared_ptr<const FieldMetadata>>,
                           std::make_shared<const FieldMetadata>(std::move(value))));
}

FieldMetadata::Builder& FieldMetadata::Builder::Put(std::string key,
                                                    MetadataValue value) {
  entries_.insert_or_assign(std::move(key), std::move(value));
  return *this;
}

FieldMetadata::Builder& FieldMetadata::Builder::Remove(std::string_view key) {
  if (auto it = entries_.find(key); it != entries_.end()) {
    entries_.erase(it);
  }
  return *this;
}

FieldMetadata FieldMetadata::Builder::Build() const { return FieldMetadata(entries_); }

std::string_view MetadataValueTypeName(const MetadataValue& value) {
  switch (value.index()) {
    case 0:
      return "string";
    case 1:
      return "long";
    case 2:
      return "boolean";
    case 3:
      return "metadata";
  }
  std::unreachable();
}

}  // namespace colmap

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

/// \file colmap/table_properties.h
/// Table configuration entries consumed by column mapping.

#include <cstdint>
#include <string>
#include <unordered_map>

#include "colmap/colmap_export.h"
#include "colmap/util/config.h"

namespace colmap {

/// \brief Table properties relevant to column mapping.
///
/// The table configuration is a plain string to string map persisted by the
/// table-protocol layer.  This class gives typed access to the keys column
/// mapping reads and writes; every other key is carried through untouched.
class COLMAP_EXPORT TableProperties : public ConfigBase<TableProperties> {
 private:
  static bool ParseBoolean(const std::string& value);

 public:
  template <typename T>
  using Entry = const ConfigBase<TableProperties>::Entry<T>;

  /// \brief The column mapping mode, one of "none", "name" or "id".
  ///
  /// Absence of the key means "none".  The value is kept as a raw string here and
  /// parsed by GetColumnMappingMode() so that an unknown mode surfaces as an error
  /// instead of an exception.
  inline static Entry<std::string> kColumnMappingMode{"delta.columnMapping.mode",
                                                      "none"};
  /// \brief The highest column id handed out so far.
  inline static Entry<int64_t> kColumnMappingMaxColumnId{
      "delta.columnMapping.maxColumnId", int64_t{0}};
  /// \brief Emit ids for the element, key and value positions of nested
  /// containers.
  inline static Entry<bool> kIcebergCompatV2Enabled{
      "delta.enableIcebergCompatV2", false, internal::DefaultToString<bool>,
      ParseBoolean};
  /// \brief Derive physical names and nested id prefixes from field ids
  /// ("col-<id>").
  inline static Entry<bool> kIcebergWriterCompatV1Enabled{
      "delta.enableIcebergWriterCompatV1", false, internal::DefaultToString<bool>,
      ParseBoolean};

  TableProperties() = default;

  /// \brief Create a TableProperties instance from a map of key-value pairs.
  static TableProperties FromMap(
      const std::unordered_map<std::string, std::string>& properties);

  /// \brief Return a copy of this configuration with `other` merged on top.
  TableProperties Merge(
      const std::unordered_map<std::string, std::string>& other) const;
};

}  // namespace colmap

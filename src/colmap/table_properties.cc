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

#include "colmap/table_properties.h"

#include "colmap/util/string_util.h"

namespace colmap {

TableProperties TableProperties::FromMap(
    const std::unordered_map<std::string, std::string>& properties) {
  TableProperties table_properties;
  for (const auto& [key, value] : properties) {
    table_properties.configs_[key] = value;
  }
  return table_properties;
}

TableProperties TableProperties::Merge(
    const std::unordered_map<std::string, std::string>& other) const {
  TableProperties merged = *this;
  for (const auto& [key, value] : other) {
    merged.configs_.insert_or_assign(key, value);
  }
  return merged;
}

bool TableProperties::ParseBoolean(const std::string& value) {
  return StringUtils::EqualsIgnoreCase(value, "true");
}

}  // namespace colmap

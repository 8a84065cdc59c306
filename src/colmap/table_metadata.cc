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

#include "colmap/table_metadata.h"

namespace colmap {

TableMetadata TableMetadata::WithSchema(std::shared_ptr<const StructType> new_schema) const {
  return {.schema = std::move(new_schema), .configuration = configuration};
}

TableMetadata TableMetadata::WithMergedConfiguration(
    const std::unordered_map<std::string, std::string>& entries) const {
  return {.schema = schema, .configuration = configuration.Merge(entries)};
}

bool operator==(const TableMetadata& lhs, const TableMetadata& rhs) {
  if (lhs.schema != rhs.schema) {
    if (lhs.schema == nullptr || rhs.schema == nullptr || *lhs.schema != *rhs.schema) {
      return false;
    }
  }
  return lhs.configuration == rhs.configuration;
}

}  // namespace colmap

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

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include "colmap/column_mapping.h"
#include "colmap/json_internal.h"
#include "colmap/table_metadata.h"
#include "colmap/table_properties.h"

int main(int argc, char** argv) {
  if (argc != 4) {
    std::cerr << "Usage: " << argv[0] << " <schema.json> <none|name|id> <new|existing>"
              << std::endl;
    return 0;
  }

  const std::string schema_path = argv[1];
  const std::string mode = argv[2];
  const bool is_new_table = std::string(argv[3]) == "new";

  std::ifstream input(schema_path);
  if (!input) {
    std::cerr << "Failed to open " << schema_path << std::endl;
    return 1;
  }
  std::stringstream buffer;
  buffer << input.rdbuf();

  auto json_result = colmap::FromJsonString(buffer.str());
  if (!json_result.has_value()) {
    std::cerr << "Failed to read schema: " << json_result.error().message << std::endl;
    return 1;
  }
  auto schema_result = colmap::StructTypeFromJson(json_result.value());
  if (!schema_result.has_value()) {
    std::cerr << "Failed to parse schema: " << schema_result.error().message << std::endl;
    return 1;
  }

  colmap::TableMetadata metadata{
      .schema = std::make_shared<const colmap::StructType>(std::move(schema_result.value())),
      .configuration = colmap::TableProperties::FromMap(
          {{colmap::TableProperties::kColumnMappingMode.key(), mode},
           {colmap::TableProperties::kIcebergCompatV2Enabled.key(), "true"}})};

  auto update_result = colmap::UpdateColumnMappingMetadataIfNeeded(metadata, is_new_table);
  if (!update_result.has_value()) {
    std::cerr << "Failed to assign column mapping metadata: "
              << update_result.error().message << std::endl;
    return 1;
  }
  if (!update_result->has_value()) {
    std::cout << "Column mapping metadata is unchanged" << std::endl;
    return 0;
  }

  const auto& updated = update_result->value();
  auto json_string = colmap::ToJsonString(*updated.schema);
  if (!json_string.has_value()) {
    std::cerr << "Failed to serialize schema: " << json_string.error().message
              << std::endl;
    return 1;
  }
  std::cout << json_string.value() << std::endl;
  std::cout << "Max column id: "
            << updated.configuration.Get(colmap::TableProperties::kColumnMappingMaxColumnId)
            << std::endl;
  return 0;
}
